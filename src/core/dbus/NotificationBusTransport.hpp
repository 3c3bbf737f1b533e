#pragma once

#include <QObject>
#include <QDBusMessage>
#include <QString>

namespace nhub {

/// Abstract bus connection used by NotificationBusSupervisor.
/// One open()/subscribe() cycle corresponds to one supervisor handshake;
/// close() must leave the transport ready for another open().
class NotificationBusTransport : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    virtual ~NotificationBusTransport() = default;

    /// Open the bus connection. On failure returns false and fills @p error.
    virtual bool open(QString* error) = 0;

    /// Register the match for notification signals on the open connection.
    virtual bool subscribe(QString* error) = 0;

    /// Drop the match and the connection. Safe to call when not open.
    virtual void close() = 0;

signals:
    /// One inbound signal, in bus receipt order.
    void messageReceived(const QDBusMessage& message);

    /// The connection itself is gone (not a single bad message).
    void streamFailed(const QString& reason);
};

} // namespace nhub
