#pragma once

#include "NotificationBusTransport.hpp"
#include <QDBusConnection>
#include <QTimer>

namespace nhub {

/// NotificationBusTransport over a private, named session-bus connection.
/// Liveness is polled because QtDBus has no disconnect notification for the
/// bus itself.
class SessionBusTransport : public NotificationBusTransport {
    Q_OBJECT
public:
    static const QString NotificationsInterface;

    explicit SessionBusTransport(QObject* parent = nullptr);
    ~SessionBusTransport() override;

    bool open(QString* error) override;
    bool subscribe(QString* error) override;
    void close() override;

private slots:
    void onBusMessage(const QDBusMessage& message);
    void checkConnection();

private:
    QString connectionName_;
    QDBusConnection connection_;
    bool subscribed_ = false;
    QTimer healthTimer_;
};

} // namespace nhub
