#pragma once

#include "core/notifications/Notification.hpp"
#include <QDBusConnection>
#include <QDBusMessage>
#include <QString>
#include <functional>

namespace nhub {

/// Fire-and-forget acknowledgement signals back to notification senders.
/// Failures are logged and reported through the return value only.
class NotificationSignalEmitter {
public:
    static const QString ObjectPath;
    static const QString Interface;

    /// Delivers a built signal. Defaults to the shared session bus.
    using Sink = std::function<bool(const QDBusMessage& message)>;

    NotificationSignalEmitter();
    explicit NotificationSignalEmitter(Sink sink);

    bool sendActionInvoked(uint32_t id, const QString& actionKey);
    bool sendNotificationClosed(uint32_t id, CloseReason reason);

    static QDBusMessage buildActionInvoked(uint32_t id, const QString& actionKey);
    static QDBusMessage buildNotificationClosed(uint32_t id, CloseReason reason);

private:
    Sink sink_;
};

} // namespace nhub
