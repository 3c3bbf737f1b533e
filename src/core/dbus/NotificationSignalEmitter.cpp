#include "NotificationSignalEmitter.hpp"
#include <QDBusError>
#include <boost/log/trivial.hpp>

namespace nhub {

const QString NotificationSignalEmitter::ObjectPath =
    QStringLiteral("/org/freedesktop/Notifications");
const QString NotificationSignalEmitter::Interface =
    QStringLiteral("org.freedesktop.Notifications");

NotificationSignalEmitter::NotificationSignalEmitter()
    : sink_([](const QDBusMessage& message) {
        QDBusConnection bus = QDBusConnection::sessionBus();
        if (!bus.isConnected()) {
            BOOST_LOG_TRIVIAL(warning) << "[SignalEmitter] Session bus not connected: "
                                       << bus.lastError().message().toStdString();
            return false;
        }
        return bus.send(message);
    })
{
}

NotificationSignalEmitter::NotificationSignalEmitter(Sink sink)
    : sink_(std::move(sink))
{
}

QDBusMessage NotificationSignalEmitter::buildActionInvoked(uint32_t id, const QString& actionKey)
{
    QDBusMessage msg = QDBusMessage::createSignal(ObjectPath, Interface,
                                                  QStringLiteral("ActionInvoked"));
    msg << static_cast<uint>(id) << actionKey;
    return msg;
}

QDBusMessage NotificationSignalEmitter::buildNotificationClosed(uint32_t id, CloseReason reason)
{
    QDBusMessage msg = QDBusMessage::createSignal(ObjectPath, Interface,
                                                  QStringLiteral("NotificationClosed"));
    msg << static_cast<uint>(id) << static_cast<uint>(reason);
    return msg;
}

bool NotificationSignalEmitter::sendActionInvoked(uint32_t id, const QString& actionKey)
{
    BOOST_LOG_TRIVIAL(info) << "[SignalEmitter] ActionInvoked id=" << id
                            << " action=" << actionKey.toStdString();
    if (!sink_(buildActionInvoked(id, actionKey))) {
        BOOST_LOG_TRIVIAL(warning) << "[SignalEmitter] Failed to send ActionInvoked for " << id;
        return false;
    }
    return true;
}

bool NotificationSignalEmitter::sendNotificationClosed(uint32_t id, CloseReason reason)
{
    BOOST_LOG_TRIVIAL(debug) << "[SignalEmitter] NotificationClosed id=" << id
                             << " reason=" << static_cast<uint32_t>(reason);
    if (!sink_(buildNotificationClosed(id, reason))) {
        BOOST_LOG_TRIVIAL(warning) << "[SignalEmitter] Failed to send NotificationClosed for " << id;
        return false;
    }
    return true;
}

} // namespace nhub
