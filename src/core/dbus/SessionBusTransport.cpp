#include "SessionBusTransport.hpp"
#include "NotifySignalDecoder.hpp"
#include <QDBusError>
#include <boost/log/trivial.hpp>

namespace nhub {

const QString SessionBusTransport::NotificationsInterface =
    QStringLiteral("org.freedesktop.Notifications");

SessionBusTransport::SessionBusTransport(QObject* parent)
    : NotificationBusTransport(parent)
    , connectionName_(QStringLiteral("nhub-notification-listener"))
    , connection_(QString())
{
    healthTimer_.setInterval(2000);
    connect(&healthTimer_, &QTimer::timeout, this, &SessionBusTransport::checkConnection);
}

SessionBusTransport::~SessionBusTransport()
{
    close();
}

bool SessionBusTransport::open(QString* error)
{
    close();

    connection_ = QDBusConnection::connectToBus(QDBusConnection::SessionBus, connectionName_);
    if (!connection_.isConnected()) {
        if (error)
            *error = connection_.lastError().isValid()
                ? connection_.lastError().message()
                : QStringLiteral("session bus unavailable");
        QDBusConnection::disconnectFromBus(connectionName_);
        connection_ = QDBusConnection(QString());
        return false;
    }

    BOOST_LOG_TRIVIAL(info) << "[SessionBus] Connected as "
                            << connection_.baseService().toStdString();
    return true;
}

bool SessionBusTransport::subscribe(QString* error)
{
    if (!connection_.isConnected()) {
        if (error)
            *error = QStringLiteral("not connected");
        return false;
    }

    // Empty service and path: accept the signal from any sender on any object
    bool ok = connection_.connect(QString(), QString(), NotificationsInterface,
                                  NotifySignalDecoder::NotifyMember,
                                  this, SLOT(onBusMessage(QDBusMessage)));
    if (!ok) {
        if (error)
            *error = connection_.lastError().isValid()
                ? connection_.lastError().message()
                : QStringLiteral("match rule rejected");
        return false;
    }

    subscribed_ = true;
    healthTimer_.start();
    BOOST_LOG_TRIVIAL(info) << "[SessionBus] Subscribed to "
                            << NotificationsInterface.toStdString() << " signals";
    return true;
}

void SessionBusTransport::close()
{
    healthTimer_.stop();

    if (subscribed_) {
        connection_.disconnect(QString(), QString(), NotificationsInterface,
                               NotifySignalDecoder::NotifyMember,
                               this, SLOT(onBusMessage(QDBusMessage)));
        subscribed_ = false;
    }

    if (!connection_.name().isEmpty()) {
        QDBusConnection::disconnectFromBus(connectionName_);
        connection_ = QDBusConnection(QString());
    }
}

void SessionBusTransport::onBusMessage(const QDBusMessage& message)
{
    emit messageReceived(message);
}

void SessionBusTransport::checkConnection()
{
    if (connection_.isConnected())
        return;

    healthTimer_.stop();
    BOOST_LOG_TRIVIAL(warning) << "[SessionBus] Connection lost";
    emit streamFailed(QStringLiteral("session bus connection lost"));
}

} // namespace nhub
