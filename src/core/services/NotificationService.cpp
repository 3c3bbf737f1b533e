#include "NotificationService.hpp"
#include "core/dbus/NotificationBusSupervisor.hpp"
#include "core/dbus/NotifySignalDecoder.hpp"
#include "core/notifications/HistoryStore.hpp"
#include "core/notifications/NotificationManager.hpp"
#include <boost/log/trivial.hpp>

namespace nhub {

NotificationService::NotificationService(NotificationManager* manager,
                                         NotificationBusSupervisor* supervisor,
                                         const NotificationSignalEmitter& emitter,
                                         QObject* parent)
    : QObject(parent)
    , manager_(manager)
    , supervisor_(supervisor)
    , emitter_(emitter)
{
    expiryTimer_.setInterval(DEFAULT_EXPIRY_INTERVAL_MS);
    connect(&expiryTimer_, &QTimer::timeout, this, [this]() { sweepExpired(); });

    saveTimer_.setInterval(DEFAULT_SAVE_INTERVAL_SEC * 1000);
    connect(&saveTimer_, &QTimer::timeout, this, [this]() {
        if (historyDirty_)
            saveHistory();
    });

    connect(manager_, &NotificationManager::historyChanged, this, [this]() {
        historyDirty_ = true;
    });

    if (supervisor_) {
        connect(supervisor_, &NotificationBusSupervisor::messageReceived,
                this, &NotificationService::handleMessage);
        connect(supervisor_, &NotificationBusSupervisor::gaveUp,
                this, &NotificationService::onGaveUp);
    }
}

void NotificationService::setExpiryInterval(int ms)
{
    expiryTimer_.setInterval(qMax(1, ms));
}

void NotificationService::setSaveInterval(int seconds)
{
    saveTimer_.setInterval(qMax(1, seconds) * 1000);
}

void NotificationService::start()
{
    expiryTimer_.start();
    if (store_)
        saveTimer_.start();
    if (supervisor_)
        supervisor_->start();

    BOOST_LOG_TRIVIAL(info) << "[NotificationService] Started (expiry every "
                            << expiryTimer_.interval() << "ms, save every "
                            << saveTimer_.interval() / 1000 << "s)";
}

void NotificationService::handleMessage(const QDBusMessage& message)
{
    const DecodeResult result = NotifySignalDecoder::decode(message);
    if (!result.ok()) {
        ++droppedMessages_;
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] Dropped message ("
                                   << decodeErrorName(result.error).toStdString() << "): "
                                   << result.detail.toStdString();
        return;
    }

    const AddResult added = manager_->addNotification(result.notification);
    BOOST_LOG_TRIVIAL(debug) << "[NotificationService] '"
                             << result.notification.appName.toStdString() << "': "
                             << (added == AddResult::Displayed ? "displayed" : "history only");
}

bool NotificationService::dismiss(uint32_t id)
{
    return closeWithReason(id, CloseReason::Dismissed);
}

bool NotificationService::closeNotification(uint32_t id)
{
    return closeWithReason(id, CloseReason::ClosedByRequest);
}

bool NotificationService::invokeAction(uint32_t id, const QString& actionKey)
{
    const Notification* n = manager_->findActive(id);
    if (!n) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] Action '" << actionKey.toStdString()
                                   << "' on unknown notification " << id;
        return false;
    }

    bool known = false;
    for (const auto& action : n->actions) {
        if (action.key == actionKey) {
            known = true;
            break;
        }
    }
    if (!known) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationService] Notification " << id
                                   << " has no action '" << actionKey.toStdString() << "'";
        return false;
    }

    const bool resident = n->isResident();
    emitter_.sendActionInvoked(id, actionKey);
    if (!resident)
        closeWithReason(id, CloseReason::Dismissed);
    return true;
}

void NotificationService::clearAll()
{
    QList<uint32_t> ids;
    for (const auto& n : manager_->active())
        ids.append(n.id);

    manager_->clearAll();
    for (uint32_t id : ids)
        emitter_.sendNotificationClosed(id, CloseReason::Dismissed);
}

int NotificationService::sweepExpired(const QDateTime& now)
{
    const QList<uint32_t> expired = manager_->expiredNotifications(now);
    int removed = 0;
    for (uint32_t id : expired) {
        if (closeWithReason(id, CloseReason::Expired))
            ++removed;
    }
    if (removed > 0)
        BOOST_LOG_TRIVIAL(debug) << "[NotificationService] Expired " << removed << " notification(s)";
    return removed;
}

bool NotificationService::saveHistory()
{
    if (!store_)
        return true;

    QString error;
    if (!store_->save(manager_->history(), &error))
        return false;

    historyDirty_ = false;
    emit historySaved();
    return true;
}

void NotificationService::applyConfigChange(const QString& path, const QVariant& value)
{
    if (path == QLatin1String("notifications.do_not_disturb")) {
        manager_->setDoNotDisturb(value.toBool());
    } else if (path == QLatin1String("notifications.min_urgency_level")) {
        manager_->setMinUrgencyLevel(value.toInt());
    } else if (path == QLatin1String("notifications.expiry_check_interval_ms")) {
        setExpiryInterval(value.toInt());
    } else if (path == QLatin1String("history.enabled")) {
        manager_->setHistoryEnabled(value.toBool());
    } else if (path == QLatin1String("history.max_items")) {
        manager_->setMaxHistoryItems(value.toInt());
    } else if (path == QLatin1String("history.retention_days")) {
        manager_->setHistoryRetentionDays(value.toInt());
        manager_->cleanupHistory(manager_->maxHistoryItems(), manager_->historyRetentionDays());
    } else if (path == QLatin1String("history.save_interval_sec")) {
        setSaveInterval(value.toInt());
    } else {
        // bus.* and logging.* take effect on restart
        BOOST_LOG_TRIVIAL(info) << "[NotificationService] " << path.toStdString()
                                << " changed, applies after restart";
    }
}

void NotificationService::setAppFilters(const QHash<QString, bool>& filters)
{
    manager_->loadAppFilters(filters);
    BOOST_LOG_TRIVIAL(info) << "[NotificationService] Loaded " << filters.size() << " app filter(s)";
}

void NotificationService::onGaveUp(const QString& lastError)
{
    BOOST_LOG_TRIVIAL(fatal) << "[NotificationService] Notification intake stopped: "
                             << lastError.toStdString();
    if (intakeAvailable_) {
        intakeAvailable_ = false;
        emit intakeAvailableChanged(false);
    }
    emit intakeFailed(lastError);
}

bool NotificationService::closeWithReason(uint32_t id, CloseReason reason)
{
    if (!manager_->removeNotification(id))
        return false;
    emitter_.sendNotificationClosed(id, reason);
    return true;
}

} // namespace nhub
