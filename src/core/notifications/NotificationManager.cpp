#include "NotificationManager.hpp"
#include "HistoryStore.hpp"
#include <limits>
#include <boost/log/trivial.hpp>

namespace nhub {

NotificationManager::NotificationManager(QObject* parent)
    : QObject(parent)
{
}

NotificationManager::NotificationManager(const QList<Notification>& history,
                                         const ManagerSettings& settings,
                                         QObject* parent)
    : QObject(parent)
    , history_(history)
    , doNotDisturb_(settings.doNotDisturb)
    , appFilters_(settings.appFilters)
    , historyRetentionDays_(settings.historyRetentionDays)
    , historyEnabled_(settings.historyEnabled)
{
    minUrgencyLevel_ = qBound(0, settings.minUrgencyLevel, 2);
    maxHistoryItems_ = qMax(0, settings.maxHistoryItems);

    // Transient entries may exist in files written by other tools
    history_.removeIf([](const Notification& n) { return n.isTransient(); });
    HistoryStore::cleanupOldNotifications(history_, historyRetentionDays_);
    HistoryStore::enforceSizeLimit(history_, maxHistoryItems_);

    BOOST_LOG_TRIVIAL(info) << "[NotificationManager] Seeded with " << history_.size()
                            << " history entries (dnd=" << doNotDisturb_
                            << ", min_urgency=" << minUrgencyLevel_
                            << ", filters=" << appFilters_.size() << ")";
}

AddResult NotificationManager::addNotification(Notification n)
{
    if (n.id == 0) {
        n.id = allocateId();
    } else if (n.id != n.replacesId && indexOfActive(n.id) >= 0) {
        const uint32_t requested = n.id;
        n.id = allocateId();
        BOOST_LOG_TRIVIAL(debug) << "[NotificationManager] Id " << requested
                                 << " already active, reassigned " << n.id;
    }

    if (!n.timestamp.isValid())
        n.timestamp = QDateTime::currentDateTime();

    if (n.expireTimeout < -1) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationManager] Invalid expire_timeout "
                                   << n.expireTimeout << " from '" << n.appName.toStdString()
                                   << "', treating as never expire";
    }

    // Replacement happens before filtering, whatever the filter outcome
    if (n.replacesId != 0) {
        const int idx = indexOfActive(n.replacesId);
        if (idx >= 0) {
            active_.removeAt(idx);
            unrecorded_.remove(n.replacesId);
            emit notificationRemoved(n.replacesId);
            emit activeChanged();
        }
    }

    const Verdict verdict = evaluate(n);
    if (verdict != Verdict::Display) {
        BOOST_LOG_TRIVIAL(debug) << "[NotificationManager] #" << n.id << " from '"
                                 << n.appName.toStdString() << "' filtered: "
                                 << verdictText(verdict);
        recordToHistory(n);
        return AddResult::AddedToHistoryOnly;
    }

    if (!recordToHistory(n) && !n.isTransient())
        unrecorded_.insert(n.id);
    active_.append(n);
    emit notificationAdded(n.id);

    while (active_.size() > MAX_ACTIVE) {
        const uint32_t evicted = active_.takeFirst().id;
        unrecorded_.remove(evicted);
        BOOST_LOG_TRIVIAL(debug) << "[NotificationManager] Active set full, evicted #" << evicted;
        emit notificationRemoved(evicted);
    }
    emit activeChanged();

    BOOST_LOG_TRIVIAL(debug) << "[NotificationManager] #" << n.id << " displayed, "
                             << urgencyName(n.urgency()).toStdString() << " ("
                             << active_.size() << " active)";
    return AddResult::Displayed;
}

bool NotificationManager::removeNotification(uint32_t id)
{
    const int idx = indexOfActive(id);
    if (idx < 0)
        return false;

    active_.removeAt(idx);
    unrecorded_.remove(id);
    emit notificationRemoved(id);
    emit activeChanged();
    return true;
}

QList<uint32_t> NotificationManager::expiredNotifications(const QDateTime& now) const
{
    QList<uint32_t> expired;
    for (const auto& n : active_) {
        if (n.isResident() || n.expireTimeout < 0)
            continue;

        const qint64 effectiveSeconds = n.expireTimeout == 0
            ? DEFAULT_EXPIRE_SECONDS
            : n.expireTimeout / 1000;
        if (n.timestamp.msecsTo(now) > effectiveSeconds * 1000)
            expired.append(n.id);
    }
    return expired;
}

void NotificationManager::clearAll()
{
    if (active_.isEmpty())
        return;

    const QList<Notification> cleared = active_;
    active_.clear();

    for (const auto& n : cleared) {
        if (unrecorded_.contains(n.id))
            recordToHistory(n);
        emit notificationRemoved(n.id);
    }
    unrecorded_.clear();
    emit activeChanged();

    BOOST_LOG_TRIVIAL(info) << "[NotificationManager] Cleared " << cleared.size()
                            << " active notification(s)";
}

void NotificationManager::clearHistory()
{
    if (history_.isEmpty())
        return;
    history_.clear();
    emit historyChanged();
}

int NotificationManager::cleanupHistory(int maxItems, int retentionDays, const QDateTime& now)
{
    int removed = HistoryStore::cleanupOldNotifications(history_, retentionDays, now);
    removed += HistoryStore::enforceSizeLimit(history_, maxItems);
    if (removed > 0)
        emit historyChanged();
    return removed;
}

void NotificationManager::setDoNotDisturb(bool enabled)
{
    if (doNotDisturb_ == enabled)
        return;
    doNotDisturb_ = enabled;
    BOOST_LOG_TRIVIAL(info) << "[NotificationManager] Do not disturb "
                            << (enabled ? "on" : "off");
}

void NotificationManager::setMinUrgencyLevel(int level)
{
    const int bounded = qBound(0, level, 2);
    if (bounded != level) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationManager] min urgency " << level
                                   << " out of range, using " << bounded;
    }
    minUrgencyLevel_ = bounded;
}

void NotificationManager::setAppFilter(const QString& appName, bool allowed)
{
    appFilters_.insert(appName, allowed);
}

void NotificationManager::removeAppFilter(const QString& appName)
{
    appFilters_.remove(appName);
}

void NotificationManager::loadAppFilters(const QHash<QString, bool>& filters)
{
    appFilters_ = filters;
}

void NotificationManager::setMaxHistoryItems(int maxItems)
{
    maxHistoryItems_ = qMax(0, maxItems);
    if (HistoryStore::enforceSizeLimit(history_, maxHistoryItems_) > 0)
        emit historyChanged();
}

void NotificationManager::setHistoryRetentionDays(int days)
{
    historyRetentionDays_ = days < 0 ? -1 : days;
}

void NotificationManager::setHistoryEnabled(bool enabled)
{
    historyEnabled_ = enabled;
}

ManagerSettings NotificationManager::settings() const
{
    ManagerSettings s;
    s.doNotDisturb = doNotDisturb_;
    s.minUrgencyLevel = minUrgencyLevel_;
    s.appFilters = appFilters_;
    s.maxHistoryItems = maxHistoryItems_;
    s.historyRetentionDays = historyRetentionDays_;
    s.historyEnabled = historyEnabled_;
    return s;
}

const Notification* NotificationManager::notificationAt(int index) const
{
    if (index < 0 || index >= active_.size())
        return nullptr;
    return &active_.at(index);
}

const Notification* NotificationManager::findActive(uint32_t id) const
{
    const int idx = indexOfActive(id);
    return idx < 0 ? nullptr : &active_.at(idx);
}

QMap<QString, QList<Notification>> NotificationManager::notificationsByApp() const
{
    QMap<QString, QList<Notification>> grouped;
    for (const auto& n : active_)
        grouped[n.appName].append(n);
    return grouped;
}

QList<Notification> NotificationManager::notificationsByUrgency(Urgency urgency) const
{
    QList<Notification> result;
    for (const auto& n : active_) {
        if (n.urgency() == urgency)
            result.append(n);
    }
    return result;
}

NotificationManager::Verdict NotificationManager::evaluate(const Notification& n) const
{
    if (urgencyToInt(n.urgency()) < minUrgencyLevel_)
        return Verdict::BelowMinUrgency;

    auto filter = appFilters_.constFind(n.appName);
    const bool denied = filter != appFilters_.constEnd() && !filter.value();

    if (n.urgency() == Urgency::Critical)
        return denied ? Verdict::AppDenied : Verdict::Display;
    if (doNotDisturb_)
        return Verdict::DoNotDisturb;
    return denied ? Verdict::AppDenied : Verdict::Display;
}

const char* NotificationManager::verdictText(Verdict verdict)
{
    switch (verdict) {
    case Verdict::Display:         return "displayed";
    case Verdict::BelowMinUrgency: return "below minimum urgency";
    case Verdict::AppDenied:       return "blocked by app filter";
    case Verdict::DoNotDisturb:    return "do not disturb";
    }
    return "unknown";
}

uint32_t NotificationManager::allocateId()
{
    // Active set is bounded, so this terminates after at most MAX_ACTIVE skips
    for (;;) {
        const uint32_t id = nextId_;
        nextId_ = nextId_ == std::numeric_limits<uint32_t>::max() ? 1 : nextId_ + 1;
        if (indexOfActive(id) < 0)
            return id;
    }
}

int NotificationManager::indexOfActive(uint32_t id) const
{
    for (int i = 0; i < active_.size(); ++i) {
        if (active_.at(i).id == id)
            return i;
    }
    return -1;
}

bool NotificationManager::recordToHistory(const Notification& n)
{
    if (!historyEnabled_ || n.isTransient())
        return false;

    history_.append(n);
    HistoryStore::enforceSizeLimit(history_, maxHistoryItems_);
    emit historyChanged();
    return true;
}

} // namespace nhub
