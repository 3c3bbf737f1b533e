#pragma once

#include "Notification.hpp"
#include <QObject>
#include <QDateTime>
#include <QHash>
#include <QList>
#include <QMap>
#include <QSet>
#include <cstdint>

namespace nhub {

enum class AddResult {
    Displayed,
    AddedToHistoryOnly
};

/// Policy values consumed from configuration.
struct ManagerSettings {
    bool doNotDisturb = false;
    int minUrgencyLevel = 0;            // 0..2
    QHash<QString, bool> appFilters;    // app name -> allowed
    int maxHistoryItems = 100;
    int historyRetentionDays = -1;      // -1 = no age-based trimming
    bool historyEnabled = true;
};

/// Owns the active notifications and the history.
///
/// Single writer: every method must be called from the thread that owns the
/// manager. Nothing here locks or blocks.
///
/// Notifications are recorded to history once, when admitted by
/// addNotification(). Removal, eviction and expiry never touch history.
/// Transient notifications are never recorded. Entries displayed while
/// history was disabled are recorded by clearAll() if it is enabled by then.
class NotificationManager : public QObject {
    Q_OBJECT
public:
    static constexpr int MAX_ACTIVE = 10;
    static constexpr int DEFAULT_MAX_HISTORY = 100;
    static constexpr int DEFAULT_EXPIRE_SECONDS = 5;

    explicit NotificationManager(QObject* parent = nullptr);

    /// Seed from a previously persisted history. The history is trimmed to
    /// the settings' size and retention limits.
    NotificationManager(const QList<Notification>& history,
                        const ManagerSettings& settings,
                        QObject* parent = nullptr);

    /// Assign an id if needed, apply replacement, run the filter cascade:
    ///   urgency gate > app deny (Critical bypasses DND) > DND > app deny.
    AddResult addNotification(Notification notification);

    /// Remove an active notification. Returns false if @p id is not active.
    bool removeNotification(uint32_t id);

    /// Ids of active notifications whose timeout has elapsed at @p now.
    /// Read-only: callers remove the returned ids themselves.
    QList<uint32_t> expiredNotifications(const QDateTime& now = QDateTime::currentDateTime()) const;

    /// Empty the active set; entries that skipped history at admission are
    /// recorded first.
    void clearAll();
    void clearHistory();

    /// Apply retention and size trimming to the history. Returns entries removed.
    int cleanupHistory(int maxItems, int retentionDays,
                       const QDateTime& now = QDateTime::currentDateTime());

    // Policy
    bool doNotDisturb() const { return doNotDisturb_; }
    void setDoNotDisturb(bool enabled);
    int minUrgencyLevel() const { return minUrgencyLevel_; }
    void setMinUrgencyLevel(int level);
    const QHash<QString, bool>& appFilters() const { return appFilters_; }
    void setAppFilter(const QString& appName, bool allowed);
    void removeAppFilter(const QString& appName);
    void loadAppFilters(const QHash<QString, bool>& filters);
    int maxHistoryItems() const { return maxHistoryItems_; }
    void setMaxHistoryItems(int maxItems);
    int historyRetentionDays() const { return historyRetentionDays_; }
    void setHistoryRetentionDays(int days);
    bool historyEnabled() const { return historyEnabled_; }
    void setHistoryEnabled(bool enabled);
    ManagerSettings settings() const;

    // Queries
    const QList<Notification>& active() const { return active_; }
    const QList<Notification>& history() const { return history_; }
    int activeCount() const { return static_cast<int>(active_.size()); }
    const Notification* notificationAt(int index) const;
    const Notification* findActive(uint32_t id) const;
    QMap<QString, QList<Notification>> notificationsByApp() const;
    QList<Notification> notificationsByUrgency(Urgency urgency) const;

signals:
    void notificationAdded(uint id);
    void notificationRemoved(uint id);
    void activeChanged();
    void historyChanged();

protected:
    /// Next id the allocator tries. 0 is never handed out and maps to 1.
    void setNextId(uint32_t id) { nextId_ = id == 0 ? 1 : id; }

private:
    enum class Verdict {
        Display,
        BelowMinUrgency,
        AppDenied,
        DoNotDisturb
    };

    Verdict evaluate(const Notification& n) const;
    static const char* verdictText(Verdict verdict);
    uint32_t allocateId();
    int indexOfActive(uint32_t id) const;
    bool recordToHistory(const Notification& n);

    QList<Notification> active_;
    QList<Notification> history_;
    QSet<uint32_t> unrecorded_;         // active ids displayed with history off
    uint32_t nextId_ = 1;

    bool doNotDisturb_ = false;
    int minUrgencyLevel_ = 0;
    QHash<QString, bool> appFilters_;
    int maxHistoryItems_ = DEFAULT_MAX_HISTORY;
    int historyRetentionDays_ = -1;
    bool historyEnabled_ = true;
};

} // namespace nhub
