#pragma once

#include "Notification.hpp"
#include <QDateTime>
#include <QList>
#include <QString>
#include <string>

namespace nhub {

/// Persistence of the notification history as a YAML record list.
///
/// Loading is fail-open: a missing, unreadable or corrupt file yields an
/// empty history and a log entry, never an error. Saving is atomic and
/// leaves the file readable by the owner only.
class HistoryStore {
public:
    /// Uses defaultPath().
    HistoryStore();
    explicit HistoryStore(const QString& filePath);

    /// $XDG_CONFIG_HOME/notifyhub/history.yaml
    static QString defaultPath();

    QString path() const { return filePath_; }

    QList<Notification> load() const;

    /// Returns false and fills @p error on I/O or serialization failure.
    bool save(const QList<Notification>& history, QString* error = nullptr) const;

    /// Drop entries older than @p retentionDays before @p now.
    /// A negative retention keeps everything. Returns the number removed.
    static int cleanupOldNotifications(QList<Notification>& history, int retentionDays,
                                       const QDateTime& now = QDateTime::currentDateTime());

    /// Drop the oldest entries until at most @p maxItems remain.
    static int enforceSizeLimit(QList<Notification>& history, int maxItems);

    /// YAML text for @p history, also used by save().
    static std::string serialize(const QList<Notification>& history);

private:
    QString filePath_;
};

} // namespace nhub
