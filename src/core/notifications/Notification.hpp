#pragma once

#include <QDateTime>
#include <QList>
#include <QMetaType>
#include <QPoint>
#include <QString>
#include <QVariantMap>
#include <cstdint>

namespace nhub {

enum class Urgency : uint8_t {
    Low = 0,
    Normal = 1,
    Critical = 2
};

/// Returns false (leaving @p out untouched) for values outside 0..2.
bool urgencyFromInt(int value, Urgency& out);
int urgencyToInt(Urgency urgency);
QString urgencyName(Urgency urgency);

/// Reason codes carried by the NotificationClosed signal.
enum class CloseReason : uint32_t {
    Expired = 1,
    Dismissed = 2,
    ClosedByRequest = 3,
    Undefined = 4
};

struct NotificationAction {
    QString key;
    QString label;

    bool operator==(const NotificationAction& other) const
    {
        return key == other.key && label == other.label;
    }
    bool operator!=(const NotificationAction& other) const { return !(*this == other); }
};

/// Standard freedesktop.org hints. A null QString means the hint was absent.
struct NotificationHints {
    Urgency urgency = Urgency::Normal;
    QString category;
    bool transient = false;
    bool resident = false;

    // Presentation-only
    QString desktopEntry;
    QString imagePath;
    QString soundFile;
    QString soundName;
    bool suppressSound = false;
    bool actionIcons = false;
    bool hasPosition = false;
    QPoint position;

    bool operator==(const NotificationHints& other) const;
    bool operator!=(const NotificationHints& other) const { return !(*this == other); }
};

struct Notification {
    uint32_t id = 0;            // 0 until the manager assigns one
    QString appName;
    uint32_t replacesId = 0;    // 0 = new notification
    QString appIcon;
    QString summary;
    QString body;
    QList<NotificationAction> actions;
    NotificationHints hints;
    QVariantMap rawHints;       // unrecognized hints; never compared or persisted
    int32_t expireTimeout = 0;  // -1 = never, 0 = manager default, >0 = ms
    QDateTime timestamp;

    Urgency urgency() const { return hints.urgency; }
    bool isTransient() const { return hints.transient; }
    bool isResident() const { return hints.resident; }
    QString category() const { return hints.category; }
    bool hasActions() const { return !actions.isEmpty(); }

    bool operator==(const Notification& other) const;
    bool operator!=(const Notification& other) const { return !(*this == other); }
};

} // namespace nhub

Q_DECLARE_METATYPE(nhub::Notification)
