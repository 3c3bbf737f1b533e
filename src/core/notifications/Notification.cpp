#include "Notification.hpp"

namespace nhub {

bool urgencyFromInt(int value, Urgency& out)
{
    switch (value) {
    case 0: out = Urgency::Low; return true;
    case 1: out = Urgency::Normal; return true;
    case 2: out = Urgency::Critical; return true;
    default: return false;
    }
}

int urgencyToInt(Urgency urgency)
{
    return static_cast<int>(urgency);
}

QString urgencyName(Urgency urgency)
{
    switch (urgency) {
    case Urgency::Low:      return QStringLiteral("low");
    case Urgency::Normal:   return QStringLiteral("normal");
    case Urgency::Critical: return QStringLiteral("critical");
    }
    return QStringLiteral("normal");
}

bool NotificationHints::operator==(const NotificationHints& other) const
{
    return urgency == other.urgency
        && category == other.category
        && category.isNull() == other.category.isNull()
        && transient == other.transient
        && resident == other.resident
        && desktopEntry == other.desktopEntry
        && imagePath == other.imagePath
        && soundFile == other.soundFile
        && soundName == other.soundName
        && suppressSound == other.suppressSound
        && actionIcons == other.actionIcons
        && hasPosition == other.hasPosition
        && (!hasPosition || position == other.position);
}

bool Notification::operator==(const Notification& other) const
{
    // rawHints excluded
    return id == other.id
        && appName == other.appName
        && replacesId == other.replacesId
        && appIcon == other.appIcon
        && summary == other.summary
        && body == other.body
        && actions == other.actions
        && hints == other.hints
        && expireTimeout == other.expireTimeout
        && timestamp == other.timestamp;
}

} // namespace nhub
