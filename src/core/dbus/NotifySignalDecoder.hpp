#pragma once

#include "core/notifications/Notification.hpp"
#include <QDBusMessage>
#include <QDateTime>
#include <QStringList>
#include <QVariantMap>

namespace nhub {

enum class DecodeError {
    None,
    MissingMember,
    UnexpectedSignal,
    DeserializeFailed
};

QString decodeErrorName(DecodeError error);

struct DecodeResult {
    Notification notification;
    DecodeError error = DecodeError::None;
    QString detail;     // human-readable reason when !ok()

    bool ok() const { return error == DecodeError::None; }
};

/// Stateless conversion of an org.freedesktop.Notifications.Notify signal
/// into a Notification. Never assigns ids: the manager owns id allocation,
/// so decoded notifications always carry id == 0.
class NotifySignalDecoder {
public:
    static const QString NotifyMember;

    /// Signature (susssasa{sv}i), fields in protocol order.
    static DecodeResult decode(const QDBusMessage& message,
                               const QDateTime& receivedAt = QDateTime::currentDateTime());

    /// Chunk a flat [key, label, key, label, ...] array into pairs.
    /// A trailing unpaired element is dropped with a warning.
    static QList<NotificationAction> parseActions(const QStringList& flat);

    /// Parse the recognized hint keys. Keys that are not understood are
    /// copied into @p unrecognized when given.
    static NotificationHints parseHints(const QVariantMap& hints,
                                        QVariantMap* unrecognized = nullptr);
};

} // namespace nhub
