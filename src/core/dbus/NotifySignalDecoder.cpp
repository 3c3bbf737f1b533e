#include "NotifySignalDecoder.hpp"
#include <QDBusArgument>
#include <QDBusVariant>
#include <boost/log/trivial.hpp>

namespace nhub {

const QString NotifySignalDecoder::NotifyMember = QStringLiteral("Notify");

namespace {

constexpr int NOTIFY_ARG_COUNT = 8;

QVariant unwrap(const QVariant& v)
{
    if (v.userType() == qMetaTypeId<QDBusVariant>())
        return v.value<QDBusVariant>().variant();
    return v;
}

bool isDBusArgument(const QVariant& v)
{
    return v.userType() == qMetaTypeId<QDBusArgument>();
}

bool isIntegral(const QVariant& v)
{
    switch (v.typeId()) {
    case QMetaType::UChar:
    case QMetaType::Char:
    case QMetaType::SChar:
    case QMetaType::Short:
    case QMetaType::UShort:
    case QMetaType::Int:
    case QMetaType::UInt:
    case QMetaType::Long:
    case QMetaType::ULong:
    case QMetaType::LongLong:
    case QMetaType::ULongLong:
        return true;
    default:
        return false;
    }
}

bool readString(const QVariant& v, QString& out)
{
    if (v.typeId() != QMetaType::QString)
        return false;
    out = v.toString();
    return true;
}

bool readStringList(const QVariant& v, QStringList& out)
{
    if (v.typeId() == QMetaType::QStringList) {
        out = v.toStringList();
        return true;
    }
    if (isDBusArgument(v)) {
        const QDBusArgument arg = v.value<QDBusArgument>();
        if (arg.currentSignature() != QLatin1String("as"))
            return false;
        out = qdbus_cast<QStringList>(arg);
        return true;
    }
    return false;
}

bool readVariantMap(const QVariant& v, QVariantMap& out)
{
    if (v.typeId() == QMetaType::QVariantMap) {
        out = v.toMap();
        return true;
    }
    if (isDBusArgument(v)) {
        const QDBusArgument arg = v.value<QDBusArgument>();
        if (arg.currentSignature() != QLatin1String("a{sv}"))
            return false;
        out = qdbus_cast<QVariantMap>(arg);
        return true;
    }
    return false;
}

QString hintString(const QVariantMap& hints, const QString& key)
{
    auto it = hints.constFind(key);
    if (it == hints.constEnd())
        return {};
    QVariant v = unwrap(it.value());
    if (v.typeId() != QMetaType::QString)
        return {};
    QString s = v.toString();
    if (s.isNull())
        s = QLatin1String("");   // present but empty is still present
    return s;
}

bool hintBool(const QVariantMap& hints, const QString& key)
{
    auto it = hints.constFind(key);
    if (it == hints.constEnd())
        return false;
    QVariant v = unwrap(it.value());
    return v.typeId() == QMetaType::Bool && v.toBool();
}

bool hintInt(const QVariantMap& hints, const QString& key, int& out)
{
    auto it = hints.constFind(key);
    if (it == hints.constEnd())
        return false;
    QVariant v = unwrap(it.value());
    if (!isIntegral(v))
        return false;
    bool ok = false;
    int value = v.toInt(&ok);
    if (!ok)
        return false;
    out = value;
    return true;
}

Urgency hintUrgency(const QVariantMap& hints)
{
    Urgency urgency = Urgency::Normal;
    int raw = 0;
    if (hintInt(hints, QStringLiteral("urgency"), raw) && !urgencyFromInt(raw, urgency)) {
        BOOST_LOG_TRIVIAL(debug) << "[SignalDecoder] urgency " << raw
                                 << " out of range, using normal";
        urgency = Urgency::Normal;
    }
    return urgency;
}

const QStringList& recognizedHintKeys()
{
    static const QStringList keys = {
        QStringLiteral("urgency"),
        QStringLiteral("category"),
        QStringLiteral("desktop-entry"),
        QStringLiteral("transient"),
        QStringLiteral("resident"),
        QStringLiteral("x"),
        QStringLiteral("y"),
        QStringLiteral("sound-file"),
        QStringLiteral("sound-name"),
        QStringLiteral("suppress-sound"),
        QStringLiteral("action-icons"),
        QStringLiteral("image-path"),
        QStringLiteral("image_path"),
    };
    return keys;
}

DecodeResult failure(DecodeError error, const QString& detail)
{
    DecodeResult r;
    r.error = error;
    r.detail = detail;
    return r;
}

} // namespace

QString decodeErrorName(DecodeError error)
{
    switch (error) {
    case DecodeError::None:              return QStringLiteral("None");
    case DecodeError::MissingMember:     return QStringLiteral("MissingMember");
    case DecodeError::UnexpectedSignal:  return QStringLiteral("UnexpectedSignal");
    case DecodeError::DeserializeFailed: return QStringLiteral("DeserializeFailed");
    }
    return QStringLiteral("Unknown");
}

QList<NotificationAction> NotifySignalDecoder::parseActions(const QStringList& flat)
{
    QList<NotificationAction> actions;
    actions.reserve(flat.size() / 2);
    for (int i = 0; i + 1 < flat.size(); i += 2)
        actions.append({flat.at(i), flat.at(i + 1)});

    if (flat.size() % 2 != 0) {
        BOOST_LOG_TRIVIAL(warning) << "[SignalDecoder] Unpaired action key '"
                                   << flat.last().toStdString() << "' dropped";
    }
    return actions;
}

NotificationHints NotifySignalDecoder::parseHints(const QVariantMap& hints,
                                                  QVariantMap* unrecognized)
{
    NotificationHints h;
    h.urgency = hintUrgency(hints);
    h.category = hintString(hints, QStringLiteral("category"));
    h.transient = hintBool(hints, QStringLiteral("transient"));
    h.resident = hintBool(hints, QStringLiteral("resident"));
    h.desktopEntry = hintString(hints, QStringLiteral("desktop-entry"));
    h.soundFile = hintString(hints, QStringLiteral("sound-file"));
    h.soundName = hintString(hints, QStringLiteral("sound-name"));
    h.suppressSound = hintBool(hints, QStringLiteral("suppress-sound"));
    h.actionIcons = hintBool(hints, QStringLiteral("action-icons"));

    h.imagePath = hintString(hints, QStringLiteral("image-path"));
    if (h.imagePath.isNull())
        h.imagePath = hintString(hints, QStringLiteral("image_path"));

    int x = 0, y = 0;
    if (hintInt(hints, QStringLiteral("x"), x) && hintInt(hints, QStringLiteral("y"), y)) {
        h.hasPosition = true;
        h.position = QPoint(x, y);
    }

    if (unrecognized) {
        for (auto it = hints.constBegin(); it != hints.constEnd(); ++it) {
            if (!recognizedHintKeys().contains(it.key()))
                unrecognized->insert(it.key(), unwrap(it.value()));
        }
    }
    return h;
}

DecodeResult NotifySignalDecoder::decode(const QDBusMessage& message, const QDateTime& receivedAt)
{
    const QString member = message.member();
    if (member.isEmpty())
        return failure(DecodeError::MissingMember, QStringLiteral("message has no member"));
    if (member != NotifyMember)
        return failure(DecodeError::UnexpectedSignal,
                       QStringLiteral("unexpected signal '%1', expected '%2'").arg(member, NotifyMember));

    const QList<QVariant> args = message.arguments();
    if (args.size() != NOTIFY_ARG_COUNT)
        return failure(DecodeError::DeserializeFailed,
                       QStringLiteral("expected %1 arguments, got %2").arg(NOTIFY_ARG_COUNT).arg(args.size()));

    Notification n;
    QStringList actionsRaw;
    QVariantMap hintsRaw;

    if (!readString(args.at(0), n.appName))
        return failure(DecodeError::DeserializeFailed, QStringLiteral("app_name is not a string"));
    if (args.at(1).typeId() != QMetaType::UInt)
        return failure(DecodeError::DeserializeFailed, QStringLiteral("replaces_id is not uint32"));
    n.replacesId = args.at(1).toUInt();
    if (!readString(args.at(2), n.appIcon))
        return failure(DecodeError::DeserializeFailed, QStringLiteral("app_icon is not a string"));
    if (!readString(args.at(3), n.summary))
        return failure(DecodeError::DeserializeFailed, QStringLiteral("summary is not a string"));
    if (!readString(args.at(4), n.body))
        return failure(DecodeError::DeserializeFailed, QStringLiteral("body is not a string"));
    if (!readStringList(args.at(5), actionsRaw))
        return failure(DecodeError::DeserializeFailed, QStringLiteral("actions is not a string array"));
    if (!readVariantMap(args.at(6), hintsRaw))
        return failure(DecodeError::DeserializeFailed, QStringLiteral("hints is not a{sv}"));
    if (args.at(7).typeId() != QMetaType::Int)
        return failure(DecodeError::DeserializeFailed, QStringLiteral("expire_timeout is not int32"));
    n.expireTimeout = args.at(7).toInt();

    n.id = 0;
    n.actions = parseActions(actionsRaw);
    n.hints = parseHints(hintsRaw, &n.rawHints);
    n.timestamp = receivedAt;

    DecodeResult result;
    result.notification = n;
    return result;
}

} // namespace nhub
