#include "HistoryStore.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QStandardPaths>
#include <yaml-cpp/yaml.h>
#include <boost/log/trivial.hpp>

namespace nhub {

namespace {

const QFileDevice::Permissions OWNER_ONLY = QFileDevice::ReadOwner | QFileDevice::WriteOwner;

std::string toStd(const QString& s)
{
    return s.toStdString();
}

// Optional string: an absent key stays null, a present empty one does not.
QString optionalString(const YAML::Node& node)
{
    if (!node.IsDefined() || node.IsNull())
        return {};
    QString s = QString::fromStdString(node.as<std::string>());
    if (s.isNull())
        s = QLatin1String("");
    return s;
}

void putOptional(YAML::Node& node, const char* key, const QString& value)
{
    if (!value.isNull())
        node[key] = toStd(value);
}

YAML::Node encodeHints(const NotificationHints& h)
{
    YAML::Node node(YAML::NodeType::Map);
    node["urgency"] = urgencyToInt(h.urgency);
    putOptional(node, "category", h.category);
    node["transient"] = h.transient;
    node["resident"] = h.resident;
    putOptional(node, "desktop_entry", h.desktopEntry);
    putOptional(node, "image_path", h.imagePath);
    putOptional(node, "sound_file", h.soundFile);
    putOptional(node, "sound_name", h.soundName);
    node["suppress_sound"] = h.suppressSound;
    node["action_icons"] = h.actionIcons;
    if (h.hasPosition) {
        node["x"] = h.position.x();
        node["y"] = h.position.y();
    }
    return node;
}

NotificationHints decodeHints(const YAML::Node& node)
{
    NotificationHints h;
    if (!node.IsDefined() || !node.IsMap())
        return h;

    if (!urgencyFromInt(node["urgency"].as<int>(1), h.urgency))
        h.urgency = Urgency::Normal;
    h.category = optionalString(node["category"]);
    h.transient = node["transient"].as<bool>(false);
    h.resident = node["resident"].as<bool>(false);
    h.desktopEntry = optionalString(node["desktop_entry"]);
    h.imagePath = optionalString(node["image_path"]);
    h.soundFile = optionalString(node["sound_file"]);
    h.soundName = optionalString(node["sound_name"]);
    h.suppressSound = node["suppress_sound"].as<bool>(false);
    h.actionIcons = node["action_icons"].as<bool>(false);
    if (node["x"] && node["y"]) {
        h.hasPosition = true;
        h.position = QPoint(node["x"].as<int>(), node["y"].as<int>());
    }
    return h;
}

YAML::Node encode(const Notification& n)
{
    YAML::Node node(YAML::NodeType::Map);
    node["id"] = n.id;
    node["app_name"] = toStd(n.appName);
    node["replaces_id"] = n.replacesId;
    node["app_icon"] = toStd(n.appIcon);
    node["summary"] = toStd(n.summary);
    node["body"] = toStd(n.body);

    YAML::Node actions(YAML::NodeType::Sequence);
    for (const auto& action : n.actions) {
        YAML::Node a;
        a["key"] = toStd(action.key);
        a["label"] = toStd(action.label);
        actions.push_back(a);
    }
    node["actions"] = actions;

    node["hints"] = encodeHints(n.hints);
    node["expire_timeout"] = n.expireTimeout;
    node["timestamp"] = toStd(n.timestamp.toUTC().toString(Qt::ISODateWithMs));
    return node;
}

// Returns false for records without a usable timestamp; throws YAML::Exception
// for malformed fields.
bool decode(const YAML::Node& node, Notification& n)
{
    if (!node.IsMap())
        return false;

    n.id = node["id"].as<uint32_t>(0);
    n.appName = QString::fromStdString(node["app_name"].as<std::string>(""));
    n.replacesId = node["replaces_id"].as<uint32_t>(0);
    n.appIcon = QString::fromStdString(node["app_icon"].as<std::string>(""));
    n.summary = QString::fromStdString(node["summary"].as<std::string>(""));
    n.body = QString::fromStdString(node["body"].as<std::string>(""));

    if (node["actions"] && node["actions"].IsSequence()) {
        for (const auto& a : node["actions"]) {
            if (!a.IsMap())
                throw YAML::RepresentationException(a.Mark(), "action entry is not a map");
            n.actions.append({QString::fromStdString(a["key"].as<std::string>("")),
                              QString::fromStdString(a["label"].as<std::string>(""))});
        }
    }

    n.hints = decodeHints(node["hints"]);
    n.expireTimeout = node["expire_timeout"].as<int32_t>(0);

    const QString stamp = QString::fromStdString(node["timestamp"].as<std::string>(""));
    n.timestamp = QDateTime::fromString(stamp, Qt::ISODateWithMs);
    return n.timestamp.isValid();
}

} // namespace

HistoryStore::HistoryStore()
    : filePath_(defaultPath())
{
}

HistoryStore::HistoryStore(const QString& filePath)
    : filePath_(filePath)
{
}

QString HistoryStore::defaultPath()
{
    return QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation)
           + QStringLiteral("/notifyhub/history.yaml");
}

QList<Notification> HistoryStore::load() const
{
    QList<Notification> history;

    if (!QFile::exists(filePath_)) {
        BOOST_LOG_TRIVIAL(info) << "[HistoryStore] No history at " << filePath_.toStdString()
                                << ", starting empty";
        return history;
    }

    try {
        YAML::Node root = YAML::LoadFile(filePath_.toStdString());
        if (root.IsNull())
            return history;
        if (!root.IsSequence()) {
            BOOST_LOG_TRIVIAL(warning) << "[HistoryStore] " << filePath_.toStdString()
                                       << " is not a record list, starting empty";
            return history;
        }

        int skipped = 0;
        for (const auto& entry : root) {
            Notification n;
            try {
                if (decode(entry, n)) {
                    history.append(n);
                    continue;
                }
            } catch (const YAML::Exception& e) {
                BOOST_LOG_TRIVIAL(debug) << "[HistoryStore] Bad record: " << e.what();
            }
            ++skipped;
        }
        if (skipped > 0) {
            BOOST_LOG_TRIVIAL(warning) << "[HistoryStore] Skipped " << skipped
                                       << " unreadable record(s)";
        }
    } catch (const YAML::Exception& e) {
        BOOST_LOG_TRIVIAL(warning) << "[HistoryStore] Failed to parse " << filePath_.toStdString()
                                   << ": " << e.what() << " - starting empty";
        return {};
    }

    BOOST_LOG_TRIVIAL(info) << "[HistoryStore] Loaded " << history.size()
                            << " notification(s) from " << filePath_.toStdString();
    return history;
}

std::string HistoryStore::serialize(const QList<Notification>& history)
{
    YAML::Node root(YAML::NodeType::Sequence);
    for (const auto& n : history)
        root.push_back(encode(n));

    YAML::Emitter out;
    out << root;
    return std::string(out.c_str()) + "\n";
}

bool HistoryStore::save(const QList<Notification>& history, QString* error) const
{
    auto fail = [&](const QString& reason) {
        BOOST_LOG_TRIVIAL(error) << "[HistoryStore] Save to " << filePath_.toStdString()
                                 << " failed: " << reason.toStdString();
        if (error)
            *error = reason;
        return false;
    };

    const QString dir = QFileInfo(filePath_).absolutePath();
    if (!QDir().mkpath(dir))
        return fail(QStringLiteral("cannot create directory %1").arg(dir));

    std::string text;
    try {
        text = serialize(history);
    } catch (const YAML::Exception& e) {
        return fail(QString::fromUtf8(e.what()));
    }

    QSaveFile file(filePath_);
    if (!file.open(QIODevice::WriteOnly))
        return fail(file.errorString());
    file.setPermissions(OWNER_ONLY);

    const QByteArray bytes = QByteArray::fromStdString(text);
    if (file.write(bytes) != bytes.size()) {
        file.cancelWriting();
        return fail(file.errorString());
    }
    if (!file.commit())
        return fail(file.errorString());

    if (!QFile::setPermissions(filePath_, OWNER_ONLY))
        return fail(QStringLiteral("cannot restrict permissions"));

    BOOST_LOG_TRIVIAL(debug) << "[HistoryStore] Saved " << history.size()
                             << " notification(s) to " << filePath_.toStdString();
    return true;
}

int HistoryStore::cleanupOldNotifications(QList<Notification>& history, int retentionDays,
                                          const QDateTime& now)
{
    if (retentionDays < 0)
        return 0;

    const QDateTime cutoff = now.addDays(-retentionDays);
    const auto removed = history.removeIf([&](const Notification& n) {
        return n.timestamp < cutoff;
    });

    if (removed > 0) {
        BOOST_LOG_TRIVIAL(info) << "[HistoryStore] Removed " << removed
                                << " notification(s) older than " << retentionDays << " days";
    }
    return static_cast<int>(removed);
}

int HistoryStore::enforceSizeLimit(QList<Notification>& history, int maxItems)
{
    if (maxItems < 0)
        maxItems = 0;
    if (history.size() <= maxItems)
        return 0;

    const int excess = static_cast<int>(history.size()) - maxItems;
    history.remove(0, excess);

    BOOST_LOG_TRIVIAL(debug) << "[HistoryStore] Size limit " << maxItems
                             << ": removed " << excess << " oldest";
    return excess;
}

} // namespace nhub
