#include "core/YamlConfig.hpp"
#include "core/notifications/NotificationManager.hpp"
#include <QDir>
#include <QFileInfo>
#include <QStringList>
#include <fstream>
#include <limits>
#include <boost/log/trivial.hpp>

namespace nhub {

namespace {

const QStringList LOG_LEVELS = {
    QStringLiteral("trace"), QStringLiteral("debug"), QStringLiteral("info"),
    QStringLiteral("warning"), QStringLiteral("error"), QStringLiteral("fatal")
};

// Follows @p keys through nested maps. The result is undefined when a key is
// missing or a non-map is crossed on the way.
YAML::Node descend(const YAML::Node& node, const QStringList& keys, int depth = 0)
{
    if (depth == keys.size())
        return node;
    if (!node.IsMap())
        return YAML::Node(YAML::NodeType::Undefined);

    const YAML::Node child = node[keys.at(depth).toStdString()];
    if (!child.IsDefined())
        return YAML::Node(YAML::NodeType::Undefined);
    return descend(child, keys, depth + 1);
}

// Decodes a leaf with the same conversions the typed getters use.
QVariant leafValue(const YAML::Node& leaf)
{
    bool flag = false;
    if (YAML::convert<bool>::decode(leaf, flag))
        return flag;
    int number = 0;
    if (YAML::convert<int>::decode(leaf, number))
        return number;
    double real = 0.0;
    if (YAML::convert<double>::decode(leaf, real))
        return real;
    return QString::fromStdString(leaf.Scalar());
}

bool fitsInt(qlonglong v)
{
    return v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max();
}

// Clamps root[section][key] into [lo, hi]; returns 1 if it changed.
int clampInt(YAML::Node root, const char* section, const char* key, int fallback, int lo, int hi)
{
    int v = fallback;
    try {
        v = root[section][key].as<int>();
    } catch (const YAML::Exception&) {
        BOOST_LOG_TRIVIAL(warning) << "[Config] " << section << "." << key
                                   << " is not a number, using " << fallback;
        root[section][key] = fallback;
        return 1;
    }

    const int bounded = qBound(lo, v, hi);
    if (bounded == v)
        return 0;

    BOOST_LOG_TRIVIAL(warning) << "[Config] " << section << "." << key << "=" << v
                               << " outside " << lo << ".." << hi << ", using " << bounded;
    root[section][key] = bounded;
    return 1;
}

} // namespace

YamlConfig::YamlConfig()
    : root_(defaultTree())
{
}

YAML::Node YamlConfig::defaultTree()
{
    YAML::Node notifications;
    notifications["do_not_disturb"] = false;
    notifications["min_urgency_level"] = 0;
    notifications["app_filters"] = YAML::Node(YAML::NodeType::Map);
    notifications["expiry_check_interval_ms"] = 1000;

    YAML::Node history;
    history["enabled"] = true;
    history["max_items"] = NotificationManager::DEFAULT_MAX_HISTORY;
    history["retention_days"] = -1;
    history["save_interval_sec"] = 60;

    YAML::Node bus;
    bus["buffer_size"] = 128;
    bus["initial_backoff_ms"] = 100;
    bus["max_backoff_ms"] = 30000;
    bus["max_attempts"] = 10;

    YAML::Node logging;
    logging["level"] = "info";

    YAML::Node tree;
    tree["notifications"] = notifications;
    tree["history"] = history;
    tree["bus"] = bus;
    tree["logging"] = logging;
    return tree;
}

// Maps recurse, anything else in the overlay replaces the base value.
YAML::Node YamlConfig::merge(const YAML::Node& base, const YAML::Node& overlay)
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(base);
    if (!base.IsDefined() || base.IsNull() || !base.IsMap() || !overlay.IsMap())
        return YAML::Clone(overlay);

    YAML::Node result = YAML::Clone(base);
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const std::string key = it->first.as<std::string>();
        result[key] = result[key] ? merge(result[key], it->second) : YAML::Clone(it->second);
    }
    return result;
}

bool YamlConfig::load(const QString& filePath, QString* error)
{
    root_ = defaultTree();

    auto fail = [&](const QString& reason) {
        BOOST_LOG_TRIVIAL(error) << "[Config] Failed to load " << filePath.toStdString()
                                 << ": " << reason.toStdString() << " - using defaults";
        root_ = defaultTree();
        if (error)
            *error = reason;
        return false;
    };

    try {
        YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
        if (loaded.IsDefined() && !loaded.IsNull() && !loaded.IsMap())
            return fail(QStringLiteral("top level is not a mapping"));
        root_ = merge(root_, loaded);
    } catch (const YAML::Exception& e) {
        return fail(QString::fromUtf8(e.what()));
    }

    BOOST_LOG_TRIVIAL(info) << "[Config] Loaded " << filePath.toStdString();
    return true;
}

bool YamlConfig::save(const QString& filePath, QString* error) const
{
    const QString dir = QFileInfo(filePath).absolutePath();
    if (!QDir().mkpath(dir)) {
        if (error)
            *error = QStringLiteral("cannot create directory %1").arg(dir);
        BOOST_LOG_TRIVIAL(error) << "[Config] Cannot create " << dir.toStdString();
        return false;
    }

    std::ofstream fout(filePath.toStdString());
    fout << root_ << "\n";
    fout.close();
    if (!fout) {
        if (error)
            *error = QStringLiteral("write failed");
        BOOST_LOG_TRIVIAL(error) << "[Config] Failed to write " << filePath.toStdString();
        return false;
    }
    return true;
}

// --- Notifications ---

bool YamlConfig::doNotDisturb() const
{
    return root_["notifications"]["do_not_disturb"].as<bool>(false);
}

void YamlConfig::setDoNotDisturb(bool v)
{
    root_["notifications"]["do_not_disturb"] = v;
}

int YamlConfig::minUrgencyLevel() const
{
    return root_["notifications"]["min_urgency_level"].as<int>(0);
}

void YamlConfig::setMinUrgencyLevel(int v)
{
    root_["notifications"]["min_urgency_level"] = v;
}

QHash<QString, bool> YamlConfig::appFilters() const
{
    QHash<QString, bool> filters;
    const YAML::Node node = root_["notifications"]["app_filters"];
    if (!node.IsMap())
        return filters;

    for (auto it = node.begin(); it != node.end(); ++it) {
        try {
            filters.insert(QString::fromStdString(it->first.as<std::string>()),
                           it->second.as<bool>());
        } catch (const YAML::Exception&) {
            BOOST_LOG_TRIVIAL(warning) << "[Config] Ignoring app filter with non-boolean value";
        }
    }
    return filters;
}

void YamlConfig::setAppFilters(const QHash<QString, bool>& filters)
{
    YAML::Node node(YAML::NodeType::Map);
    for (auto it = filters.constBegin(); it != filters.constEnd(); ++it)
        node[it.key().toStdString()] = it.value();
    root_["notifications"]["app_filters"] = node;
}

void YamlConfig::setAppFilter(const QString& appName, bool allowed)
{
    if (!root_["notifications"]["app_filters"].IsMap())
        root_["notifications"]["app_filters"] = YAML::Node(YAML::NodeType::Map);
    root_["notifications"]["app_filters"][appName.toStdString()] = allowed;
}

void YamlConfig::removeAppFilter(const QString& appName)
{
    YAML::Node node = root_["notifications"]["app_filters"];
    if (node.IsMap())
        node.remove(appName.toStdString());
}

int YamlConfig::expiryCheckIntervalMs() const
{
    return root_["notifications"]["expiry_check_interval_ms"].as<int>(1000);
}

void YamlConfig::setExpiryCheckIntervalMs(int v)
{
    root_["notifications"]["expiry_check_interval_ms"] = v;
}

// --- History ---

bool YamlConfig::historyEnabled() const
{
    return root_["history"]["enabled"].as<bool>(true);
}

void YamlConfig::setHistoryEnabled(bool v)
{
    root_["history"]["enabled"] = v;
}

int YamlConfig::maxHistoryItems() const
{
    return root_["history"]["max_items"].as<int>(NotificationManager::DEFAULT_MAX_HISTORY);
}

void YamlConfig::setMaxHistoryItems(int v)
{
    root_["history"]["max_items"] = v;
}

int YamlConfig::historyRetentionDays() const
{
    return root_["history"]["retention_days"].as<int>(-1);
}

void YamlConfig::setHistoryRetentionDays(int v)
{
    root_["history"]["retention_days"] = v;
}

int YamlConfig::historySaveIntervalSec() const
{
    return root_["history"]["save_interval_sec"].as<int>(60);
}

void YamlConfig::setHistorySaveIntervalSec(int v)
{
    root_["history"]["save_interval_sec"] = v;
}

// --- Bus ---

int YamlConfig::busBufferSize() const
{
    return root_["bus"]["buffer_size"].as<int>(128);
}

void YamlConfig::setBusBufferSize(int v)
{
    root_["bus"]["buffer_size"] = v;
}

int YamlConfig::busInitialBackoffMs() const
{
    return root_["bus"]["initial_backoff_ms"].as<int>(100);
}

void YamlConfig::setBusInitialBackoffMs(int v)
{
    root_["bus"]["initial_backoff_ms"] = v;
}

int YamlConfig::busMaxBackoffMs() const
{
    return root_["bus"]["max_backoff_ms"].as<int>(30000);
}

void YamlConfig::setBusMaxBackoffMs(int v)
{
    root_["bus"]["max_backoff_ms"] = v;
}

int YamlConfig::busMaxAttempts() const
{
    return root_["bus"]["max_attempts"].as<int>(10);
}

void YamlConfig::setBusMaxAttempts(int v)
{
    root_["bus"]["max_attempts"] = v;
}

// --- Logging ---

QString YamlConfig::logLevel() const
{
    return QString::fromStdString(root_["logging"]["level"].as<std::string>("info"));
}

void YamlConfig::setLogLevel(const QString& v)
{
    root_["logging"]["level"] = v.toStdString();
}

ManagerSettings YamlConfig::managerSettings() const
{
    ManagerSettings s;
    s.doNotDisturb = doNotDisturb();
    s.minUrgencyLevel = minUrgencyLevel();
    s.appFilters = appFilters();
    s.maxHistoryItems = maxHistoryItems();
    s.historyRetentionDays = historyRetentionDays();
    s.historyEnabled = historyEnabled();
    return s;
}

int YamlConfig::sanitize()
{
    int fixes = 0;

    // A section replaced by a scalar or list would make every key below it unreadable
    const YAML::Node defaults = defaultTree();
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        const std::string section = it->first.as<std::string>();
        if (!root_[section].IsMap()) {
            BOOST_LOG_TRIVIAL(warning) << "[Config] Section '" << section
                                       << "' is not a mapping, using defaults";
            root_[section] = YAML::Clone(it->second);
            ++fixes;
        }
    }

    fixes += clampInt(root_, "notifications", "min_urgency_level", 0, 0, 2);
    fixes += clampInt(root_, "notifications", "expiry_check_interval_ms", 1000, 100, 60000);
    fixes += clampInt(root_, "history", "max_items", NotificationManager::DEFAULT_MAX_HISTORY, 10, 1000);
    fixes += clampInt(root_, "history", "save_interval_sec", 60, 1, 3600);
    fixes += clampInt(root_, "bus", "buffer_size", 128, 32, 512);
    fixes += clampInt(root_, "bus", "initial_backoff_ms", 100, 1, 60000);
    fixes += clampInt(root_, "bus", "max_backoff_ms", 30000, 1, 600000);
    fixes += clampInt(root_, "bus", "max_attempts", 10, 1, 100);

    // -1 keeps everything; other negatives are treated the same
    if (historyRetentionDays() < -1) {
        BOOST_LOG_TRIVIAL(warning) << "[Config] history.retention_days="
                                   << historyRetentionDays() << " invalid, using -1";
        setHistoryRetentionDays(-1);
        ++fixes;
    } else {
        fixes += clampInt(root_, "history", "retention_days", -1, -1, 365);
    }

    if (busMaxBackoffMs() < busInitialBackoffMs()) {
        BOOST_LOG_TRIVIAL(warning) << "[Config] bus.max_backoff_ms below initial_backoff_ms, raising";
        setBusMaxBackoffMs(busInitialBackoffMs());
        ++fixes;
    }

    if (!LOG_LEVELS.contains(logLevel())) {
        BOOST_LOG_TRIVIAL(warning) << "[Config] Unknown logging.level '"
                                   << logLevel().toStdString() << "', using info";
        setLogLevel(QStringLiteral("info"));
        ++fixes;
    }

    const YAML::Node filterNode = root_["notifications"]["app_filters"];
    if (filterNode.IsDefined() && !filterNode.IsNull() && !filterNode.IsMap()) {
        BOOST_LOG_TRIVIAL(warning) << "[Config] notifications.app_filters is not a mapping, clearing";
        setAppFilters({});
        ++fixes;
    }

    // The first MAX_APP_FILTERS usable entries are kept, in file order
    const YAML::Node filters = root_["notifications"]["app_filters"];
    if (filters.IsMap()) {
        YAML::Node kept(YAML::NodeType::Map);
        int dropped = 0;
        for (auto it = filters.begin(); it != filters.end(); ++it) {
            std::string name;
            bool allowed = false;
            if (!YAML::convert<std::string>::decode(it->first, name)
                || !YAML::convert<bool>::decode(it->second, allowed)) {
                BOOST_LOG_TRIVIAL(warning) << "[Config] Dropping app filter with non-boolean value";
                ++dropped;
            } else if (name.size() > static_cast<size_t>(MAX_APP_NAME_BYTES)) {
                BOOST_LOG_TRIVIAL(warning) << "[Config] Dropping app filter with name over "
                                           << MAX_APP_NAME_BYTES << " bytes";
                ++dropped;
            } else if (static_cast<int>(kept.size()) >= MAX_APP_FILTERS) {
                BOOST_LOG_TRIVIAL(warning) << "[Config] More than " << MAX_APP_FILTERS
                                           << " app filters, dropping '" << name << "'";
                ++dropped;
            } else {
                kept[name] = allowed;
            }
        }
        if (dropped > 0) {
            root_["notifications"]["app_filters"] = kept;
            fixes += dropped;
        }
    }

    return fixes;
}

// --- Generic dot-path access ---

QVariant YamlConfig::valueByPath(const QString& dottedKey) const
{
    const YAML::Node leaf = descend(root_, dottedKey.split('.'));
    if (!leaf.IsDefined() || !leaf.IsScalar())
        return {};
    return leafValue(leaf);
}

bool YamlConfig::setValueByPath(const QString& dottedKey, const QVariant& value)
{
    QStringList keys = dottedKey.split('.');
    if (!descend(defaultTree(), keys).IsScalar())
        return false;

    const std::string leaf = keys.takeLast().toStdString();
    YAML::Node section = descend(root_, keys);
    if (!section.IsMap())
        return false;

    switch (value.typeId()) {
    case QMetaType::Bool:
        section[leaf] = value.toBool();
        return true;
    case QMetaType::Int:
    case QMetaType::LongLong:
        if (!fitsInt(value.toLongLong()))
            break;
        section[leaf] = static_cast<int>(value.toLongLong());
        return true;
    case QMetaType::UInt:
    case QMetaType::ULongLong:
        if (value.toULongLong() > static_cast<qulonglong>(std::numeric_limits<int>::max()))
            break;
        section[leaf] = static_cast<int>(value.toULongLong());
        return true;
    case QMetaType::Double:
    case QMetaType::Float:
        section[leaf] = value.toDouble();
        return true;
    default:
        section[leaf] = value.toString().toStdString();
        return true;
    }

    BOOST_LOG_TRIVIAL(warning) << "[Config] " << dottedKey.toStdString() << "="
                               << value.toString().toStdString() << " does not fit an int";
    return false;
}

} // namespace nhub
