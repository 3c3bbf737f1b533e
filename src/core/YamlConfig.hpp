#pragma once

#include <QHash>
#include <QString>
#include <QVariant>
#include <yaml-cpp/yaml.h>

namespace nhub {

struct ManagerSettings;

class YamlConfig {
public:
    static constexpr int MAX_APP_FILTERS = 1000;
    static constexpr int MAX_APP_NAME_BYTES = 256;

    YamlConfig();

    /// Deep-merge @p filePath over the defaults. On a parse error the
    /// defaults are kept, the file is left alone and false is returned.
    bool load(const QString& filePath, QString* error = nullptr);
    bool save(const QString& filePath, QString* error = nullptr) const;

    // Notifications
    bool doNotDisturb() const;
    void setDoNotDisturb(bool v);
    int minUrgencyLevel() const;
    void setMinUrgencyLevel(int v);
    QHash<QString, bool> appFilters() const;
    void setAppFilters(const QHash<QString, bool>& filters);
    void setAppFilter(const QString& appName, bool allowed);
    void removeAppFilter(const QString& appName);
    int expiryCheckIntervalMs() const;
    void setExpiryCheckIntervalMs(int v);

    // History
    bool historyEnabled() const;
    void setHistoryEnabled(bool v);
    int maxHistoryItems() const;
    void setMaxHistoryItems(int v);
    int historyRetentionDays() const;
    void setHistoryRetentionDays(int v);
    int historySaveIntervalSec() const;
    void setHistorySaveIntervalSec(int v);

    // Bus
    int busBufferSize() const;
    void setBusBufferSize(int v);
    int busInitialBackoffMs() const;
    void setBusInitialBackoffMs(int v);
    int busMaxBackoffMs() const;
    void setBusMaxBackoffMs(int v);
    int busMaxAttempts() const;
    void setBusMaxAttempts(int v);

    // Logging
    QString logLevel() const;
    void setLogLevel(const QString& v);

    /// Policy values for NotificationManager.
    ManagerSettings managerSettings() const;

    /// Clamp out-of-range values and drop unusable app filters.
    /// Returns the number of corrections made.
    int sanitize();

    /// Generic access by dot-path, e.g. "history.max_items".
    QVariant valueByPath(const QString& dottedKey) const;
    /// Only leaf keys present in the defaults can be written.
    bool setValueByPath(const QString& dottedKey, const QVariant& value);

private:
    static YAML::Node defaultTree();
    static YAML::Node merge(const YAML::Node& base, const YAML::Node& overlay);

    YAML::Node root_;
};

} // namespace nhub
