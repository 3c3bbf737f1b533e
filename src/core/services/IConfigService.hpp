#pragma once

#include <QString>
#include <QVariant>

namespace nhub {

class IConfigService {
public:
    virtual ~IConfigService() = default;

    /// Read a config value by dot-notation key (e.g., "history.max_items").
    /// Returns invalid QVariant if key not found.
    virtual QVariant value(const QString& key) const = 0;

    /// Write a config value. Returns false for keys outside the schema.
    /// Must be called from the main thread (single-writer rule).
    virtual bool setValue(const QString& key, const QVariant& value) = 0;

    /// Allow or deny notifications from one application.
    virtual void setAppFilter(const QString& appName, bool allowed) = 0;
    virtual void removeAppFilter(const QString& appName) = 0;

    /// Flush config to disk.
    virtual bool save() = 0;
};

} // namespace nhub
