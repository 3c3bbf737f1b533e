#include "ConfigService.hpp"
#include "core/YamlConfig.hpp"
#include <boost/log/trivial.hpp>

namespace nhub {

ConfigService::ConfigService(YamlConfig* config, const QString& configPath, QObject* parent)
    : QObject(parent), config_(config), configPath_(configPath)
{
}

QVariant ConfigService::value(const QString& key) const
{
    return config_->valueByPath(key);
}

bool ConfigService::setValue(const QString& key, const QVariant& val)
{
    const QVariant previous = config_->valueByPath(key);
    if (!config_->setValueByPath(key, val)) {
        BOOST_LOG_TRIVIAL(warning) << "[ConfigService] Rejected write to unknown key '"
                                   << key.toStdString() << "'";
        return false;
    }

    // Out-of-range writes are clamped before anyone sees them
    config_->sanitize();
    const QVariant current = config_->valueByPath(key);
    if (current != previous)
        emit configChanged(key, current);
    return true;
}

void ConfigService::setAppFilter(const QString& appName, bool allowed)
{
    config_->setAppFilter(appName, allowed);
    emit appFiltersChanged();
}

void ConfigService::removeAppFilter(const QString& appName)
{
    config_->removeAppFilter(appName);
    emit appFiltersChanged();
}

bool ConfigService::save()
{
    QString error;
    if (!config_->save(configPath_, &error)) {
        BOOST_LOG_TRIVIAL(error) << "[ConfigService] Save failed: " << error.toStdString();
        return false;
    }
    return true;
}

} // namespace nhub
