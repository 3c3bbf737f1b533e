#include <signal.h>
#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <QStandardPaths>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include "core/YamlConfig.hpp"
#include "core/dbus/NotificationBusSupervisor.hpp"
#include "core/dbus/SessionBusTransport.hpp"
#include "core/notifications/HistoryStore.hpp"
#include "core/notifications/NotificationManager.hpp"
#include "core/services/ConfigService.hpp"
#include "core/services/NotificationService.hpp"

namespace {

void applyLogLevel(const QString& level)
{
    namespace logging = boost::log;
    const std::string name = level.toStdString();
    logging::trivial::severity_level severity = logging::trivial::info;
    if (!logging::trivial::from_string(name.c_str(), name.size(), severity))
        qWarning() << "Unknown log level" << level << "- using info";
    logging::core::get()->set_filter(logging::trivial::severity >= severity);
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("NotifyHub");
    app.setApplicationVersion("0.1.0");

    const QString configDir =
        QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation) + "/notifyhub";
    const QString yamlPath = configDir + "/config.yaml";

    nhub::YamlConfig yamlConfig;
    if (QFile::exists(yamlPath)) {
        if (!yamlConfig.load(yamlPath))
            qWarning() << "Config at" << yamlPath << "is unreadable, running on defaults";
    } else {
        qInfo() << "No config at" << yamlPath << "- writing defaults";
        QString error;
        if (!yamlConfig.save(yamlPath, &error))
            qWarning() << "Could not write default config:" << error;
    }
    if (yamlConfig.sanitize() > 0)
        qInfo() << "Config values were adjusted, see warnings above";
    applyLogLevel(yamlConfig.logLevel());

    nhub::ConfigService configService(&yamlConfig, yamlPath);

    nhub::HistoryStore historyStore;
    nhub::NotificationManager manager(historyStore.load(), yamlConfig.managerSettings());

    nhub::NotificationBusSupervisor::Options busOptions;
    busOptions.bufferCapacity = yamlConfig.busBufferSize();
    busOptions.initialDelayMs = yamlConfig.busInitialBackoffMs();
    busOptions.maxDelayMs = yamlConfig.busMaxBackoffMs();
    busOptions.maxAttempts = yamlConfig.busMaxAttempts();
    nhub::NotificationBusSupervisor supervisor(new nhub::SessionBusTransport, busOptions);

    nhub::NotificationService service(&manager, &supervisor, nhub::NotificationSignalEmitter());
    service.setHistoryStore(&historyStore);
    service.setExpiryInterval(yamlConfig.expiryCheckIntervalMs());
    service.setSaveInterval(yamlConfig.historySaveIntervalSec());

    QObject::connect(&configService, &nhub::ConfigService::configChanged,
                     &service, &nhub::NotificationService::applyConfigChange);
    QObject::connect(&configService, &nhub::ConfigService::appFiltersChanged,
                     &service, [&service, &yamlConfig]() {
        service.setAppFilters(yamlConfig.appFilters());
    });

    QObject::connect(&supervisor, &nhub::NotificationBusSupervisor::stateChanged,
                     &app, [](nhub::NotificationBusSupervisor::State state) {
        qInfo() << "Bus:" << nhub::NotificationBusSupervisor::stateName(state);
    });
    QObject::connect(&service, &nhub::NotificationService::intakeFailed,
                     &app, [](const QString& reason) {
        qCritical() << "Notification intake failed permanently:" << reason;
        QCoreApplication::exit(2);
    });

    // SIGINT/SIGTERM -> leave the event loop so history gets its final save
    auto requestQuit = [](int) {
        QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit,
                                  Qt::QueuedConnection);
    };
    signal(SIGINT, requestQuit);
    signal(SIGTERM, requestQuit);

    service.start();
    int ret = app.exec();

    if (!service.saveHistory())
        qWarning() << "Final history save failed";

    qInfo() << "NotifyHub stopped with" << manager.history().size() << "history entries";
    return ret;
}
