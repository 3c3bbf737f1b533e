#include <QtTest>
#include <QFile>
#include <QTemporaryDir>
#include "core/YamlConfig.hpp"
#include "core/notifications/NotificationManager.hpp"

class TestYamlConfig : public QObject {
    Q_OBJECT
private slots:
    void testLoadDefaults();
    void testLoadFromFile();
    void testLoadCorruptFileKeepsDefaults();
    void testSaveAndReload();
    void testAppFilters();
    void testManagerSettings();
    void testSanitizeClamps();
    void testSanitizeDropsOversizedFilters();
    void testSanitizeKeepsFirstFiltersInFileOrder();
    void testSanitizeLeavesValidConfigAlone();
    void testValueByPath();
    void testValueByPathMissing();
    void testSetValueByPath();
    void testSetValueByPathRejectsUnknown();
    void testSetValueByPathRejectsIntOverflow();
    void testValueByPathTypes();
};

void TestYamlConfig::testLoadDefaults()
{
    nhub::YamlConfig config;
    QCOMPARE(config.doNotDisturb(), false);
    QCOMPARE(config.minUrgencyLevel(), 0);
    QVERIFY(config.appFilters().isEmpty());
    QCOMPARE(config.expiryCheckIntervalMs(), 1000);
    QCOMPARE(config.historyEnabled(), true);
    QCOMPARE(config.maxHistoryItems(), 100);
    QCOMPARE(config.historyRetentionDays(), -1);
    QCOMPARE(config.historySaveIntervalSec(), 60);
    QCOMPARE(config.busBufferSize(), 128);
    QCOMPARE(config.busInitialBackoffMs(), 100);
    QCOMPARE(config.busMaxBackoffMs(), 30000);
    QCOMPARE(config.busMaxAttempts(), 10);
    QCOMPARE(config.logLevel(), QString("info"));
}

void TestYamlConfig::testLoadFromFile()
{
    nhub::YamlConfig config;
    QVERIFY(config.load(QString(TEST_DATA_DIR) + "/test_config.yaml"));

    QCOMPARE(config.doNotDisturb(), true);
    QCOMPARE(config.minUrgencyLevel(), 1);
    QCOMPARE(config.maxHistoryItems(), 250);
    QCOMPARE(config.historyRetentionDays(), 30);
    QCOMPARE(config.logLevel(), QString("debug"));
    // Keys absent from the file keep their defaults
    QCOMPARE(config.historyEnabled(), true);
    QCOMPARE(config.busMaxAttempts(), 10);

    auto filters = config.appFilters();
    QCOMPARE(filters.size(), 2);
    QCOMPARE(filters.value("spotify"), false);
    QCOMPARE(filters.value("thunderbird"), true);
}

void TestYamlConfig::testLoadCorruptFileKeepsDefaults()
{
    QTemporaryDir dir;
    const QString path = dir.filePath("config.yaml");
    {
        QFile f(path);
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write("notifications: [do_not_disturb: {\n");
    }

    nhub::YamlConfig config;
    config.setMaxHistoryItems(500);
    QString error;
    QVERIFY(!config.load(path, &error));
    QVERIFY(!error.isEmpty());
    QCOMPARE(config.maxHistoryItems(), 100);
    QVERIFY(QFile::exists(path));
}

void TestYamlConfig::testSaveAndReload()
{
    QTemporaryDir dir;
    const QString path = dir.filePath("nested/config.yaml");

    nhub::YamlConfig config;
    config.setDoNotDisturb(true);
    config.setHistoryRetentionDays(14);
    config.setAppFilter("slack", false);
    QVERIFY(config.save(path));

    nhub::YamlConfig reloaded;
    QVERIFY(reloaded.load(path));
    QCOMPARE(reloaded.doNotDisturb(), true);
    QCOMPARE(reloaded.historyRetentionDays(), 14);
    QCOMPARE(reloaded.appFilters().value("slack", true), false);
}

void TestYamlConfig::testAppFilters()
{
    nhub::YamlConfig config;
    config.setAppFilter("a", true);
    config.setAppFilter("b", false);
    QCOMPARE(config.appFilters().size(), 2);

    config.removeAppFilter("a");
    QCOMPARE(config.appFilters().size(), 1);

    config.setAppFilters({{"c", true}});
    QCOMPARE(config.appFilters().size(), 1);
    QVERIFY(config.appFilters().contains("c"));
}

void TestYamlConfig::testManagerSettings()
{
    nhub::YamlConfig config;
    config.load(QString(TEST_DATA_DIR) + "/test_config.yaml");

    const nhub::ManagerSettings s = config.managerSettings();
    QCOMPARE(s.doNotDisturb, true);
    QCOMPARE(s.minUrgencyLevel, 1);
    QCOMPARE(s.maxHistoryItems, 250);
    QCOMPARE(s.historyRetentionDays, 30);
    QCOMPARE(s.appFilters.size(), 2);
}

void TestYamlConfig::testSanitizeClamps()
{
    nhub::YamlConfig config;
    QVERIFY(config.load(QString(TEST_DATA_DIR) + "/out_of_range_config.yaml"));

    QVERIFY(config.sanitize() > 0);
    QCOMPARE(config.minUrgencyLevel(), 2);
    QCOMPARE(config.expiryCheckIntervalMs(), 1000);
    QCOMPARE(config.maxHistoryItems(), 10);
    QCOMPARE(config.historyRetentionDays(), 365);
    QCOMPARE(config.busBufferSize(), 512);
    QCOMPARE(config.busMaxBackoffMs(), 500);
    QCOMPARE(config.logLevel(), QString("info"));

    // Already sane: a second pass changes nothing
    QCOMPARE(config.sanitize(), 0);
}

void TestYamlConfig::testSanitizeDropsOversizedFilters()
{
    nhub::YamlConfig config;
    QHash<QString, bool> filters;
    for (int i = 0; i < nhub::YamlConfig::MAX_APP_FILTERS + 5; ++i)
        filters.insert(QString("app-%1").arg(i), i % 2 == 0);
    filters.insert(QString(300, QChar('x')), false);
    config.setAppFilters(filters);

    QCOMPARE(config.sanitize(), 6);
    const auto kept = config.appFilters();
    QCOMPARE(kept.size(), nhub::YamlConfig::MAX_APP_FILTERS);
    QVERIFY(!kept.contains(QString(300, QChar('x'))));
}

void TestYamlConfig::testSanitizeKeepsFirstFiltersInFileOrder()
{
    QTemporaryDir dir;
    const QString path = dir.filePath("config.yaml");
    QByteArray yaml = "notifications:\n  app_filters:\n";
    for (int i = 0; i < nhub::YamlConfig::MAX_APP_FILTERS + 5; ++i)
        yaml += QString("    app-%1: true\n").arg(i, 4, 10, QChar('0')).toUtf8();
    QFile f(path);
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.write(yaml);
    f.close();

    nhub::YamlConfig config;
    QVERIFY(config.load(path));
    QCOMPARE(config.sanitize(), 5);

    const auto kept = config.appFilters();
    QCOMPARE(kept.size(), nhub::YamlConfig::MAX_APP_FILTERS);
    QVERIFY(kept.contains("app-0000"));
    QVERIFY(kept.contains("app-0999"));
    for (int i = nhub::YamlConfig::MAX_APP_FILTERS; i < nhub::YamlConfig::MAX_APP_FILTERS + 5; ++i)
        QVERIFY(!kept.contains(QString("app-%1").arg(i, 4, 10, QChar('0'))));
}

void TestYamlConfig::testSanitizeLeavesValidConfigAlone()
{
    nhub::YamlConfig config;
    QCOMPARE(config.sanitize(), 0);

    config.setHistoryRetentionDays(-5);
    QCOMPARE(config.sanitize(), 1);
    QCOMPARE(config.historyRetentionDays(), -1);
}

void TestYamlConfig::testValueByPath()
{
    nhub::YamlConfig config;
    QCOMPARE(config.valueByPath("history.max_items").toInt(), 100);
    QCOMPARE(config.valueByPath("notifications.do_not_disturb").toBool(), false);
    QCOMPARE(config.valueByPath("logging.level").toString(), QString("info"));
}

void TestYamlConfig::testValueByPathMissing()
{
    nhub::YamlConfig config;
    QVERIFY(!config.valueByPath("history.nonexistent").isValid());
    QVERIFY(!config.valueByPath("").isValid());
    // Maps are not scalars
    QVERIFY(!config.valueByPath("history").isValid());
}

void TestYamlConfig::testSetValueByPath()
{
    nhub::YamlConfig config;
    QVERIFY(config.setValueByPath("history.max_items", 42));
    QCOMPARE(config.maxHistoryItems(), 42);
    QVERIFY(config.setValueByPath("notifications.do_not_disturb", true));
    QCOMPARE(config.doNotDisturb(), true);
    QVERIFY(config.setValueByPath("logging.level", QString("warning")));
    QCOMPARE(config.logLevel(), QString("warning"));
}

void TestYamlConfig::testSetValueByPathRejectsUnknown()
{
    nhub::YamlConfig config;
    QVERIFY(!config.setValueByPath("history.bogus", 1));
    QVERIFY(!config.setValueByPath("history", 1));
    QVERIFY(!config.setValueByPath("notifications.app_filters", true));
    QVERIFY(!config.valueByPath("history.bogus").isValid());
}

void TestYamlConfig::testSetValueByPathRejectsIntOverflow()
{
    nhub::YamlConfig config;
    QVERIFY(!config.setValueByPath("history.max_items", QVariant(qlonglong(5000000000LL))));
    QCOMPARE(config.maxHistoryItems(), 100);
    QVERIFY(!config.setValueByPath("history.max_items", QVariant(uint(3000000000u))));
    QCOMPARE(config.maxHistoryItems(), 100);

    QVERIFY(config.setValueByPath("history.max_items", QVariant(qlonglong(250))));
    QCOMPARE(config.maxHistoryItems(), 250);
    QVERIFY(config.setValueByPath("history.retention_days", QVariant(qlonglong(-1))));
    QCOMPARE(config.historyRetentionDays(), -1);
}

void TestYamlConfig::testValueByPathTypes()
{
    nhub::YamlConfig config;
    QCOMPARE(config.valueByPath("history.enabled").typeId(), int(QMetaType::Bool));
    QCOMPARE(config.valueByPath("history.retention_days").typeId(), int(QMetaType::Int));
    QCOMPARE(config.valueByPath("history.retention_days").toInt(), -1);
    QCOMPARE(config.valueByPath("logging.level").typeId(), int(QMetaType::QString));
}

QTEST_MAIN(TestYamlConfig)
#include "test_yaml_config.moc"
