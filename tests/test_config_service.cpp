#include <QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include "core/YamlConfig.hpp"
#include "core/services/ConfigService.hpp"

class TestConfigService : public QObject {
    Q_OBJECT
private slots:
    void testReadValues();
    void testWriteEmitsChange();
    void testWriteIsClamped();
    void testUnchangedWriteIsSilent();
    void testRejectsUnknownKey();
    void testAppFilterChanges();
    void testSaveAndReload();
};

void TestConfigService::testReadValues()
{
    nhub::YamlConfig yaml;
    nhub::ConfigService svc(&yaml, "/tmp/nhub_test_cs.yaml");

    QCOMPARE(svc.value("history.max_items").toInt(), 100);
    QCOMPARE(svc.value("bus.max_attempts").toInt(), 10);
    QCOMPARE(svc.value("notifications.do_not_disturb").toBool(), false);
    QVERIFY(!svc.value("nonexistent.key").isValid());
}

void TestConfigService::testWriteEmitsChange()
{
    nhub::YamlConfig yaml;
    nhub::ConfigService svc(&yaml, "/tmp/nhub_test_cs.yaml");
    QSignalSpy spy(&svc, &nhub::ConfigService::configChanged);

    QVERIFY(svc.setValue("notifications.do_not_disturb", true));
    QCOMPARE(yaml.doNotDisturb(), true);
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toString(), QString("notifications.do_not_disturb"));
    QCOMPARE(spy.at(0).at(1).toBool(), true);
}

void TestConfigService::testWriteIsClamped()
{
    nhub::YamlConfig yaml;
    nhub::ConfigService svc(&yaml, "/tmp/nhub_test_cs.yaml");
    QSignalSpy spy(&svc, &nhub::ConfigService::configChanged);

    QVERIFY(svc.setValue("history.max_items", 5000));
    QCOMPARE(svc.value("history.max_items").toInt(), 1000);
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(1).toInt(), 1000);
}

void TestConfigService::testUnchangedWriteIsSilent()
{
    nhub::YamlConfig yaml;
    nhub::ConfigService svc(&yaml, "/tmp/nhub_test_cs.yaml");
    QSignalSpy spy(&svc, &nhub::ConfigService::configChanged);

    QVERIFY(svc.setValue("history.max_items", 100));
    QCOMPARE(spy.count(), 0);
}

void TestConfigService::testRejectsUnknownKey()
{
    nhub::YamlConfig yaml;
    nhub::ConfigService svc(&yaml, "/tmp/nhub_test_cs.yaml");
    QSignalSpy spy(&svc, &nhub::ConfigService::configChanged);

    QVERIFY(!svc.setValue("display.brightness", 50));
    QCOMPARE(spy.count(), 0);
}

void TestConfigService::testAppFilterChanges()
{
    nhub::YamlConfig yaml;
    nhub::ConfigService svc(&yaml, "/tmp/nhub_test_cs.yaml");
    QSignalSpy spy(&svc, &nhub::ConfigService::appFiltersChanged);

    svc.setAppFilter("discord", false);
    QCOMPARE(yaml.appFilters().value("discord", true), false);
    svc.removeAppFilter("discord");
    QVERIFY(yaml.appFilters().isEmpty());
    QCOMPARE(spy.count(), 2);
}

void TestConfigService::testSaveAndReload()
{
    QTemporaryDir dir;
    const QString path = dir.filePath("config.yaml");

    {
        nhub::YamlConfig yaml;
        nhub::ConfigService svc(&yaml, path);
        svc.setValue("history.retention_days", 7);
        svc.setAppFilter("zoom", false);
        QVERIFY(svc.save());
    }

    {
        nhub::YamlConfig yaml;
        QVERIFY(yaml.load(path));
        nhub::ConfigService svc(&yaml, path);
        QCOMPARE(svc.value("history.retention_days").toInt(), 7);
        QCOMPARE(yaml.appFilters().value("zoom", true), false);
    }
}

QTEST_MAIN(TestConfigService)
#include "test_config_service.moc"
