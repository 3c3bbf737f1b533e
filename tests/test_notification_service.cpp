#include <QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <functional>
#include "core/dbus/NotificationBusSupervisor.hpp"
#include "core/notifications/HistoryStore.hpp"
#include "core/notifications/NotificationManager.hpp"
#include "core/services/NotificationService.hpp"

using nhub::NotificationBusSupervisor;
using nhub::NotificationManager;
using nhub::NotificationService;
using nhub::NotificationSignalEmitter;

class StubTransport : public nhub::NotificationBusTransport {
    Q_OBJECT
public:
    using NotificationBusTransport::NotificationBusTransport;

    bool available = true;

    bool open(QString* error) override
    {
        if (!available)
            *error = QStringLiteral("no session bus");
        return available;
    }
    bool subscribe(QString*) override { return true; }
    void close() override {}

    void deliver(const QDBusMessage& message) { emit messageReceived(message); }
};

namespace {

QDBusMessage notify(const QString& app, const QString& summary,
                    const QStringList& actions = {}, const QVariantMap& hints = {},
                    int expireTimeout = -1)
{
    QDBusMessage msg = QDBusMessage::createSignal(QStringLiteral("/org/freedesktop/Notifications"),
                                                  QStringLiteral("org.freedesktop.Notifications"),
                                                  QStringLiteral("Notify"));
    msg.setArguments({app, QVariant::fromValue(uint(0)), QString(), summary, QString(),
                      actions, hints, QVariant::fromValue(expireTimeout)});
    return msg;
}

// Sent signals as (member, first arg, second arg)
struct SentSignals {
    QList<QDBusMessage> messages;

    NotificationSignalEmitter emitter()
    {
        return NotificationSignalEmitter([this](const QDBusMessage& m) {
            messages.append(m);
            return true;
        });
    }

    bool has(const QString& member, uint id, const QVariant& second) const
    {
        for (const auto& m : messages) {
            if (m.member() == member && m.arguments().at(0).toUInt() == id
                && m.arguments().at(1) == second)
                return true;
        }
        return false;
    }
};

} // namespace

class TestNotificationService : public QObject {
    Q_OBJECT
private slots:
    void testDecodedMessageReachesManager()
    {
        NotificationManager mgr;
        SentSignals sent;
        NotificationService svc(&mgr, nullptr, sent.emitter());

        svc.handleMessage(notify("mail", "New message"));
        QCOMPARE(mgr.activeCount(), 1);
        QCOMPARE(mgr.notificationAt(0)->summary, QString("New message"));
        QVERIFY(mgr.notificationAt(0)->id != 0);
    }

    void testUndecodableMessageDropped()
    {
        NotificationManager mgr;
        SentSignals sent;
        NotificationService svc(&mgr, nullptr, sent.emitter());

        QDBusMessage bad = QDBusMessage::createSignal("/org/freedesktop/Notifications",
                                                      "org.freedesktop.Notifications", "Notify");
        bad << QStringLiteral("only one argument");
        svc.handleMessage(bad);
        svc.handleMessage(notify("mail", "still works"));

        QCOMPARE(svc.droppedMessages(), 1);
        QCOMPARE(mgr.activeCount(), 1);
    }

    void testStreamThroughSupervisor()
    {
        NotificationManager mgr;
        SentSignals sent;
        auto* transport = new StubTransport;
        NotificationBusSupervisor sup(transport);
        NotificationService svc(&mgr, &sup, sent.emitter());
        svc.start();

        transport->deliver(notify("a", "first"));
        transport->deliver(notify("b", "second"));
        QTRY_COMPARE(mgr.activeCount(), 2);
        QCOMPARE(mgr.notificationAt(0)->appName, QString("a"));
        QVERIFY(svc.intakeAvailable());
    }

    void testSweepSendsExpired()
    {
        NotificationManager mgr;
        SentSignals sent;
        NotificationService svc(&mgr, nullptr, sent.emitter());

        svc.handleMessage(notify("a", "short", {}, {}, 1000));
        svc.handleMessage(notify("b", "forever", {}, {}, -1));
        const uint32_t shortId = mgr.notificationAt(0)->id;

        QCOMPARE(svc.sweepExpired(QDateTime::currentDateTime().addSecs(10)), 1);
        QCOMPARE(mgr.activeCount(), 1);
        QVERIFY(sent.has("NotificationClosed", shortId, QVariant::fromValue(uint(1))));
    }

    void testDismissAndClose()
    {
        NotificationManager mgr;
        SentSignals sent;
        NotificationService svc(&mgr, nullptr, sent.emitter());
        svc.handleMessage(notify("a", "one"));
        svc.handleMessage(notify("a", "two"));
        const uint32_t first = mgr.notificationAt(0)->id;
        const uint32_t second = mgr.notificationAt(1)->id;

        QVERIFY(svc.dismiss(first));
        QVERIFY(svc.closeNotification(second));
        QVERIFY(!svc.dismiss(first));

        QCOMPARE(sent.messages.size(), 2);
        QVERIFY(sent.has("NotificationClosed", first, QVariant::fromValue(uint(2))));
        QVERIFY(sent.has("NotificationClosed", second, QVariant::fromValue(uint(3))));
    }

    void testInvokeAction()
    {
        NotificationManager mgr;
        SentSignals sent;
        NotificationService svc(&mgr, nullptr, sent.emitter());
        svc.handleMessage(notify("chat", "ping", {"reply", "Reply"}));
        const uint32_t id = mgr.notificationAt(0)->id;

        QVERIFY(!svc.invokeAction(id, "nope"));
        QVERIFY(sent.messages.isEmpty());

        QVERIFY(svc.invokeAction(id, "reply"));
        QVERIFY(sent.has("ActionInvoked", id, QString("reply")));
        QVERIFY(sent.has("NotificationClosed", id, QVariant::fromValue(uint(2))));
        QCOMPARE(mgr.activeCount(), 0);
    }

    void testInvokeActionKeepsResident()
    {
        NotificationManager mgr;
        SentSignals sent;
        NotificationService svc(&mgr, nullptr, sent.emitter());
        svc.handleMessage(notify("player", "Now playing", {"pause", "Pause"}, {{"resident", true}}));
        const uint32_t id = mgr.notificationAt(0)->id;

        QVERIFY(svc.invokeAction(id, "pause"));
        QCOMPARE(mgr.activeCount(), 1);
        QCOMPARE(sent.messages.size(), 1);
    }

    void testClearAll()
    {
        NotificationManager mgr;
        SentSignals sent;
        NotificationService svc(&mgr, nullptr, sent.emitter());
        for (int i = 0; i < 3; ++i)
            svc.handleMessage(notify("a", QString::number(i)));

        svc.clearAll();
        QCOMPARE(mgr.activeCount(), 0);
        QCOMPARE(sent.messages.size(), 3);
        QCOMPARE(mgr.history().size(), 3);
    }

    void testGaveUpReportsDegradedIntake()
    {
        NotificationManager mgr;
        SentSignals sent;
        auto* transport = new StubTransport;
        transport->available = false;
        NotificationBusSupervisor::Options opts;
        opts.maxAttempts = 2;
        NotificationBusSupervisor sup(transport, opts);
        std::function<void()> pending;
        sup.setScheduler([&pending](int, std::function<void()> task) { pending = std::move(task); });

        NotificationService svc(&mgr, &sup, sent.emitter());
        QSignalSpy failed(&svc, &NotificationService::intakeFailed);
        QSignalSpy availability(&svc, &NotificationService::intakeAvailableChanged);

        svc.start();
        QVERIFY(svc.intakeAvailable());
        QVERIFY(pending);
        pending();

        QVERIFY(!svc.intakeAvailable());
        QCOMPARE(failed.count(), 1);
        QCOMPARE(failed.at(0).at(0).toString(), QString("no session bus"));
        QCOMPARE(availability.count(), 1);
    }

    void testConfigChangesReachManager()
    {
        NotificationManager mgr;
        SentSignals sent;
        NotificationService svc(&mgr, nullptr, sent.emitter());

        svc.applyConfigChange("notifications.do_not_disturb", true);
        svc.applyConfigChange("notifications.min_urgency_level", 2);
        svc.applyConfigChange("history.max_items", 20);
        svc.applyConfigChange("history.retention_days", 3);
        svc.applyConfigChange("history.enabled", false);
        svc.applyConfigChange("notifications.expiry_check_interval_ms", 250);
        svc.applyConfigChange("history.save_interval_sec", 30);

        QVERIFY(mgr.doNotDisturb());
        QCOMPARE(mgr.minUrgencyLevel(), 2);
        QCOMPARE(mgr.maxHistoryItems(), 20);
        QCOMPARE(mgr.historyRetentionDays(), 3);
        QVERIFY(!mgr.historyEnabled());
        QCOMPARE(svc.expiryInterval(), 250);
        QCOMPARE(svc.saveInterval(), 30);

        svc.setAppFilters({{"spam", false}});
        QCOMPARE(mgr.appFilters().value("spam", true), false);
    }

    void testSaveHistory()
    {
        QTemporaryDir dir;
        nhub::HistoryStore store(dir.filePath("history.yaml"));
        NotificationManager mgr;
        SentSignals sent;
        NotificationService svc(&mgr, nullptr, sent.emitter());
        QVERIFY(svc.saveHistory());     // no store: nothing to do

        svc.setHistoryStore(&store);
        svc.handleMessage(notify("a", "persist me"));
        QSignalSpy saved(&svc, &NotificationService::historySaved);
        QVERIFY(svc.saveHistory());
        QCOMPARE(saved.count(), 1);

        const auto loaded = store.load();
        QCOMPARE(loaded.size(), 1);
        QCOMPARE(loaded[0].summary, QString("persist me"));
    }
};

QTEST_MAIN(TestNotificationService)
#include "test_notification_service.moc"
