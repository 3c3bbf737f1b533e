#pragma once

#include "INotificationService.hpp"
#include "core/dbus/NotificationSignalEmitter.hpp"
#include <QDBusMessage>
#include <QDateTime>
#include <QHash>
#include <QObject>
#include <QTimer>
#include <QVariant>

namespace nhub {

class NotificationManager;
class NotificationBusSupervisor;
class HistoryStore;

/// Consumes the supervisor's message stream and owns every call into the
/// NotificationManager. Also drives the periodic expiry sweep and history
/// saves, and maps configuration changes onto manager policy.
///
/// None of the collaborators are owned. The supervisor and history store
/// may be null (no intake, no persistence).
class NotificationService : public QObject, public INotificationService {
    Q_OBJECT
    Q_PROPERTY(bool intakeAvailable READ intakeAvailable NOTIFY intakeAvailableChanged)
public:
    static constexpr int DEFAULT_EXPIRY_INTERVAL_MS = 1000;
    static constexpr int DEFAULT_SAVE_INTERVAL_SEC = 60;

    NotificationService(NotificationManager* manager,
                        NotificationBusSupervisor* supervisor,
                        const NotificationSignalEmitter& emitter,
                        QObject* parent = nullptr);

    void setHistoryStore(HistoryStore* store) { store_ = store; }
    void setExpiryInterval(int ms);
    void setSaveInterval(int seconds);
    int expiryInterval() const { return expiryTimer_.interval(); }
    int saveInterval() const { return saveTimer_.interval() / 1000; }

    /// Start the timers and the supervisor.
    void start();

    Q_INVOKABLE bool dismiss(uint32_t id) override;
    Q_INVOKABLE bool closeNotification(uint32_t id) override;
    Q_INVOKABLE bool invokeAction(uint32_t id, const QString& actionKey) override;
    Q_INVOKABLE void clearAll() override;
    bool intakeAvailable() const override { return intakeAvailable_; }

    /// Remove every notification expired at @p now and announce each one
    /// as NotificationClosed(Expired). Returns how many were removed.
    int sweepExpired(const QDateTime& now = QDateTime::currentDateTime());

    /// Persist the manager's history. No-op success without a store.
    bool saveHistory();

    int droppedMessages() const { return droppedMessages_; }

public slots:
    void handleMessage(const QDBusMessage& message);
    void applyConfigChange(const QString& path, const QVariant& value);
    void setAppFilters(const QHash<QString, bool>& filters);

signals:
    void intakeAvailableChanged(bool available);
    void intakeFailed(const QString& reason);
    void historySaved();

private slots:
    void onGaveUp(const QString& lastError);

private:
    bool closeWithReason(uint32_t id, CloseReason reason);

    NotificationManager* manager_;
    NotificationBusSupervisor* supervisor_;
    NotificationSignalEmitter emitter_;
    HistoryStore* store_ = nullptr;

    QTimer expiryTimer_;
    QTimer saveTimer_;
    bool intakeAvailable_ = true;
    bool historyDirty_ = false;
    int droppedMessages_ = 0;
};

} // namespace nhub
