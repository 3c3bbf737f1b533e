#pragma once

#include "NotificationBusTransport.hpp"
#include <QObject>
#include <QQueue>
#include <QDBusMessage>
#include <functional>

namespace nhub {

/// Keeps a live subscription to notification signals.
///
/// Explicit state machine:
///   Disconnected -> Connecting -> Subscribed -> Streaming
///   Streaming -> Connecting          (transport reported stream failure)
///   Connecting -> GaveUp             (maxAttempts consecutive failures)
///
/// Failed handshakes are retried after an exponential backoff delay
/// (initialDelayMs, doubling, capped at maxDelayMs). GaveUp is terminal:
/// messageReceived is never emitted again for fresh bus traffic and the
/// owner is told through gaveUp().
///
/// Inbound messages go through a bounded buffer and are re-emitted one per
/// event-loop turn. The buffer never drops: when it is full the oldest entry
/// is delivered synchronously to make room.
class NotificationBusSupervisor : public QObject {
    Q_OBJECT
public:
    enum class State {
        Disconnected,
        Connecting,
        Subscribed,
        Streaming,
        GaveUp
    };
    Q_ENUM(State)

    struct Options {
        int bufferCapacity = 128;   // ~20 notifications/s with 6x headroom
        int initialDelayMs = 100;
        int maxDelayMs = 30000;
        int maxAttempts = 10;
    };

    /// Runs @p task after @p delayMs. Replaceable so tests can observe and
    /// drive the backoff schedule without waiting.
    using Scheduler = std::function<void(int delayMs, std::function<void()> task)>;

    /// Takes ownership of @p transport if it has no parent.
    explicit NotificationBusSupervisor(NotificationBusTransport* transport,
                                       QObject* parent = nullptr);
    NotificationBusSupervisor(NotificationBusTransport* transport,
                              const Options& options,
                              QObject* parent = nullptr);

    void setScheduler(Scheduler scheduler);

    /// Begin the first handshake. No-op unless Disconnected.
    void start();

    State state() const { return state_; }
    int failedAttempts() const { return failedAttempts_; }
    int bufferedCount() const { return buffer_.size(); }
    QString lastError() const { return lastError_; }
    const Options& options() const { return options_; }

    /// Delay before the retry that follows the @p failedAttempts-th
    /// consecutive failure (1-based).
    static int backoffDelay(int failedAttempts, const Options& options);

    static QString stateName(State state);

signals:
    void stateChanged(nhub::NotificationBusSupervisor::State state);
    void messageReceived(const QDBusMessage& message);
    void reconnectScheduled(int attempt, int delayMs);
    void gaveUp(const QString& lastError);

private slots:
    void onTransportMessage(const QDBusMessage& message);
    void onStreamFailed(const QString& reason);

private:
    void setState(State state);
    void attemptConnect();
    void handleFailure(const QString& error);
    void scheduleDrain();
    void drainOne();

    NotificationBusTransport* transport_;
    Options options_;
    Scheduler scheduler_;
    State state_ = State::Disconnected;
    int failedAttempts_ = 0;
    bool retryPending_ = false;
    QString lastError_;

    QQueue<QDBusMessage> buffer_;
    bool drainScheduled_ = false;
};

} // namespace nhub
