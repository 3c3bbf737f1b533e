#include "NotificationBusSupervisor.hpp"
#include <QMetaObject>
#include <QTimer>
#include <boost/log/trivial.hpp>

namespace nhub {

NotificationBusSupervisor::NotificationBusSupervisor(NotificationBusTransport* transport,
                                                     QObject* parent)
    : NotificationBusSupervisor(transport, Options(), parent)
{
}

NotificationBusSupervisor::NotificationBusSupervisor(NotificationBusTransport* transport,
                                                     const Options& options,
                                                     QObject* parent)
    : QObject(parent)
    , transport_(transport)
    , options_(options)
{
    if (options_.bufferCapacity < 1)
        options_.bufferCapacity = 1;
    if (options_.maxAttempts < 1)
        options_.maxAttempts = 1;

    if (!transport_->parent())
        transport_->setParent(this);

    connect(transport_, &NotificationBusTransport::messageReceived,
            this, &NotificationBusSupervisor::onTransportMessage);
    connect(transport_, &NotificationBusTransport::streamFailed,
            this, &NotificationBusSupervisor::onStreamFailed);

    scheduler_ = [this](int delayMs, std::function<void()> task) {
        QTimer::singleShot(delayMs, this, std::move(task));
    };
}

void NotificationBusSupervisor::setScheduler(Scheduler scheduler)
{
    scheduler_ = std::move(scheduler);
}

void NotificationBusSupervisor::start()
{
    if (state_ != State::Disconnected)
        return;

    BOOST_LOG_TRIVIAL(info) << "[BusSupervisor] Starting (buffer=" << options_.bufferCapacity
                            << ", attempts=" << options_.maxAttempts << ")";
    attemptConnect();
}

int NotificationBusSupervisor::backoffDelay(int failedAttempts, const Options& options)
{
    if (options.initialDelayMs <= 0)
        return 0;

    qint64 delay = options.initialDelayMs;
    for (int i = 1; i < failedAttempts; ++i) {
        delay *= 2;
        if (delay >= options.maxDelayMs)
            return options.maxDelayMs;
    }
    return static_cast<int>(qMin<qint64>(delay, options.maxDelayMs));
}

QString NotificationBusSupervisor::stateName(State state)
{
    switch (state) {
    case State::Disconnected: return QStringLiteral("Disconnected");
    case State::Connecting:   return QStringLiteral("Connecting");
    case State::Subscribed:   return QStringLiteral("Subscribed");
    case State::Streaming:    return QStringLiteral("Streaming");
    case State::GaveUp:       return QStringLiteral("GaveUp");
    }
    return QStringLiteral("Unknown");
}

void NotificationBusSupervisor::setState(State state)
{
    if (state_ == state)
        return;
    BOOST_LOG_TRIVIAL(debug) << "[BusSupervisor] " << stateName(state_).toStdString()
                             << " -> " << stateName(state).toStdString();
    state_ = state;
    emit stateChanged(state_);
}

void NotificationBusSupervisor::attemptConnect()
{
    if (state_ == State::GaveUp)
        return;

    setState(State::Connecting);

    QString error;
    if (!transport_->open(&error)) {
        handleFailure(error);
        return;
    }
    if (!transport_->subscribe(&error)) {
        transport_->close();
        handleFailure(error);
        return;
    }

    setState(State::Subscribed);
    if (failedAttempts_ > 0) {
        BOOST_LOG_TRIVIAL(info) << "[BusSupervisor] Subscribed after "
                                << failedAttempts_ << " failed attempt(s)";
    }
    failedAttempts_ = 0;
    lastError_.clear();
    setState(State::Streaming);
}

void NotificationBusSupervisor::handleFailure(const QString& error)
{
    ++failedAttempts_;
    lastError_ = error;

    BOOST_LOG_TRIVIAL(warning) << "[BusSupervisor] Connection attempt " << failedAttempts_
                               << "/" << options_.maxAttempts << " failed: "
                               << error.toStdString();

    if (failedAttempts_ >= options_.maxAttempts) {
        BOOST_LOG_TRIVIAL(error) << "[BusSupervisor] Giving up after " << failedAttempts_
                                 << " attempts; notification intake stopped";
        setState(State::GaveUp);
        emit gaveUp(lastError_);
        return;
    }

    if (retryPending_)
        return;

    const int delay = backoffDelay(failedAttempts_, options_);
    retryPending_ = true;
    emit reconnectScheduled(failedAttempts_ + 1, delay);
    scheduler_(delay, [this]() {
        retryPending_ = false;
        if (state_ == State::Connecting)
            attemptConnect();
    });
}

void NotificationBusSupervisor::onTransportMessage(const QDBusMessage& message)
{
    if (state_ == State::GaveUp)
        return;

    if (buffer_.size() >= options_.bufferCapacity) {
        BOOST_LOG_TRIVIAL(debug) << "[BusSupervisor] Buffer full ("
                                 << buffer_.size() << "), delivering oldest early";
        emit messageReceived(buffer_.dequeue());
    }
    buffer_.enqueue(message);
    scheduleDrain();
}

void NotificationBusSupervisor::onStreamFailed(const QString& reason)
{
    if (state_ != State::Streaming && state_ != State::Subscribed)
        return;

    BOOST_LOG_TRIVIAL(warning) << "[BusSupervisor] Stream failed: " << reason.toStdString()
                               << " - reconnecting";
    transport_->close();
    attemptConnect();
}

void NotificationBusSupervisor::scheduleDrain()
{
    if (drainScheduled_)
        return;
    drainScheduled_ = true;
    QMetaObject::invokeMethod(this, [this]() { drainOne(); }, Qt::QueuedConnection);
}

void NotificationBusSupervisor::drainOne()
{
    drainScheduled_ = false;
    if (buffer_.isEmpty())
        return;

    emit messageReceived(buffer_.dequeue());

    if (!buffer_.isEmpty())
        scheduleDrain();
}

} // namespace nhub
