#pragma once

#include <QString>
#include <cstdint>

namespace nhub {

/// User-facing operations on received notifications.
class INotificationService {
public:
    virtual ~INotificationService() = default;

    /// User dismissed @p id. Sends NotificationClosed(Dismissed).
    /// Returns false if @p id is not active.
    virtual bool dismiss(uint32_t id) = 0;

    /// Close @p id on behalf of the application (ClosedByRequest).
    virtual bool closeNotification(uint32_t id) = 0;

    /// User picked @p actionKey on @p id. Sends ActionInvoked; a non-resident
    /// notification is then closed as Dismissed.
    virtual bool invokeAction(uint32_t id, const QString& actionKey) = 0;

    /// Dismiss every active notification.
    virtual void clearAll() = 0;

    /// False once the bus supervisor has given up.
    virtual bool intakeAvailable() const = 0;
};

} // namespace nhub
