#include "NotificationModel.hpp"
#include "core/notifications/NotificationManager.hpp"
#include <QVariantList>
#include <QVariantMap>

namespace nhub {

NotificationModel::NotificationModel(NotificationManager* manager, QObject* parent)
    : QAbstractListModel(parent), manager_(manager)
{
    connect(manager_, &NotificationManager::activeChanged, this, [this]() {
        beginResetModel(); endResetModel(); emit countChanged();
    });
}

int NotificationModel::rowCount(const QModelIndex& parent) const
{
    if (parent.isValid()) return 0;
    return manager_->activeCount();
}

QVariant NotificationModel::data(const QModelIndex& index, int role) const
{
    const Notification* n = manager_->notificationAt(index.row());
    if (!n) return {};

    switch (role) {
    case NotificationIdRole:   return n->id;
    case AppNameRole:          return n->appName;
    case AppIconRole:          return n->appIcon;
    case SummaryRole:          return n->summary;
    case BodyRole:             return n->body;
    case UrgencyRole:          return urgencyToInt(n->urgency());
    case CategoryRole:         return n->category();
    case ResidentRole:         return n->isResident();
    case TimestampRole:        return n->timestamp;
    case ActionsRole: {
        QVariantList actions;
        for (const auto& action : n->actions)
            actions.append(QVariantMap{{"key", action.key}, {"label", action.label}});
        return actions;
    }
    default:                   return {};
    }
}

QHash<int, QByteArray> NotificationModel::roleNames() const
{
    return {
        {NotificationIdRole, "notificationId"},
        {AppNameRole,        "appName"},
        {AppIconRole,        "appIcon"},
        {SummaryRole,        "summary"},
        {BodyRole,           "body"},
        {UrgencyRole,        "urgency"},
        {CategoryRole,       "category"},
        {ActionsRole,        "actions"},
        {ResidentRole,       "resident"},
        {TimestampRole,      "timestamp"}
    };
}

} // namespace nhub
