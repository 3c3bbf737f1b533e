#pragma once

#include <QAbstractListModel>

namespace nhub {

class NotificationManager;

/// Active notifications, oldest first, for a presentation layer.
class NotificationModel : public QAbstractListModel {
    Q_OBJECT
    Q_PROPERTY(int count READ rowCount NOTIFY countChanged)
public:
    enum Roles {
        NotificationIdRole = Qt::UserRole + 1,
        AppNameRole,
        AppIconRole,
        SummaryRole,
        BodyRole,
        UrgencyRole,
        CategoryRole,
        ActionsRole,
        ResidentRole,
        TimestampRole
    };

    explicit NotificationModel(NotificationManager* manager, QObject* parent = nullptr);

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role) const override;
    QHash<int, QByteArray> roleNames() const override;

signals:
    void countChanged();

private:
    NotificationManager* manager_;
};

} // namespace nhub
