#pragma once

#include <QAbstractListModel>
#include <QPointer>
#include <QStringList>

class ViewerSession;

class ImageListModel : public QAbstractListModel {
    Q_OBJECT
    Q_PROPERTY(int count READ count NOTIFY countChanged)

public:
    enum Roles {
        PathRole = Qt::UserRole + 1,
        FileNameRole,
        DirectoryRole,
        SelectedRole,
        RotationRole,
    };

    explicit ImageListModel(QObject* parent = nullptr);

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
    QHash<int, QByteArray> roleNames() const override;

    void setSession(ViewerSession* session);
    int count() const { return static_cast<int>(m_paths.size()); }

signals:
    void countChanged();

private:
    void reload();
    void refreshSelection();
    void refreshCurrentRotation();

    QPointer<ViewerSession> m_session;
    QStringList m_paths;
    int m_selectedRow = -1;
};
