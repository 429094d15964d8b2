#include "ImageListModel.hpp"

#include <QFileInfo>

#include "viewer/ViewerSession.hpp"

ImageListModel::ImageListModel(QObject* parent)
    : QAbstractListModel(parent)
{
}

int ImageListModel::rowCount(const QModelIndex& parent) const
{
    if (parent.isValid())
        return 0;
    return static_cast<int>(m_paths.size());
}

QVariant ImageListModel::data(const QModelIndex& index, int role) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= m_paths.size())
        return {};
    const QString& path = m_paths.at(index.row());
    switch (role) {
    case Qt::DisplayRole:
    case FileNameRole:
        return QFileInfo(path).fileName();
    case PathRole:
        return path;
    case DirectoryRole:
        return QFileInfo(path).absolutePath();
    case SelectedRole:
        return index.row() == m_selectedRow;
    case RotationRole:
        return m_session ? pixor::viewer::degrees(m_session->transformFor(path).rotation) : 0;
    default:
        return {};
    }
}

QHash<int, QByteArray> ImageListModel::roleNames() const
{
    return {
        {PathRole, QByteArrayLiteral("path")},
        {FileNameRole, QByteArrayLiteral("fileName")},
        {DirectoryRole, QByteArrayLiteral("directory")},
        {SelectedRole, QByteArrayLiteral("selected")},
        {RotationRole, QByteArrayLiteral("rotation")},
    };
}

void ImageListModel::setSession(ViewerSession* session)
{
    if (m_session == session)
        return;
    if (m_session)
        disconnect(m_session.data(), nullptr, this, nullptr);
    m_session = session;
    if (m_session) {
        connect(m_session.data(), &ViewerSession::imagesChanged, this, &ImageListModel::reload);
        connect(m_session.data(), &ViewerSession::currentIndexChanged, this, &ImageListModel::refreshSelection);
        connect(m_session.data(), &ViewerSession::transformChanged, this, &ImageListModel::refreshCurrentRotation);
    }
    reload();
}

void ImageListModel::reload()
{
    const int previousCount = count();
    beginResetModel();
    m_paths = m_session ? m_session->images() : QStringList();
    m_selectedRow = m_session ? m_session->currentIndex() : -1;
    endResetModel();
    if (previousCount != count())
        emit countChanged();
}

void ImageListModel::refreshSelection()
{
    const int selected = m_session ? m_session->currentIndex() : -1;
    if (selected == m_selectedRow)
        return;
    const int previous = m_selectedRow;
    m_selectedRow = selected;
    for (int row : {previous, selected}) {
        if (row >= 0 && row < m_paths.size())
            emit dataChanged(index(row), index(row), {SelectedRole});
    }
}

void ImageListModel::refreshCurrentRotation()
{
    if (m_selectedRow >= 0 && m_selectedRow < m_paths.size())
        emit dataChanged(index(m_selectedRow), index(m_selectedRow), {RotationRole});
}
