#pragma once

#include <QDateTime>
#include <QHash>
#include <QList>
#include <QMap>
#include <QObject>
#include <QString>
#include <QStringList>

#include <functional>
#include <optional>

#include "tags/TagTypes.hpp"

/**
 * @brief Tag database backed by a JSON document.
 *
 * Image paths are keyed by their standardized form. Every successful mutation
 * bumps version() and, when a storage path is configured, is written back
 * immediately through QSaveFile.
 */
class TagRepository : public QObject {
    Q_OBJECT
    Q_PROPERTY(quint64 version READ version NOTIFY tagsChanged)

public:
    explicit TagRepository(QObject* parent = nullptr);
    ~TagRepository() override;

    QString storagePath() const { return m_storagePath; }
    void setStoragePath(const QString& path);

    bool load(QString* errorMessage = nullptr);
    bool save(QString* errorMessage = nullptr) const;

    std::optional<TagRecord> createTag(const QString& name, const QString& colorHex = QString(),
                                       QString* errorMessage = nullptr);
    //! Returns the tag with a case-insensitively equal name, creating it when missing.
    std::optional<TagRecord> ensureTag(const QString& name, QString* errorMessage = nullptr);
    bool renameTag(qint64 tagId, const QString& newName, QString* errorMessage = nullptr);
    bool setTagColor(qint64 tagId, const QString& colorHex, QString* errorMessage = nullptr);
    bool deleteTag(qint64 tagId, QString* errorMessage = nullptr);

    bool assign(qint64 tagId, const QString& imagePath, QString* errorMessage = nullptr);
    bool unassign(qint64 tagId, const QString& imagePath, QString* errorMessage = nullptr);
    //! Forgets every assignment of a removed image.
    bool removeImage(const QString& imagePath, QString* errorMessage = nullptr);

    std::optional<TagRecord> tag(qint64 tagId) const;
    std::optional<TagRecord> tagNamed(const QString& name) const;
    QList<TagRecord> tagsFor(const QString& imagePath) const;
    QList<TagRecord> allTags() const;
    QList<ScopedTagSummary> scopedSummaries(const QStringList& imagePaths) const;
    //! Tag id -> number of images in @p directory carrying it.
    QHash<qint64, int> directoryUsage(const QString& directory) const;
    TagAssignments assignments() const;

    quint64 version() const { return m_version; }

    void setClockForTesting(std::function<QDateTime()> clock);

signals:
    void tagsChanged();

private:
    struct StoredTag {
        QString name;
        QString colorHex;
        QDateTime createdAt;
        QDateTime updatedAt;
    };

    struct Snapshot {
        QMap<qint64, StoredTag> tags;
        QHash<QString, QList<qint64>> images;
        qint64 nextId = 1;
    };

    QDateTime now() const;
    Snapshot snapshot() const;
    std::optional<qint64> findByName(const QString& name) const;
    int usageCount(qint64 tagId) const;
    TagRecord recordFor(qint64 tagId) const;
    bool commit(const Snapshot& before, QString* errorMessage);

    QString m_storagePath;
    QMap<qint64, StoredTag> m_tags;
    QHash<QString, QList<qint64>> m_images;
    qint64 m_nextId = 1;
    quint64 m_version = 0;
    std::function<QDateTime()> m_clock;
};
