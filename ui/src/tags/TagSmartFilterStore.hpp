#pragma once

#include <QList>
#include <QObject>
#include <QString>
#include <QUuid>
#include <QVariant>

#include <optional>

#include "tags/TagTypes.hpp"

//! A tag filter saved under a user-chosen name.
struct SavedTagFilter {
    QUuid id;
    QString name;
    TagFilter filter;

    bool operator==(const SavedTagFilter& other) const
    {
        return id == other.id && name == other.name && filter == other.filter;
    }
};

enum class SmartFilterResult {
    Ok,
    Ignored,          // blank name or unknown id
    DuplicateName,
    DuplicateFilter,
    WriteFailed,
};

/**
 * @brief Named tag filters, most recently saved or applied first.
 *
 * Names are unique ignoring case and no two entries hold an equal filter.
 * Every change is written to the JSON file at storagePath() through
 * QSaveFile; a change that cannot be written is rolled back.
 */
class TagSmartFilterStore : public QObject {
    Q_OBJECT
    Q_PROPERTY(QVariantList entries READ entries NOTIFY filtersChanged)
    Q_PROPERTY(int count READ count NOTIFY filtersChanged)

public:
    explicit TagSmartFilterStore(QObject* parent = nullptr);
    ~TagSmartFilterStore() override;

    QString storagePath() const { return m_storagePath; }
    void setStoragePath(const QString& path);

    //! A missing file is an empty store; a malformed one leaves the store empty and returns false.
    bool load(QString* errorMessage = nullptr);
    bool save(QString* errorMessage = nullptr) const;

    QList<SavedTagFilter> filters() const { return m_filters; }
    int count() const { return static_cast<int>(m_filters.size()); }
    std::optional<SavedTagFilter> filter(const QUuid& id) const;

    //! Inserts @p filter at the top under the trimmed @p name.
    SmartFilterResult saveFilter(const TagFilter& filter, const QString& name, QString* errorMessage = nullptr);
    SmartFilterResult rename(const QUuid& id, const QString& name, QString* errorMessage = nullptr);
    //! Moves the entry to the top.
    bool promote(const QUuid& id, QString* errorMessage = nullptr);
    bool remove(const QUuid& id, QString* errorMessage = nullptr);
    //! Moves the rows at @p sourceRows so they start at @p destination, counted before the move.
    bool reorder(const QList<int>& sourceRows, int destination, QString* errorMessage = nullptr);

    // QML
    QVariantList entries() const;
    Q_INVOKABLE bool renameEntry(const QString& id, const QString& name);
    Q_INVOKABLE bool removeEntry(const QString& id);
    Q_INVOKABLE bool moveEntry(int from, int to);

signals:
    void filtersChanged();

private:
    int indexOf(const QUuid& id) const;
    std::optional<int> indexOfName(const QString& name, const QUuid& except = QUuid()) const;
    bool commit(const QList<SavedTagFilter>& before, QString* errorMessage);

    QString m_storagePath;
    QList<SavedTagFilter> m_filters;
};
