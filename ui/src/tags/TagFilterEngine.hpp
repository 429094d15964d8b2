#pragma once

#include <QSet>
#include <QStringList>

#include <optional>

#include "tags/TagTypes.hpp"

/**
 * @brief Applies a TagFilter to a list of image paths.
 *
 * The last result is cached and reused while the filter, the path list and the
 * assignment version stay the same.
 */
class TagFilterEngine {
public:
    QStringList filteredPaths(const TagFilter& filter, const QStringList& paths, const TagAssignments& assignments,
                              quint64 assignmentVersion);

    //! Drops tag ids that no longer exist from @p filter.
    static TagFilter prunedFilter(const TagFilter& filter, const QSet<qint64>& availableIds);

    static bool matches(const TagFilter& filter, const QString& path, const QList<TagRecord>& tags);

    void invalidateCache();
    bool hasCachedResult() const { return m_cache.has_value(); }

private:
    struct CacheEntry {
        TagFilter filter;
        size_t pathsHash = 0;
        int pathCount = 0;
        quint64 version = 0;
        QStringList result;
    };

    std::optional<CacheEntry> m_cache;
};
