#include "TagFilterEngine.hpp"

#include <QDir>
#include <QFileInfo>
#include <QHash>

#include "utils/PathUtils.hpp"

QStringList TagFilterEngine::filteredPaths(const TagFilter& filter, const QStringList& paths,
                                           const TagAssignments& assignments, quint64 assignmentVersion)
{
    if (!filter.isActive())
        return paths;

    const size_t pathsHash = qHash(paths);
    if (m_cache && m_cache->filter == filter && m_cache->pathsHash == pathsHash
        && m_cache->pathCount == paths.size() && m_cache->version == assignmentVersion)
        return m_cache->result;

    QStringList result;
    for (const QString& path : paths) {
        const QList<TagRecord> tags = assignments.value(pixor::utils::standardizedPath(path));
        if (matches(filter, path, tags))
            result.append(path);
    }

    m_cache = CacheEntry{filter, pathsHash, static_cast<int>(paths.size()), assignmentVersion, result};
    return result;
}

bool TagFilterEngine::matches(const TagFilter& filter, const QString& path, const QList<TagRecord>& tags)
{
    QSet<qint64> assignedIds;
    QSet<QString> assignedColors;
    for (const TagRecord& tag : tags) {
        assignedIds.insert(tag.id);
        if (const auto color = pixor::tags::normalizedHexColor(tag.colorHex))
            assignedColors.insert(*color);
    }

    if (!filter.tagIds.isEmpty()) {
        switch (filter.mode) {
        case TagFilterMode::Any:
            if (!filter.tagIds.intersects(assignedIds))
                return false;
            break;
        case TagFilterMode::All:
            if (!assignedIds.contains(filter.tagIds))
                return false;
            break;
        case TagFilterMode::Exclude:
            if (filter.tagIds.intersects(assignedIds))
                return false;
            break;
        }
    }

    if (!filter.colorHexes.isEmpty()) {
        QSet<QString> wanted;
        for (const QString& color : filter.colorHexes) {
            if (const auto normalized = pixor::tags::normalizedHexColor(color))
                wanted.insert(*normalized);
        }
        if (!wanted.intersects(assignedColors))
            return false;
    }

    const QString keyword = filter.keyword.trimmed().toLower();
    if (!keyword.isEmpty()) {
        const QFileInfo info(path);
        const bool inName = info.fileName().toLower().contains(keyword);
        const bool inDirectory = info.dir().dirName().toLower().contains(keyword);
        if (!inName && !inDirectory)
            return false;
    }

    return true;
}

TagFilter TagFilterEngine::prunedFilter(const TagFilter& filter, const QSet<qint64>& availableIds)
{
    TagFilter pruned = filter;
    pruned.tagIds.intersect(availableIds);
    return pruned;
}

void TagFilterEngine::invalidateCache()
{
    m_cache.reset();
}
