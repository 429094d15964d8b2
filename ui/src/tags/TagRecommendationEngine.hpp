#pragma once

#include <QHash>
#include <QList>
#include <QString>
#include <QStringList>

#include "tags/TagTypes.hpp"

class TagRepository;

namespace pixor::tags {

struct RecommendationInput {
    QString imagePath;
    QList<TagRecord> allTags;
    TagAssignments assignments;
    QList<ScopedTagSummary> scopedSummaries;
    QHash<qint64, int> directoryUsage;
};

//! Tags suggested for an image, best first. Tags already on the image are never suggested.
QList<TagRecord> recommendedTags(const RecommendationInput& input, int limit);

//! Convenience overload gathering the input from @p repository, scoping usage to @p scopePaths.
QList<TagRecord> recommendedTags(const TagRepository& repository, const QString& imagePath,
                                 const QStringList& scopePaths, int limit);

} // namespace pixor::tags
