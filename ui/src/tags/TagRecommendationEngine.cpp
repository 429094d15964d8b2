#include "TagRecommendationEngine.hpp"

#include <QFileInfo>
#include <QSet>

#include <algorithm>
#include <cmath>

#include "tags/TagRepository.hpp"
#include "utils/PathUtils.hpp"

namespace {

constexpr double kSameDirectoryWeight = 2.0;
constexpr double kScopedUsageWeight = 0.9;
constexpr double kDirectoryUsageWeight = 0.6;

bool nameLessThan(const TagRecord& lhs, const TagRecord& rhs)
{
    const int result = QString::compare(lhs.name, rhs.name, Qt::CaseInsensitive);
    if (result != 0)
        return result < 0;
    return lhs.id < rhs.id;
}

} // namespace

namespace pixor::tags {

QList<TagRecord> recommendedTags(const RecommendationInput& input, int limit)
{
    if (limit <= 0)
        return {};

    const QString key = pixor::utils::standardizedPath(input.imagePath);
    const QString directory = QFileInfo(key).absolutePath();

    QSet<qint64> assigned;
    for (const TagRecord& tag : input.assignments.value(key))
        assigned.insert(tag.id);

    QHash<qint64, double> scores;
    for (auto it = input.assignments.cbegin(); it != input.assignments.cend(); ++it) {
        if (it.key() == key || QFileInfo(it.key()).absolutePath() != directory)
            continue;
        for (const TagRecord& tag : *it)
            scores[tag.id] += kSameDirectoryWeight;
    }
    for (const ScopedTagSummary& summary : input.scopedSummaries) {
        if (summary.usageCount > 0)
            scores[summary.id] += kScopedUsageWeight * std::log1p(static_cast<double>(summary.usageCount));
    }
    for (auto it = input.directoryUsage.cbegin(); it != input.directoryUsage.cend(); ++it) {
        if (it.value() > 0)
            scores[it.key()] += kDirectoryUsageWeight * std::log1p(static_cast<double>(it.value()));
    }

    QList<TagRecord> candidates;
    for (const TagRecord& tag : input.allTags) {
        if (!assigned.contains(tag.id))
            candidates.append(tag);
    }
    std::sort(candidates.begin(), candidates.end(), nameLessThan);

    QList<TagRecord> scored;
    for (const TagRecord& tag : std::as_const(candidates)) {
        if (scores.value(tag.id) > 0.0)
            scored.append(tag);
    }
    std::stable_sort(scored.begin(), scored.end(), [&scores](const TagRecord& lhs, const TagRecord& rhs) {
        return scores.value(lhs.id) > scores.value(rhs.id);
    });

    QList<TagRecord> result;
    QSet<qint64> included;
    for (const TagRecord& tag : std::as_const(scored)) {
        if (result.size() >= limit)
            return result;
        result.append(tag);
        included.insert(tag.id);
    }
    for (const TagRecord& tag : std::as_const(candidates)) {
        if (result.size() >= limit)
            break;
        if (!included.contains(tag.id))
            result.append(tag);
    }
    return result;
}

QList<TagRecord> recommendedTags(const TagRepository& repository, const QString& imagePath,
                                 const QStringList& scopePaths, int limit)
{
    RecommendationInput input;
    input.imagePath = imagePath;
    input.allTags = repository.allTags();
    input.assignments = repository.assignments();
    input.scopedSummaries = repository.scopedSummaries(scopePaths);
    input.directoryUsage = repository.directoryUsage(QFileInfo(pixor::utils::standardizedPath(imagePath)).absolutePath());
    return recommendedTags(input, limit);
}

} // namespace pixor::tags
