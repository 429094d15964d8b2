#pragma once

#include <QDateTime>
#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QSet>
#include <QString>

#include <optional>

struct TagRecord {
    qint64 id = 0;
    QString name;
    QString colorHex;  // "#RRGGBB" or empty
    int usageCount = 0;
    QDateTime createdAt;
    QDateTime updatedAt;

    bool operator==(const TagRecord& other) const
    {
        return id == other.id && name == other.name && colorHex == other.colorHex && usageCount == other.usageCount;
    }
};

//! Usage of a tag restricted to a set of images.
struct ScopedTagSummary {
    qint64 id = 0;
    QString name;
    QString colorHex;
    int usageCount = 0;

    bool operator==(const ScopedTagSummary& other) const
    {
        return id == other.id && name == other.name && colorHex == other.colorHex && usageCount == other.usageCount;
    }
};

//! Standardized image path -> tags assigned to it.
using TagAssignments = QHash<QString, QList<TagRecord>>;

enum class TagFilterMode {
    Any,
    All,
    Exclude,
};

struct TagFilter {
    TagFilterMode mode = TagFilterMode::Any;
    QSet<qint64> tagIds;
    QString keyword;
    QSet<QString> colorHexes;

    bool isActive() const { return !tagIds.isEmpty() || !keyword.trimmed().isEmpty() || !colorHexes.isEmpty(); }

    bool operator==(const TagFilter& other) const
    {
        return mode == other.mode && tagIds == other.tagIds && keyword == other.keyword
            && colorHexes == other.colorHexes;
    }
    bool operator!=(const TagFilter& other) const { return !(*this == other); }
};

namespace pixor::tags {

//! "#RRGGBB" / "#RRGGBBAA" in upper case, with or without the leading '#'; std::nullopt otherwise.
std::optional<QString> normalizedHexColor(const QString& value);

QString filterModeName(TagFilterMode mode);
std::optional<TagFilterMode> filterModeFromName(const QString& name);

//! Trimmed keyword and normalized colours; unparsable colours are dropped.
TagFilter sanitizedFilter(const TagFilter& filter);
QJsonObject filterToJson(const TagFilter& filter);
//! Unknown modes fall back to TagFilterMode::Any.
TagFilter filterFromJson(const QJsonObject& object);

} // namespace pixor::tags
