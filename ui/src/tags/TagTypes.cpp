#include "TagTypes.hpp"

#include <QJsonArray>
#include <QStringList>
#include <QVariant>

#include <algorithm>

namespace pixor::tags {

std::optional<QString> normalizedHexColor(const QString& value)
{
    QString text = value.trimmed();
    if (text.startsWith(QLatin1Char('#')))
        text.remove(0, 1);
    if (text.size() != 6 && text.size() != 8)
        return std::nullopt;
    for (const QChar ch : std::as_const(text)) {
        const bool hexDigit = ch.isDigit() || (ch.toLower() >= QLatin1Char('a') && ch.toLower() <= QLatin1Char('f'));
        if (!hexDigit)
            return std::nullopt;
    }
    return QLatin1Char('#') + text.toUpper();
}

QString filterModeName(TagFilterMode mode)
{
    switch (mode) {
    case TagFilterMode::Any:
        return QStringLiteral("any");
    case TagFilterMode::All:
        return QStringLiteral("all");
    case TagFilterMode::Exclude:
        return QStringLiteral("exclude");
    }
    return QStringLiteral("any");
}

std::optional<TagFilterMode> filterModeFromName(const QString& name)
{
    for (TagFilterMode mode : {TagFilterMode::Any, TagFilterMode::All, TagFilterMode::Exclude}) {
        if (filterModeName(mode) == name.trimmed().toLower())
            return mode;
    }
    return std::nullopt;
}

TagFilter sanitizedFilter(const TagFilter& filter)
{
    TagFilter result = filter;
    result.keyword = filter.keyword.trimmed();
    result.colorHexes.clear();
    for (const QString& hex : filter.colorHexes) {
        if (const auto normalized = normalizedHexColor(hex))
            result.colorHexes.insert(*normalized);
    }
    return result;
}

QJsonObject filterToJson(const TagFilter& filter)
{
    QList<qint64> ids(filter.tagIds.cbegin(), filter.tagIds.cend());
    std::sort(ids.begin(), ids.end());
    QJsonArray tagIds;
    for (qint64 id : std::as_const(ids))
        tagIds.append(id);

    QStringList colors(filter.colorHexes.cbegin(), filter.colorHexes.cend());
    colors.sort();

    QJsonObject object;
    object.insert(QStringLiteral("mode"), filterModeName(filter.mode));
    object.insert(QStringLiteral("tagIds"), tagIds);
    object.insert(QStringLiteral("keyword"), filter.keyword);
    object.insert(QStringLiteral("colorHexes"), QJsonArray::fromStringList(colors));
    return object;
}

TagFilter filterFromJson(const QJsonObject& object)
{
    TagFilter filter;
    filter.mode = filterModeFromName(object.value(QStringLiteral("mode")).toString()).value_or(TagFilterMode::Any);
    const QJsonArray tagIds = object.value(QStringLiteral("tagIds")).toArray();
    for (const QJsonValue& value : tagIds) {
        const qint64 id = value.toVariant().toLongLong();
        if (id > 0)
            filter.tagIds.insert(id);
    }
    filter.keyword = object.value(QStringLiteral("keyword")).toString();
    const QJsonArray colors = object.value(QStringLiteral("colorHexes")).toArray();
    for (const QJsonValue& value : colors) {
        if (const auto normalized = normalizedHexColor(value.toString()))
            filter.colorHexes.insert(*normalized);
    }
    return filter;
}

} // namespace pixor::tags
