#include "TagSmartFilterStore.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QSaveFile>
#include <QStringList>
#include <QVariant>

#include <algorithm>

#include "utils/PathUtils.hpp"

Q_DECLARE_LOGGING_CATEGORY(lcTags)

namespace {

constexpr int kSmartFilterFormat = 1;

void setError(QString* errorMessage, const QString& text)
{
    if (errorMessage)
        *errorMessage = text;
}

QString describe(const TagFilter& filter)
{
    QStringList parts;
    if (!filter.tagIds.isEmpty())
        parts.append(QObject::tr("%n tag(s), %1", nullptr, static_cast<int>(filter.tagIds.size()))
                         .arg(pixor::tags::filterModeName(filter.mode)));
    if (!filter.colorHexes.isEmpty())
        parts.append(QObject::tr("%n colour(s)", nullptr, static_cast<int>(filter.colorHexes.size())));
    if (!filter.keyword.trimmed().isEmpty())
        parts.append(QStringLiteral("\"%1\"").arg(filter.keyword.trimmed()));
    return parts.join(QStringLiteral(", "));
}

} // namespace

TagSmartFilterStore::TagSmartFilterStore(QObject* parent)
    : QObject(parent)
{
}

TagSmartFilterStore::~TagSmartFilterStore() = default;

void TagSmartFilterStore::setStoragePath(const QString& path)
{
    m_storagePath = path.isEmpty() ? QString() : pixor::utils::expandPath(path);
}

bool TagSmartFilterStore::load(QString* errorMessage)
{
    const bool hadFilters = !m_filters.isEmpty();
    m_filters.clear();
    const auto finish = [&](bool ok) {
        if (hadFilters || !m_filters.isEmpty())
            emit filtersChanged();
        return ok;
    };

    if (m_storagePath.isEmpty())
        return finish(true);

    QFile file(m_storagePath);
    if (!file.exists())
        return finish(true);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(errorMessage, tr("Cannot open saved filters %1: %2").arg(m_storagePath, file.errorString()));
        qCWarning(lcTags) << "Cannot open saved filters" << m_storagePath << file.errorString();
        return finish(false);
    }

    QJsonParseError parseError{};
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        setError(errorMessage, tr("Malformed saved filters %1: %2").arg(m_storagePath, parseError.errorString()));
        qCWarning(lcTags) << "Malformed saved filters" << m_storagePath << parseError.errorString();
        return finish(false);
    }

    const QJsonObject root = document.object();
    const int format = root.value(QStringLiteral("format")).toInt(kSmartFilterFormat);
    if (format > kSmartFilterFormat)
        qCWarning(lcTags) << "Saved filter format" << format << "is newer than supported" << kSmartFilterFormat;

    const QJsonArray entries = root.value(QStringLiteral("filters")).toArray();
    for (const QJsonValue& value : entries) {
        const QJsonObject object = value.toObject();
        SavedTagFilter entry;
        entry.id = QUuid::fromString(object.value(QStringLiteral("id")).toString());
        entry.name = object.value(QStringLiteral("name")).toString().trimmed();
        entry.filter = pixor::tags::filterFromJson(object.value(QStringLiteral("filter")).toObject());
        if (entry.name.isEmpty() || indexOfName(entry.name)) {
            qCDebug(lcTags) << "Skipping invalid saved filter" << object;
            continue;
        }
        if (entry.id.isNull() || indexOf(entry.id) >= 0)
            entry.id = QUuid::createUuid();
        m_filters.append(entry);
    }

    qCInfo(lcTags) << "Loaded" << m_filters.size() << "saved filters from" << m_storagePath;
    return finish(true);
}

bool TagSmartFilterStore::save(QString* errorMessage) const
{
    if (m_storagePath.isEmpty())
        return true;

    QJsonArray entries;
    for (const SavedTagFilter& entry : m_filters) {
        QJsonObject object;
        object.insert(QStringLiteral("id"), entry.id.toString(QUuid::WithoutBraces));
        object.insert(QStringLiteral("name"), entry.name);
        object.insert(QStringLiteral("filter"), pixor::tags::filterToJson(entry.filter));
        entries.append(object);
    }

    QJsonObject root;
    root.insert(QStringLiteral("format"), kSmartFilterFormat);
    root.insert(QStringLiteral("filters"), entries);

    const QFileInfo info(m_storagePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        setError(errorMessage, tr("Cannot create directory %1").arg(dir.absolutePath()));
        qCWarning(lcTags) << "Cannot create saved filter directory" << dir.absolutePath();
        return false;
    }

    QSaveFile file(m_storagePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        setError(errorMessage, tr("Cannot write saved filters %1: %2").arg(m_storagePath, file.errorString()));
        qCWarning(lcTags) << "Cannot open saved filters for writing" << m_storagePath << file.errorString();
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        setError(errorMessage, tr("Cannot write saved filters %1: %2").arg(m_storagePath, file.errorString()));
        qCWarning(lcTags) << "Failed to commit saved filters" << m_storagePath << file.errorString();
        return false;
    }
    return true;
}

std::optional<SavedTagFilter> TagSmartFilterStore::filter(const QUuid& id) const
{
    const int index = indexOf(id);
    if (index < 0)
        return std::nullopt;
    return m_filters.at(index);
}

int TagSmartFilterStore::indexOf(const QUuid& id) const
{
    for (int i = 0; i < m_filters.size(); ++i) {
        if (m_filters.at(i).id == id)
            return i;
    }
    return -1;
}

std::optional<int> TagSmartFilterStore::indexOfName(const QString& name, const QUuid& except) const
{
    for (int i = 0; i < m_filters.size(); ++i) {
        const SavedTagFilter& entry = m_filters.at(i);
        if (!except.isNull() && entry.id == except)
            continue;
        if (QString::compare(entry.name, name, Qt::CaseInsensitive) == 0)
            return i;
    }
    return std::nullopt;
}

bool TagSmartFilterStore::commit(const QList<SavedTagFilter>& before, QString* errorMessage)
{
    if (!save(errorMessage)) {
        m_filters = before;
        return false;
    }
    emit filtersChanged();
    return true;
}

SmartFilterResult TagSmartFilterStore::saveFilter(const TagFilter& filter, const QString& name,
                                                  QString* errorMessage)
{
    const QString trimmed = name.trimmed();
    if (trimmed.isEmpty())
        return SmartFilterResult::Ignored;
    if (indexOfName(trimmed)) {
        setError(errorMessage, tr("A saved filter named \"%1\" already exists.").arg(trimmed));
        return SmartFilterResult::DuplicateName;
    }
    const auto existing = std::find_if(m_filters.cbegin(), m_filters.cend(),
                                       [&](const SavedTagFilter& entry) { return entry.filter == filter; });
    if (existing != m_filters.cend()) {
        setError(errorMessage, tr("This filter is already saved as \"%1\".").arg(existing->name));
        return SmartFilterResult::DuplicateFilter;
    }

    const QList<SavedTagFilter> before = m_filters;
    m_filters.prepend(SavedTagFilter{QUuid::createUuid(), trimmed, filter});
    if (!commit(before, errorMessage))
        return SmartFilterResult::WriteFailed;
    qCDebug(lcTags) << "Saved filter" << trimmed;
    return SmartFilterResult::Ok;
}

SmartFilterResult TagSmartFilterStore::rename(const QUuid& id, const QString& name, QString* errorMessage)
{
    const QString trimmed = name.trimmed();
    const int index = indexOf(id);
    if (trimmed.isEmpty() || index < 0)
        return SmartFilterResult::Ignored;
    if (indexOfName(trimmed, id)) {
        setError(errorMessage, tr("A saved filter named \"%1\" already exists.").arg(trimmed));
        return SmartFilterResult::DuplicateName;
    }
    if (m_filters.at(index).name == trimmed)
        return SmartFilterResult::Ok;

    const QList<SavedTagFilter> before = m_filters;
    m_filters[index].name = trimmed;
    return commit(before, errorMessage) ? SmartFilterResult::Ok : SmartFilterResult::WriteFailed;
}

bool TagSmartFilterStore::promote(const QUuid& id, QString* errorMessage)
{
    const int index = indexOf(id);
    if (index < 0)
        return false;
    if (index == 0)
        return true;

    const QList<SavedTagFilter> before = m_filters;
    m_filters.move(index, 0);
    return commit(before, errorMessage);
}

bool TagSmartFilterStore::remove(const QUuid& id, QString* errorMessage)
{
    const int index = indexOf(id);
    if (index < 0)
        return false;

    const QList<SavedTagFilter> before = m_filters;
    m_filters.removeAt(index);
    return commit(before, errorMessage);
}

bool TagSmartFilterStore::reorder(const QList<int>& sourceRows, int destination, QString* errorMessage)
{
    QList<int> rows;
    for (int row : sourceRows) {
        if (row >= 0 && row < m_filters.size() && !rows.contains(row))
            rows.append(row);
    }
    if (rows.isEmpty())
        return true;
    std::sort(rows.begin(), rows.end());

    const QList<SavedTagFilter> before = m_filters;
    QList<SavedTagFilter> moving;
    for (int row : std::as_const(rows))
        moving.append(m_filters.at(row));
    for (auto it = rows.crbegin(); it != rows.crend(); ++it)
        m_filters.removeAt(*it);

    const int below = static_cast<int>(std::count_if(rows.cbegin(), rows.cend(), [&](int row) { return row < destination; }));
    const int target = std::clamp(destination - below, 0, static_cast<int>(m_filters.size()));
    for (int i = 0; i < moving.size(); ++i)
        m_filters.insert(target + i, moving.at(i));

    if (m_filters == before)
        return true;
    return commit(before, errorMessage);
}

QVariantList TagSmartFilterStore::entries() const
{
    QVariantList result;
    for (const SavedTagFilter& entry : m_filters) {
        QVariantMap map;
        map.insert(QStringLiteral("id"), entry.id.toString(QUuid::WithoutBraces));
        map.insert(QStringLiteral("name"), entry.name);
        map.insert(QStringLiteral("summary"), describe(entry.filter));
        result.append(map);
    }
    return result;
}

bool TagSmartFilterStore::renameEntry(const QString& id, const QString& name)
{
    QString error;
    const SmartFilterResult result = rename(QUuid::fromString(id), name, &error);
    if (!error.isEmpty())
        qCWarning(lcTags) << "Rename of saved filter failed:" << error;
    return result == SmartFilterResult::Ok;
}

bool TagSmartFilterStore::removeEntry(const QString& id)
{
    return remove(QUuid::fromString(id));
}

bool TagSmartFilterStore::moveEntry(int from, int to)
{
    return reorder({from}, to > from ? to + 1 : to);
}
