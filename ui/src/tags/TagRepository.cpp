#include "TagRepository.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QSaveFile>
#include <QSet>
#include <QVariant>

#include <algorithm>

#include "utils/PathUtils.hpp"

Q_LOGGING_CATEGORY(lcTags, "pixor.tags")

namespace {

constexpr int kTagDatabaseFormat = 1;

QDateTime readDate(const QJsonObject& object, const QString& key)
{
    const QDateTime parsed = QDateTime::fromString(object.value(key).toString(), Qt::ISODateWithMs);
    return parsed.isValid() ? parsed.toUTC() : QDateTime();
}

bool nameLessThan(const QString& lhs, const QString& rhs)
{
    const int result = QString::compare(lhs, rhs, Qt::CaseInsensitive);
    if (result != 0)
        return result < 0;
    return lhs < rhs;
}

void setError(QString* errorMessage, const QString& text)
{
    if (errorMessage)
        *errorMessage = text;
}

} // namespace

TagRepository::TagRepository(QObject* parent)
    : QObject(parent)
{
}

TagRepository::~TagRepository() = default;

void TagRepository::setStoragePath(const QString& path)
{
    m_storagePath = path.isEmpty() ? QString() : pixor::utils::expandPath(path);
}

void TagRepository::setClockForTesting(std::function<QDateTime()> clock)
{
    m_clock = std::move(clock);
}

QDateTime TagRepository::now() const
{
    return m_clock ? m_clock() : QDateTime::currentDateTimeUtc();
}

bool TagRepository::load(QString* errorMessage)
{
    m_tags.clear();
    m_images.clear();
    m_nextId = 1;

    if (m_storagePath.isEmpty())
        return true;

    QFile file(m_storagePath);
    if (!file.exists()) {
        ++m_version;
        Q_EMIT tagsChanged();
        return true;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        setError(errorMessage, tr("Cannot open tag database %1: %2").arg(m_storagePath, file.errorString()));
        qCWarning(lcTags) << "Cannot open tag database" << m_storagePath << file.errorString();
        return false;
    }

    QJsonParseError parseError{};
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        setError(errorMessage, tr("Malformed tag database %1: %2").arg(m_storagePath, parseError.errorString()));
        qCWarning(lcTags) << "Malformed tag database" << m_storagePath << parseError.errorString();
        return false;
    }

    const QJsonObject root = document.object();
    const int format = root.value(QStringLiteral("format")).toInt(kTagDatabaseFormat);
    if (format > kTagDatabaseFormat)
        qCWarning(lcTags) << "Tag database format" << format << "is newer than supported" << kTagDatabaseFormat;

    qint64 maxId = 0;
    const QJsonArray tags = root.value(QStringLiteral("tags")).toArray();
    for (const QJsonValue& value : tags) {
        const QJsonObject object = value.toObject();
        const qint64 id = object.value(QStringLiteral("id")).toVariant().toLongLong();
        const QString name = object.value(QStringLiteral("name")).toString().trimmed();
        if (id <= 0 || name.isEmpty() || m_tags.contains(id) || findByName(name)) {
            qCDebug(lcTags) << "Skipping invalid tag entry" << object;
            continue;
        }
        StoredTag stored;
        stored.name = name;
        stored.colorHex = pixor::tags::normalizedHexColor(object.value(QStringLiteral("colorHex")).toString())
                              .value_or(QString());
        stored.createdAt = readDate(object, QStringLiteral("createdAt"));
        stored.updatedAt = readDate(object, QStringLiteral("updatedAt"));
        m_tags.insert(id, stored);
        maxId = std::max(maxId, id);
    }

    const QJsonArray images = root.value(QStringLiteral("images")).toArray();
    for (const QJsonValue& value : images) {
        const QJsonObject object = value.toObject();
        const QString path = object.value(QStringLiteral("path")).toString();
        if (path.isEmpty())
            continue;
        QList<qint64> ids;
        const QJsonArray tagIds = object.value(QStringLiteral("tagIds")).toArray();
        for (const QJsonValue& idValue : tagIds) {
            const qint64 id = idValue.toVariant().toLongLong();
            if (m_tags.contains(id) && !ids.contains(id))
                ids.append(id);
        }
        if (!ids.isEmpty())
            m_images.insert(pixor::utils::standardizedPath(path), ids);
    }

    m_nextId = std::max<qint64>(root.value(QStringLiteral("nextId")).toVariant().toLongLong(), maxId + 1);
    ++m_version;
    qCInfo(lcTags) << "Loaded" << m_tags.size() << "tags for" << m_images.size() << "images from" << m_storagePath;
    Q_EMIT tagsChanged();
    return true;
}

bool TagRepository::save(QString* errorMessage) const
{
    if (m_storagePath.isEmpty())
        return true;

    QJsonArray tags;
    for (auto it = m_tags.cbegin(); it != m_tags.cend(); ++it) {
        QJsonObject object;
        object.insert(QStringLiteral("id"), it.key());
        object.insert(QStringLiteral("name"), it->name);
        if (!it->colorHex.isEmpty())
            object.insert(QStringLiteral("colorHex"), it->colorHex);
        object.insert(QStringLiteral("createdAt"), it->createdAt.toUTC().toString(Qt::ISODateWithMs));
        object.insert(QStringLiteral("updatedAt"), it->updatedAt.toUTC().toString(Qt::ISODateWithMs));
        tags.append(object);
    }

    QStringList paths = m_images.keys();
    std::sort(paths.begin(), paths.end());
    QJsonArray images;
    for (const QString& path : std::as_const(paths)) {
        QJsonArray ids;
        for (qint64 id : m_images.value(path))
            ids.append(id);
        QJsonObject object;
        object.insert(QStringLiteral("path"), path);
        object.insert(QStringLiteral("tagIds"), ids);
        images.append(object);
    }

    QJsonObject root;
    root.insert(QStringLiteral("format"), kTagDatabaseFormat);
    root.insert(QStringLiteral("nextId"), m_nextId);
    root.insert(QStringLiteral("tags"), tags);
    root.insert(QStringLiteral("images"), images);

    const QFileInfo info(m_storagePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        setError(errorMessage, tr("Cannot create directory %1").arg(dir.absolutePath()));
        qCWarning(lcTags) << "Cannot create tag database directory" << dir.absolutePath();
        return false;
    }

    QSaveFile file(m_storagePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        setError(errorMessage, tr("Cannot write tag database %1: %2").arg(m_storagePath, file.errorString()));
        qCWarning(lcTags) << "Cannot open tag database for writing" << m_storagePath << file.errorString();
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        setError(errorMessage, tr("Cannot write tag database %1: %2").arg(m_storagePath, file.errorString()));
        qCWarning(lcTags) << "Failed to commit tag database" << m_storagePath << file.errorString();
        return false;
    }
    return true;
}

std::optional<qint64> TagRepository::findByName(const QString& name) const
{
    const QString trimmed = name.trimmed();
    for (auto it = m_tags.cbegin(); it != m_tags.cend(); ++it) {
        if (QString::compare(it->name, trimmed, Qt::CaseInsensitive) == 0)
            return it.key();
    }
    return std::nullopt;
}

int TagRepository::usageCount(qint64 tagId) const
{
    int count = 0;
    for (auto it = m_images.cbegin(); it != m_images.cend(); ++it) {
        if (it->contains(tagId))
            ++count;
    }
    return count;
}

TagRecord TagRepository::recordFor(qint64 tagId) const
{
    const StoredTag stored = m_tags.value(tagId);
    TagRecord record;
    record.id = tagId;
    record.name = stored.name;
    record.colorHex = stored.colorHex;
    record.usageCount = usageCount(tagId);
    record.createdAt = stored.createdAt;
    record.updatedAt = stored.updatedAt;
    return record;
}

TagRepository::Snapshot TagRepository::snapshot() const
{
    return Snapshot{m_tags, m_images, m_nextId};
}

bool TagRepository::commit(const Snapshot& before, QString* errorMessage)
{
    if (!save(errorMessage)) {
        // Memory and disk stay in step: a change that cannot be written is undone.
        m_tags = before.tags;
        m_images = before.images;
        m_nextId = before.nextId;
        return false;
    }
    ++m_version;
    Q_EMIT tagsChanged();
    return true;
}

std::optional<TagRecord> TagRepository::createTag(const QString& name, const QString& colorHex,
                                                  QString* errorMessage)
{
    const Snapshot before = snapshot();
    const QString trimmed = name.trimmed();
    if (trimmed.isEmpty()) {
        setError(errorMessage, tr("Tag name must not be empty"));
        return std::nullopt;
    }
    if (findByName(trimmed)) {
        setError(errorMessage, tr("Tag \"%1\" already exists").arg(trimmed));
        return std::nullopt;
    }
    QString color;
    if (!colorHex.trimmed().isEmpty()) {
        const auto normalized = pixor::tags::normalizedHexColor(colorHex);
        if (!normalized) {
            setError(errorMessage, tr("Invalid colour: %1").arg(colorHex));
            return std::nullopt;
        }
        color = *normalized;
    }

    const qint64 id = m_nextId++;
    const QDateTime timestamp = now();
    m_tags.insert(id, StoredTag{trimmed, color, timestamp, timestamp});
    qCDebug(lcTags) << "Created tag" << id << trimmed;
    if (!commit(before, errorMessage))
        return std::nullopt;
    return recordFor(id);
}

std::optional<TagRecord> TagRepository::ensureTag(const QString& name, QString* errorMessage)
{
    if (const auto existing = findByName(name))
        return recordFor(*existing);
    return createTag(name, QString(), errorMessage);
}

bool TagRepository::renameTag(qint64 tagId, const QString& newName, QString* errorMessage)
{
    const Snapshot before = snapshot();
    auto it = m_tags.find(tagId);
    if (it == m_tags.end()) {
        setError(errorMessage, tr("Unknown tag %1").arg(tagId));
        return false;
    }
    const QString trimmed = newName.trimmed();
    if (trimmed.isEmpty()) {
        setError(errorMessage, tr("Tag name must not be empty"));
        return false;
    }
    const auto clash = findByName(trimmed);
    if (clash && *clash != tagId) {
        setError(errorMessage, tr("Tag \"%1\" already exists").arg(trimmed));
        return false;
    }
    if (it->name == trimmed)
        return true;
    it->name = trimmed;
    it->updatedAt = now();
    return commit(before, errorMessage);
}

bool TagRepository::setTagColor(qint64 tagId, const QString& colorHex, QString* errorMessage)
{
    const Snapshot before = snapshot();
    auto it = m_tags.find(tagId);
    if (it == m_tags.end()) {
        setError(errorMessage, tr("Unknown tag %1").arg(tagId));
        return false;
    }
    QString color;
    if (!colorHex.trimmed().isEmpty()) {
        const auto normalized = pixor::tags::normalizedHexColor(colorHex);
        if (!normalized) {
            setError(errorMessage, tr("Invalid colour: %1").arg(colorHex));
            return false;
        }
        color = *normalized;
    }
    if (it->colorHex == color)
        return true;
    it->colorHex = color;
    it->updatedAt = now();
    return commit(before, errorMessage);
}

bool TagRepository::deleteTag(qint64 tagId, QString* errorMessage)
{
    const Snapshot before = snapshot();
    if (!m_tags.remove(tagId)) {
        setError(errorMessage, tr("Unknown tag %1").arg(tagId));
        return false;
    }
    for (auto it = m_images.begin(); it != m_images.end();) {
        it->removeAll(tagId);
        if (it->isEmpty())
            it = m_images.erase(it);
        else
            ++it;
    }
    qCDebug(lcTags) << "Deleted tag" << tagId;
    return commit(before, errorMessage);
}

bool TagRepository::assign(qint64 tagId, const QString& imagePath, QString* errorMessage)
{
    const Snapshot before = snapshot();
    if (!m_tags.contains(tagId)) {
        setError(errorMessage, tr("Unknown tag %1").arg(tagId));
        return false;
    }
    if (imagePath.trimmed().isEmpty()) {
        setError(errorMessage, tr("Missing image path"));
        return false;
    }
    QList<qint64>& ids = m_images[pixor::utils::standardizedPath(imagePath)];
    if (ids.contains(tagId))
        return true;
    ids.append(tagId);
    return commit(before, errorMessage);
}

bool TagRepository::unassign(qint64 tagId, const QString& imagePath, QString* errorMessage)
{
    const Snapshot before = snapshot();
    const QString key = pixor::utils::standardizedPath(imagePath);
    auto it = m_images.find(key);
    if (it == m_images.end() || !it->contains(tagId))
        return true;
    it->removeAll(tagId);
    if (it->isEmpty())
        m_images.erase(it);
    return commit(before, errorMessage);
}

bool TagRepository::removeImage(const QString& imagePath, QString* errorMessage)
{
    const Snapshot before = snapshot();
    if (!m_images.remove(pixor::utils::standardizedPath(imagePath)))
        return true;
    return commit(before, errorMessage);
}

std::optional<TagRecord> TagRepository::tag(qint64 tagId) const
{
    if (!m_tags.contains(tagId))
        return std::nullopt;
    return recordFor(tagId);
}

std::optional<TagRecord> TagRepository::tagNamed(const QString& name) const
{
    const auto id = findByName(name);
    if (!id)
        return std::nullopt;
    return recordFor(*id);
}

QList<TagRecord> TagRepository::tagsFor(const QString& imagePath) const
{
    QList<TagRecord> result;
    const QList<qint64> ids = m_images.value(pixor::utils::standardizedPath(imagePath));
    result.reserve(ids.size());
    for (qint64 id : ids)
        result.append(recordFor(id));
    std::sort(result.begin(), result.end(),
              [](const TagRecord& lhs, const TagRecord& rhs) { return nameLessThan(lhs.name, rhs.name); });
    return result;
}

QList<TagRecord> TagRepository::allTags() const
{
    QHash<qint64, int> counts;
    for (auto it = m_images.cbegin(); it != m_images.cend(); ++it) {
        for (qint64 id : *it)
            ++counts[id];
    }

    QList<TagRecord> result;
    result.reserve(m_tags.size());
    for (auto it = m_tags.cbegin(); it != m_tags.cend(); ++it) {
        TagRecord record;
        record.id = it.key();
        record.name = it->name;
        record.colorHex = it->colorHex;
        record.usageCount = counts.value(it.key());
        record.createdAt = it->createdAt;
        record.updatedAt = it->updatedAt;
        result.append(record);
    }
    std::sort(result.begin(), result.end(),
              [](const TagRecord& lhs, const TagRecord& rhs) { return nameLessThan(lhs.name, rhs.name); });
    return result;
}

QList<ScopedTagSummary> TagRepository::scopedSummaries(const QStringList& imagePaths) const
{
    QHash<qint64, int> counts;
    QSet<QString> seen;
    for (const QString& path : imagePaths) {
        const QString key = pixor::utils::standardizedPath(path);
        if (seen.contains(key))
            continue;
        seen.insert(key);
        for (qint64 id : m_images.value(key))
            ++counts[id];
    }

    QList<ScopedTagSummary> result;
    for (auto it = counts.cbegin(); it != counts.cend(); ++it) {
        const StoredTag stored = m_tags.value(it.key());
        result.append(ScopedTagSummary{it.key(), stored.name, stored.colorHex, it.value()});
    }
    std::sort(result.begin(), result.end(), [](const ScopedTagSummary& lhs, const ScopedTagSummary& rhs) {
        return nameLessThan(lhs.name, rhs.name);
    });
    return result;
}

QHash<qint64, int> TagRepository::directoryUsage(const QString& directory) const
{
    QHash<qint64, int> usage;
    const QString dir = pixor::utils::standardizedPath(directory);
    for (auto it = m_images.cbegin(); it != m_images.cend(); ++it) {
        if (QFileInfo(it.key()).absolutePath() != dir)
            continue;
        for (qint64 id : *it)
            ++usage[id];
    }
    return usage;
}

TagAssignments TagRepository::assignments() const
{
    TagAssignments result;
    for (auto it = m_images.cbegin(); it != m_images.cend(); ++it)
        result.insert(it.key(), tagsFor(it.key()));
    return result;
}
