#include "EntitlementStore.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QSaveFile>

#include "utils/PathUtils.hpp"

Q_DECLARE_LOGGING_CATEGORY(lcPurchase)

namespace {

QString isoString(const QDateTime& value)
{
    if (!value.isValid())
        return {};
    return value.toUTC().toString(Qt::ISODateWithMs);
}

QDateTime readDate(const QJsonObject& object, const QString& key)
{
    const QString raw = object.value(key).toString();
    if (raw.isEmpty())
        return {};
    QDateTime parsed = QDateTime::fromString(raw, Qt::ISODateWithMs);
    if (!parsed.isValid())
        parsed = QDateTime::fromString(raw, Qt::ISODate);
    return parsed.isValid() ? parsed.toUTC() : QDateTime();
}

void writeDate(QJsonObject& object, const QString& key, const QDateTime& value)
{
    if (value.isValid())
        object.insert(key, isoString(value));
}

void writeString(QJsonObject& object, const QString& key, const QString& value)
{
    if (!value.isEmpty())
        object.insert(key, value);
}

} // namespace

QJsonObject EntitlementSnapshot::toJson() const
{
    QJsonObject object;
    object.insert(QStringLiteral("schemaVersion"), kCurrentSchemaVersion);
    writeDate(object, QStringLiteral("trialStartDate"), trialStartDate);
    writeDate(object, QStringLiteral("trialEndDate"), trialEndDate);
    writeDate(object, QStringLiteral("lifetimePurchaseDate"), lifetimePurchaseDate);
    writeString(object, QStringLiteral("lifetimeTransactionId"), lifetimeTransactionId);
    writeString(object, QStringLiteral("lifetimeProductId"), lifetimeProductId);
    writeDate(object, QStringLiteral("subscriptionExpirationDate"), subscriptionExpirationDate);
    writeString(object, QStringLiteral("subscriptionTransactionId"), subscriptionTransactionId);
    writeString(object, QStringLiteral("subscriptionProductId"), subscriptionProductId);
    writeDate(object, QStringLiteral("lastUpdated"), lastUpdated);
    object.insert(QStringLiteral("trialBannerDismissed"), trialBannerDismissed);
    object.insert(QStringLiteral("legacyTrialConsumed"), legacyTrialConsumed);
    writeDate(object, QStringLiteral("legacyTrialStartedAt"), legacyTrialStartedAt);
    return object;
}

EntitlementSnapshot EntitlementSnapshot::fromJson(const QJsonObject& object, const QDateTime& now)
{
    EntitlementSnapshot snapshot;
    snapshot.schemaVersion = object.value(QStringLiteral("schemaVersion")).toInt(1);
    snapshot.trialStartDate = readDate(object, QStringLiteral("trialStartDate"));
    snapshot.trialEndDate = readDate(object, QStringLiteral("trialEndDate"));
    snapshot.lifetimePurchaseDate = readDate(object, QStringLiteral("lifetimePurchaseDate"));
    snapshot.lifetimeTransactionId = object.value(QStringLiteral("lifetimeTransactionId")).toString();
    snapshot.lifetimeProductId = object.value(QStringLiteral("lifetimeProductId")).toString();
    snapshot.subscriptionExpirationDate = readDate(object, QStringLiteral("subscriptionExpirationDate"));
    snapshot.subscriptionTransactionId = object.value(QStringLiteral("subscriptionTransactionId")).toString();
    snapshot.subscriptionProductId = object.value(QStringLiteral("subscriptionProductId")).toString();
    snapshot.trialBannerDismissed = object.value(QStringLiteral("trialBannerDismissed")).toBool(false);
    snapshot.legacyTrialConsumed = object.value(QStringLiteral("legacyTrialConsumed")).toBool(false);
    snapshot.legacyTrialStartedAt = readDate(object, QStringLiteral("legacyTrialStartedAt"));

    snapshot.lastUpdated = readDate(object, QStringLiteral("lastUpdated"));
    if (!snapshot.lastUpdated.isValid()) {
        if (snapshot.lifetimePurchaseDate.isValid())
            snapshot.lastUpdated = snapshot.lifetimePurchaseDate;
        else if (snapshot.trialEndDate.isValid())
            snapshot.lastUpdated = snapshot.trialEndDate;
        else
            snapshot.lastUpdated = now.toUTC();
    }

    if (snapshot.schemaVersion < kCurrentSchemaVersion) {
        qCInfo(lcPurchase) << "Migrating entitlement snapshot from schema" << snapshot.schemaVersion;
        snapshot.schemaVersion = kCurrentSchemaVersion;
    }
    return snapshot;
}

EntitlementStore::EntitlementStore(const QString& path)
    : m_path(pixor::utils::expandPath(path))
{
}

void EntitlementStore::setPath(const QString& path)
{
    m_path = pixor::utils::expandPath(path);
}

std::optional<EntitlementSnapshot> EntitlementStore::load(QString* errorMessage) const
{
    if (m_path.isEmpty())
        return std::nullopt;

    QFile file(m_path);
    if (!file.exists())
        return std::nullopt;
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage)
            *errorMessage = file.errorString();
        qCWarning(lcPurchase) << "Unable to read entitlement snapshot" << m_path << file.errorString();
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        const QString message = parseError.error != QJsonParseError::NoError
            ? parseError.errorString()
            : QStringLiteral("root is not an object");
        if (errorMessage)
            *errorMessage = message;
        qCWarning(lcPurchase) << "Ignoring corrupt entitlement snapshot" << m_path << message;
        return std::nullopt;
    }

    const EntitlementSnapshot snapshot = EntitlementSnapshot::fromJson(document.object(), QDateTime::currentDateTimeUtc());
    if (snapshot.isEmpty() && !snapshot.legacyTrialConsumed && !snapshot.trialBannerDismissed)
        return std::nullopt;
    return snapshot;
}

bool EntitlementStore::save(const EntitlementSnapshot& snapshot, QString* errorMessage) const
{
    if (m_path.isEmpty()) {
        if (errorMessage)
            *errorMessage = QStringLiteral("entitlement store has no path");
        return false;
    }

    const QDir dir = QFileInfo(m_path).dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        if (errorMessage)
            *errorMessage = QStringLiteral("cannot create directory %1").arg(dir.absolutePath());
        qCWarning(lcPurchase) << "Unable to create entitlement directory" << dir.absolutePath();
        return false;
    }

    QSaveFile file(m_path);
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorMessage)
            *errorMessage = file.errorString();
        qCWarning(lcPurchase) << "Unable to write entitlement snapshot" << m_path << file.errorString();
        return false;
    }
    file.write(QJsonDocument(snapshot.toJson()).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        if (errorMessage)
            *errorMessage = file.errorString();
        qCWarning(lcPurchase) << "Unable to commit entitlement snapshot" << m_path << file.errorString();
        return false;
    }
    return true;
}

bool EntitlementStore::clear(QString* errorMessage) const
{
    if (m_path.isEmpty() || !QFile::exists(m_path))
        return true;
    QFile file(m_path);
    if (!file.remove()) {
        if (errorMessage)
            *errorMessage = file.errorString();
        qCWarning(lcPurchase) << "Unable to remove entitlement snapshot" << m_path << file.errorString();
        return false;
    }
    return true;
}
