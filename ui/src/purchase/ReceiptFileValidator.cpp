#include "ReceiptFileValidator.hpp"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QVariant>

#include "utils/PathUtils.hpp"

Q_DECLARE_LOGGING_CATEGORY(lcPurchase)

namespace {

QDateTime parseDate(const QJsonObject& object, const QString& key)
{
    const QJsonValue value = object.value(key);
    if (value.isDouble())
        return QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(value.toDouble()), Qt::UTC);
    const QString raw = value.toString();
    if (raw.isEmpty())
        return {};
    QDateTime parsed = QDateTime::fromString(raw, Qt::ISODateWithMs);
    if (!parsed.isValid())
        parsed = QDateTime::fromString(raw, Qt::ISODate);
    return parsed.isValid() ? parsed.toUTC() : QDateTime();
}

std::optional<QJsonArray> readReceipts(const QString& path, QString* errorMessage)
{
    QFile file(path);
    if (!file.exists()) {
        // No receipt on disk is not an error; callers treat it as "nothing to validate".
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage)
            *errorMessage = file.errorString();
        return std::nullopt;
    }
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (errorMessage)
            *errorMessage = parseError.errorString();
        return std::nullopt;
    }
    if (!document.isObject() || !document.object().value(QStringLiteral("receipts")).isArray()) {
        if (errorMessage)
            *errorMessage = QStringLiteral("receipt document has no receipts array");
        return std::nullopt;
    }
    return document.object().value(QStringLiteral("receipts")).toArray();
}

} // namespace

ReceiptFileValidator::ReceiptFileValidator(const QString& path)
    : m_path(pixor::utils::expandPath(path))
{
}

std::optional<ReceiptValidationResult> ReceiptFileValidator::validateReceipt(const QString& productId,
                                                                             QString* errorMessage)
{
    if (errorMessage)
        errorMessage->clear();
    if (m_path.isEmpty())
        return std::nullopt;

    const std::optional<QJsonArray> receipts = readReceipts(m_path, errorMessage);
    if (!receipts)
        return std::nullopt;

    std::optional<ReceiptValidationResult> latest;
    for (const QJsonValue& value : *receipts) {
        const QJsonObject entry = value.toObject();
        if (entry.value(QStringLiteral("product_id")).toString() != productId)
            continue;

        ReceiptValidationResult result;
        result.transactionId = entry.value(QStringLiteral("transaction_id")).toVariant().toString();
        result.purchaseDate = parseDate(entry, QStringLiteral("purchase_date"));
        result.expirationDate = parseDate(entry, QStringLiteral("expiration_date"));
        result.revocationDate = parseDate(entry, QStringLiteral("revocation_date"));
        result.originalPurchaseDate = parseDate(entry, QStringLiteral("original_purchase_date"));
        result.environment = entry.value(QStringLiteral("environment")).toString(QStringLiteral("production"));
        if (!result.purchaseDate.isValid()) {
            qCWarning(lcPurchase) << "Skipping receipt entry without purchase date for" << productId;
            continue;
        }
        if (!latest || latest->purchaseDate < result.purchaseDate)
            latest = result;
    }
    return latest;
}

bool ReceiptFileValidator::refreshReceipt(QString* errorMessage)
{
    if (m_path.isEmpty() || !QFile::exists(m_path)) {
        if (errorMessage)
            *errorMessage = QStringLiteral("receipt file %1 not found").arg(m_path);
        return false;
    }
    QString error;
    if (!readReceipts(m_path, &error)) {
        if (errorMessage)
            *errorMessage = error;
        return false;
    }
    return true;
}
