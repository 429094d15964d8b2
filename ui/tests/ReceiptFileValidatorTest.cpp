#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "purchase/ReceiptFileValidator.hpp"

namespace {

bool writeRaw(const QString& path, const QByteArray& payload)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return false;
    return file.write(payload) == payload.size();
}

} // namespace

class ReceiptFileValidatorTest : public QObject {
    Q_OBJECT

private slots:
    void latestPurchaseWins();
    void missingProductHasNoReceipt();
    void missingFileIsNotAnError();
    void malformedDocumentIsReported();
    void refreshRequiresReadableFile();
};

void ReceiptFileValidatorTest::latestPurchaseWins()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("receipt.json"));
    QVERIFY(writeRaw(path, R"({"receipts": [
        {"product_id": "pixor.yearly", "transaction_id": "old", "purchase_date": "2023-01-01T00:00:00Z",
         "expiration_date": "2024-01-01T00:00:00Z"},
        {"product_id": "pixor.yearly", "transaction_id": 1002, "purchase_date": "2024-01-01T00:00:00Z",
         "expiration_date": "2025-01-01T00:00:00Z", "environment": "sandbox"},
        {"product_id": "pixor.yearly", "transaction_id": "undated"},
        {"product_id": "pixor.lifetime", "transaction_id": "life", "purchase_date": 1700000000000,
         "revocation_date": "2024-02-02T10:00:00.500Z"}
    ]})"));

    ReceiptFileValidator validator(path);
    QString error;
    const auto yearly = validator.validateReceipt(QStringLiteral("pixor.yearly"), &error);
    QVERIFY2(yearly.has_value(), qPrintable(error));
    QCOMPARE(yearly->transactionId, QStringLiteral("1002"));
    QCOMPARE(yearly->expirationDate, QDateTime(QDate(2025, 1, 1), QTime(0, 0), Qt::UTC));
    QCOMPARE(yearly->environment, QStringLiteral("sandbox"));

    const auto lifetime = validator.validateReceipt(QStringLiteral("pixor.lifetime"));
    QVERIFY(lifetime.has_value());
    QCOMPARE(lifetime->purchaseDate, QDateTime::fromMSecsSinceEpoch(1700000000000, Qt::UTC));
    QCOMPARE(lifetime->revocationDate, QDateTime(QDate(2024, 2, 2), QTime(10, 0, 0, 500), Qt::UTC));
    QCOMPARE(lifetime->environment, QStringLiteral("production"));
}

void ReceiptFileValidatorTest::missingProductHasNoReceipt()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("receipt.json"));
    QVERIFY(writeRaw(path, R"({"receipts": []})"));

    ReceiptFileValidator validator(path);
    QString error = QStringLiteral("stale");
    QVERIFY(!validator.validateReceipt(QStringLiteral("pixor.yearly"), &error).has_value());
    QVERIFY(error.isEmpty());
}

void ReceiptFileValidatorTest::missingFileIsNotAnError()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    ReceiptFileValidator validator(dir.filePath(QStringLiteral("absent.json")));
    QString error;
    QVERIFY(!validator.validateReceipt(QStringLiteral("pixor.yearly"), &error).has_value());
    QVERIFY(error.isEmpty());
}

void ReceiptFileValidatorTest::malformedDocumentIsReported()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("receipt.json"));

    QVERIFY(writeRaw(path, "{\"receipts\": ["));
    ReceiptFileValidator validator(path);
    QString error;
    QVERIFY(!validator.validateReceipt(QStringLiteral("pixor.yearly"), &error).has_value());
    QVERIFY(!error.isEmpty());

    QVERIFY(writeRaw(path, R"({"purchases": []})"));
    QVERIFY(!validator.validateReceipt(QStringLiteral("pixor.yearly"), &error).has_value());
    QVERIFY(error.contains(QStringLiteral("receipts")));
}

void ReceiptFileValidatorTest::refreshRequiresReadableFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("receipt.json"));
    ReceiptFileValidator validator(path);

    QString error;
    QVERIFY(!validator.refreshReceipt(&error));
    QVERIFY(error.contains(QStringLiteral("not found")));

    QVERIFY(writeRaw(path, "not json"));
    QVERIFY(!validator.refreshReceipt(&error));

    QVERIFY(writeRaw(path, R"({"receipts": []})"));
    QVERIFY(validator.refreshReceipt(&error));
}

QTEST_GUILESS_MAIN(ReceiptFileValidatorTest)
#include "ReceiptFileValidatorTest.moc"
