#include <QtTest/QtTest>

#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>

#include "purchase/EntitlementStore.hpp"

namespace {

bool writeRaw(const QString& path, const QByteArray& payload)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return false;
    return file.write(payload) == payload.size();
}

} // namespace

class EntitlementStoreTest : public QObject {
    Q_OBJECT

private slots:
    void missingFileHasNoSnapshot();
    void savesAndRestoresSnapshot();
    void emptySnapshotIsTreatedAsAbsent();
    void flagsAloneKeepSnapshot();
    void corruptFileIsIgnored();
    void migratesOlderSchema();
    void clearRemovesFile();
    void saveWithoutPathFails();
};

void EntitlementStoreTest::missingFileHasNoSnapshot()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const EntitlementStore store(dir.filePath(QStringLiteral("entitlements.json")));
    QString error;
    QVERIFY(!store.load(&error).has_value());
    QVERIFY(error.isEmpty());
    QVERIFY(!EntitlementStore().load().has_value());
}

void EntitlementStoreTest::savesAndRestoresSnapshot()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const EntitlementStore store(dir.filePath(QStringLiteral("nested/entitlements.json")));

    const QDateTime start = QDateTime(QDate(2024, 5, 1), QTime(8, 30, 15, 250), Qt::UTC);
    EntitlementSnapshot snapshot;
    snapshot.trialStartDate = start;
    snapshot.trialEndDate = start.addDays(14);
    snapshot.subscriptionExpirationDate = start.addYears(1);
    snapshot.subscriptionProductId = QStringLiteral("pixor.yearly");
    snapshot.subscriptionTransactionId = QStringLiteral("tx-42");
    snapshot.lastUpdated = start.addSecs(60);
    snapshot.trialBannerDismissed = true;

    QString error;
    QVERIFY2(store.save(snapshot, &error), qPrintable(error));

    const auto restored = store.load(&error);
    QVERIFY(restored.has_value());
    QCOMPARE(restored->trialStartDate, snapshot.trialStartDate);
    QCOMPARE(restored->trialEndDate, snapshot.trialEndDate);
    QCOMPARE(restored->subscriptionExpirationDate, snapshot.subscriptionExpirationDate);
    QCOMPARE(restored->subscriptionProductId, snapshot.subscriptionProductId);
    QCOMPARE(restored->subscriptionTransactionId, snapshot.subscriptionTransactionId);
    QCOMPARE(restored->lastUpdated, snapshot.lastUpdated);
    QVERIFY(restored->trialBannerDismissed);
    QVERIFY(!restored->hasLifetime());
    QVERIFY(restored->hasTrial());
    QCOMPARE(restored->schemaVersion, EntitlementSnapshot::kCurrentSchemaVersion);
}

void EntitlementStoreTest::emptySnapshotIsTreatedAsAbsent()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const EntitlementStore store(dir.filePath(QStringLiteral("entitlements.json")));
    QVERIFY(store.save(EntitlementSnapshot()));
    QVERIFY(QFile::exists(store.path()));
    QVERIFY(!store.load().has_value());
}

void EntitlementStoreTest::flagsAloneKeepSnapshot()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const EntitlementStore store(dir.filePath(QStringLiteral("entitlements.json")));

    EntitlementSnapshot snapshot;
    snapshot.legacyTrialConsumed = true;
    snapshot.legacyTrialStartedAt = QDateTime(QDate(2023, 1, 1), QTime(0, 0), Qt::UTC);
    QVERIFY(store.save(snapshot));

    const auto restored = store.load();
    QVERIFY(restored.has_value());
    QVERIFY(restored->legacyTrialConsumed);
    QCOMPARE(restored->legacyTrialStartedAt, snapshot.legacyTrialStartedAt);
    QVERIFY(restored->isEmpty());
}

void EntitlementStoreTest::corruptFileIsIgnored()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("entitlements.json"));
    QVERIFY(writeRaw(path, "{\"trialStartDate\": "));

    const EntitlementStore store(path);
    QString error;
    QVERIFY(!store.load(&error).has_value());
    QVERIFY(!error.isEmpty());

    QVERIFY(writeRaw(path, "[]"));
    QVERIFY(!store.load(&error).has_value());
}

void EntitlementStoreTest::migratesOlderSchema()
{
    QJsonObject legacy;
    legacy.insert(QStringLiteral("schemaVersion"), 1);
    legacy.insert(QStringLiteral("lifetimePurchaseDate"), QStringLiteral("2022-02-03T04:05:06Z"));
    legacy.insert(QStringLiteral("lifetimeProductId"), QStringLiteral("pixor.lifetime"));

    const QDateTime now = QDateTime::currentDateTimeUtc();
    const EntitlementSnapshot snapshot = EntitlementSnapshot::fromJson(legacy, now);
    QCOMPARE(snapshot.schemaVersion, EntitlementSnapshot::kCurrentSchemaVersion);
    QVERIFY(snapshot.hasLifetime());
    QCOMPARE(snapshot.lifetimePurchaseDate, QDateTime(QDate(2022, 2, 3), QTime(4, 5, 6), Qt::UTC));
    // Without a stored timestamp the purchase date stands in.
    QCOMPARE(snapshot.lastUpdated, snapshot.lifetimePurchaseDate);
    QVERIFY(!snapshot.trialBannerDismissed);

    const EntitlementSnapshot blank = EntitlementSnapshot::fromJson(QJsonObject(), now);
    QCOMPARE(blank.lastUpdated, now);
    QVERIFY(blank.isEmpty());
}

void EntitlementStoreTest::clearRemovesFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const EntitlementStore store(dir.filePath(QStringLiteral("entitlements.json")));

    EntitlementSnapshot snapshot;
    snapshot.lifetimePurchaseDate = QDateTime::currentDateTimeUtc();
    QVERIFY(store.save(snapshot));
    QVERIFY(store.clear());
    QVERIFY(!QFile::exists(store.path()));
    QVERIFY(store.clear());
}

void EntitlementStoreTest::saveWithoutPathFails()
{
    const EntitlementStore store;
    QString error;
    QVERIFY(!store.save(EntitlementSnapshot(), &error));
    QVERIFY(!error.isEmpty());
}

QTEST_GUILESS_MAIN(EntitlementStoreTest)
#include "EntitlementStoreTest.moc"
