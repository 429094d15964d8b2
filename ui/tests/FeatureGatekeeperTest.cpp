#include <QtTest/QtTest>
#include <QSignalSpy>

#include "purchase/FeatureGatekeeper.hpp"

namespace {

const QList<AppFeature> kAllFeatures = {AppFeature::Transform, AppFeature::Crop,      AppFeature::Generic,
                                        AppFeature::Exif,      AppFeature::Slideshow, AppFeature::Tags};

QList<PurchaseState> everyState(const QDateTime& now)
{
    const TrialStatus trial{now.addDays(-20), now.addDays(-6)};
    const SubscriptionStatus lapsed{QStringLiteral("pixor.yearly"), QStringLiteral("t"), now.addDays(-1), false};
    return {PurchaseState::unknown(),
            PurchaseState::onboarding(),
            PurchaseState::trial({now, now.addDays(14)}),
            PurchaseState::trialExpired(trial),
            PurchaseState::subscriber({QStringLiteral("pixor.yearly"), QStringLiteral("t"), now.addDays(30), false}),
            PurchaseState::subscriberLapsed(lapsed),
            PurchaseState::lifetime({QStringLiteral("pixor.lifetime"), QStringLiteral("l"), now}),
            PurchaseState::revoked(RevocationReason::Refunded)};
}

} // namespace

class FeatureGatekeeperTest : public QObject {
    Q_OBJECT

private slots:
    void freeFeaturesAreAlwaysEntitled();
    void trialExpiredLocksPaidFeatures();
    void entitledStatesUnlockEverything();
    void performRunsOrRequestsUpgrade();
    void genericPromptBecomesTrialExpired();
    void subscriptionExpiryFollowsClock();
    void policyFromNamesReportsUnknownNames();
    void qmlLookupByName();
};

void FeatureGatekeeperTest::freeFeaturesAreAlwaysEntitled()
{
    const QDateTime now = QDateTime::currentDateTimeUtc();
    FeatureGatekeeper gatekeeper(FeatureAccessPolicy{{AppFeature::Crop, AppFeature::Exif}});

    for (const PurchaseState& state : everyState(now)) {
        gatekeeper.setPurchaseState(state);
        QVERIFY2(gatekeeper.isEntitled(AppFeature::Crop), qPrintable(state.toString()));
        QVERIFY2(gatekeeper.isEntitled(AppFeature::Exif), qPrintable(state.toString()));
    }
}

void FeatureGatekeeperTest::trialExpiredLocksPaidFeatures()
{
    const QDateTime now = QDateTime::currentDateTimeUtc();
    FeatureGatekeeper gatekeeper(FeatureAccessPolicy{{AppFeature::Crop}});
    gatekeeper.setPurchaseState(PurchaseState::trialExpired({now.addDays(-20), now.addDays(-6)}));

    QVERIFY(!gatekeeper.hasFullAccess());
    for (AppFeature feature : kAllFeatures) {
        if (feature == AppFeature::Crop)
            continue;
        QVERIFY2(!gatekeeper.isEntitled(feature), qPrintable(pixor::purchase::featureName(feature)));
    }
}

void FeatureGatekeeperTest::entitledStatesUnlockEverything()
{
    const QDateTime now = QDateTime::currentDateTimeUtc();
    FeatureGatekeeper gatekeeper;
    QSignalSpy accessSpy(&gatekeeper, &FeatureGatekeeper::accessChanged);

    gatekeeper.setPurchaseState(PurchaseState::lifetime({QStringLiteral("pixor.lifetime"), QString(), now}));
    QCOMPARE(accessSpy.count(), 1);
    gatekeeper.setPurchaseState(PurchaseState::lifetime({QStringLiteral("pixor.lifetime"), QString(), now}));
    QCOMPARE(accessSpy.count(), 1);

    QVERIFY(gatekeeper.hasFullAccess());
    for (AppFeature feature : kAllFeatures)
        QVERIFY(gatekeeper.isEntitled(feature));
}

void FeatureGatekeeperTest::performRunsOrRequestsUpgrade()
{
    FeatureGatekeeper gatekeeper;
    gatekeeper.setPurchaseState(PurchaseState::onboarding());
    QSignalSpy upgradeSpy(&gatekeeper, &FeatureGatekeeper::upgradeRequested);
    QList<UpgradePromptContext> callbacks;
    gatekeeper.setUpgradeCallback([&](UpgradePromptContext context) { callbacks.append(context); });

    bool ran = false;
    QVERIFY(!gatekeeper.perform(AppFeature::Slideshow, UpgradePromptContext::Slideshow, [&]() { ran = true; }));
    QVERIFY(!ran);
    QCOMPARE(upgradeSpy.count(), 1);
    QCOMPARE(upgradeSpy.first().at(0).value<UpgradePromptContext>(), UpgradePromptContext::Slideshow);
    QCOMPARE(callbacks, QList<UpgradePromptContext>{UpgradePromptContext::Slideshow});

    gatekeeper.setPurchaseState(PurchaseState::trial({QDateTime::currentDateTimeUtc(),
                                                      QDateTime::currentDateTimeUtc().addDays(7)}));
    QVERIFY(gatekeeper.perform(AppFeature::Slideshow, UpgradePromptContext::Slideshow, [&]() { ran = true; }));
    QVERIFY(ran);
    QCOMPARE(upgradeSpy.count(), 1);
    QVERIFY(gatekeeper.perform(AppFeature::Tags, UpgradePromptContext::Tags, nullptr));
}

void FeatureGatekeeperTest::genericPromptBecomesTrialExpired()
{
    const QDateTime now = QDateTime::currentDateTimeUtc();
    FeatureGatekeeper gatekeeper;
    QSignalSpy upgradeSpy(&gatekeeper, &FeatureGatekeeper::upgradeRequested);

    gatekeeper.setPurchaseState(PurchaseState::trialExpired({now.addDays(-20), now.addDays(-6)}));
    QVERIFY(!gatekeeper.perform(AppFeature::Generic, UpgradePromptContext::GenericFeature, {}));
    QVERIFY(!gatekeeper.perform(AppFeature::Crop, UpgradePromptContext::Crop, {}));

    gatekeeper.setPurchaseState(PurchaseState::revoked(RevocationReason::Refunded));
    QVERIFY(!gatekeeper.perform(AppFeature::Generic, UpgradePromptContext::GenericFeature, {}));

    QCOMPARE(upgradeSpy.count(), 3);
    QCOMPARE(upgradeSpy.at(0).at(0).value<UpgradePromptContext>(), UpgradePromptContext::TrialExpired);
    QCOMPARE(upgradeSpy.at(1).at(0).value<UpgradePromptContext>(), UpgradePromptContext::Crop);
    QCOMPARE(upgradeSpy.at(2).at(0).value<UpgradePromptContext>(), UpgradePromptContext::GenericFeature);
}

void FeatureGatekeeperTest::subscriptionExpiryFollowsClock()
{
    const QDateTime expiry = QDateTime(QDate(2025, 1, 1), QTime(0, 0), Qt::UTC);
    QDateTime now = expiry.addDays(-1);

    FeatureGatekeeper gatekeeper;
    gatekeeper.setClockForTesting([&now]() { return now; });
    gatekeeper.setPurchaseState(
        PurchaseState::subscriber({QStringLiteral("pixor.yearly"), QStringLiteral("t"), expiry, false}));
    QVERIFY(gatekeeper.isEntitled(AppFeature::Transform));

    now = expiry.addSecs(1);
    QVERIFY(!gatekeeper.isEntitled(AppFeature::Transform));

    gatekeeper.setClockForTesting({});
    QVERIFY(!gatekeeper.isEntitled(AppFeature::Transform));
}

void FeatureGatekeeperTest::policyFromNamesReportsUnknownNames()
{
    QStringList rejected;
    const FeatureAccessPolicy policy = FeatureAccessPolicy::fromNames(
        {QStringLiteral(" Crop "), QStringLiteral("tags"), QStringLiteral("crop"), QStringLiteral("teleport")},
        &rejected);
    QCOMPARE(policy.freeFeatures, (QList<AppFeature>{AppFeature::Crop, AppFeature::Tags}));
    QCOMPARE(rejected, QStringList{QStringLiteral("teleport")});
    QVERIFY(policy.allows(AppFeature::Tags, false));
    QVERIFY(!policy.allows(AppFeature::Exif, false));
    QVERIFY(policy.allows(AppFeature::Exif, true));
}

void FeatureGatekeeperTest::qmlLookupByName()
{
    FeatureGatekeeper gatekeeper(FeatureAccessPolicy{{AppFeature::Exif}});
    gatekeeper.setPurchaseState(PurchaseState::onboarding());
    QVERIFY(gatekeeper.isFeatureEntitled(QStringLiteral("exif")));
    QVERIFY(!gatekeeper.isFeatureEntitled(QStringLiteral("crop")));
    QVERIFY(!gatekeeper.isFeatureEntitled(QStringLiteral("nonsense")));

    for (AppFeature feature : kAllFeatures)
        QCOMPARE(pixor::purchase::featureFromName(pixor::purchase::featureName(feature)),
                 std::optional<AppFeature>(feature));
}

QTEST_GUILESS_MAIN(FeatureGatekeeperTest)
#include "FeatureGatekeeperTest.moc"
