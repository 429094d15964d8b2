#include "PurchaseController.hpp"

#include <QLoggingCategory>

#include <algorithm>

#include "purchase/TrialFormatter.hpp"

Q_LOGGING_CATEGORY(lcPurchase, "pixor.purchase")

namespace {

QString productIdOr(const QString& value, const std::optional<PurchaseProductConfiguration>& fallback)
{
    if (!value.isEmpty())
        return value;
    return fallback ? fallback->identifier : QString();
}

} // namespace

PurchaseController::PurchaseController(const PurchaseConfiguration& configuration, QObject* parent)
    : QObject(parent)
    , m_configuration(configuration)
    , m_clock([]() { return QDateTime::currentDateTimeUtc(); })
    , m_state(PurchaseState::unknown())
{
    qRegisterMetaType<PurchaseState>("PurchaseState");
    qRegisterMetaType<PurchaseError>("PurchaseError");
    qRegisterMetaType<AlertContent>("AlertContent");
}

PurchaseController::~PurchaseController() = default;

void PurchaseController::setConfiguration(const PurchaseConfiguration& configuration)
{
    m_configuration = configuration;
}

void PurchaseController::setEntitlementStorePath(const QString& path)
{
    m_store.setPath(path);
}

void PurchaseController::setPurchaseStore(const std::shared_ptr<PurchaseStoreInterface>& store)
{
    m_purchaseStore = store;
}

void PurchaseController::setReceiptValidator(const std::shared_ptr<ReceiptValidatorInterface>& validator)
{
    m_receiptValidator = validator;
}

void PurchaseController::setReceiptValidationEnabled(bool enabled)
{
    m_receiptValidationEnabled = enabled;
}

void PurchaseController::setClockForTesting(std::function<QDateTime()> clock)
{
    if (clock)
        m_clock = std::move(clock);
    else
        m_clock = []() { return QDateTime::currentDateTimeUtc(); };
}

QDateTime PurchaseController::now() const
{
    return m_clock().toUTC();
}

void PurchaseController::initialize()
{
    const auto snapshot = m_store.load();
    if (snapshot)
        m_trialBannerDismissed = snapshot->trialBannerDismissed;
    refreshEntitlements();
    syncCurrentEntitlements();
    validateReceiptIfNeeded();
    qCInfo(lcPurchase) << "Purchase state initialised as" << m_state.toString();
}

bool PurchaseController::isEntitled() const
{
    return m_state.isEntitled(now());
}

QString PurchaseController::trialRemainingDescription() const
{
    if (!m_state.is(PurchaseState::Kind::Trial))
        return {};
    return pixor::purchase::trialRemainingDescription(now(), m_state.trialStatus().endDate);
}

EntitlementSnapshot PurchaseController::loadSnapshotOrEmpty() const
{
    QString error;
    if (auto snapshot = m_store.load(&error))
        return *snapshot;
    EntitlementSnapshot empty;
    empty.trialBannerDismissed = m_trialBannerDismissed;
    return empty;
}

void PurchaseController::saveSnapshot(const EntitlementSnapshot& snapshot)
{
    QString error;
    if (!m_store.save(snapshot, &error))
        qCWarning(lcPurchase) << "Failed to persist entitlement snapshot:" << error;
}

void PurchaseController::setState(const PurchaseState& state)
{
    if (m_state == state)
        return;
    m_state = state;
    qCDebug(lcPurchase) << "Purchase state changed to" << m_state.toString();
    emit stateChanged(m_state);
}

void PurchaseController::setTrialBannerDismissed(bool dismissed, EntitlementSnapshot& snapshot)
{
    snapshot.trialBannerDismissed = dismissed;
    if (m_trialBannerDismissed == dismissed)
        return;
    m_trialBannerDismissed = dismissed;
    emit trialBannerDismissedChanged();
}

void PurchaseController::setBusy(bool busy)
{
    if (m_busy == busy)
        return;
    m_busy = busy;
    emit busyChanged();
}

void PurchaseController::refreshEntitlements()
{
    refreshEntitlements(now());
}

void PurchaseController::refreshEntitlements(const QDateTime& current)
{
    const QDateTime now = current.toUTC();
    std::optional<EntitlementSnapshot> loaded = m_store.load();
    if (!loaded) {
        startTrial(now);
        restoreBannerVisibilityIfNeeded();
        return;
    }
    EntitlementSnapshot snapshot = *loaded;

    if (now.addSecs(kClockSkewToleranceSeconds) < snapshot.lastUpdated) {
        qCWarning(lcPurchase) << "Clock rollback detected; cached timestamp" << snapshot.lastUpdated
                              << "is ahead of" << now;
        if (!snapshot.trialEndDate.isValid())
            snapshot.trialEndDate = snapshot.lastUpdated;
        if (!snapshot.trialStartDate.isValid())
            snapshot.trialStartDate = snapshot.trialEndDate;
        saveSnapshot(snapshot);
        setState(PurchaseState::trialExpired({snapshot.trialStartDate, snapshot.trialEndDate}));
        restoreBannerVisibilityIfNeeded();
        return;
    }

    if (snapshot.hasLifetime()) {
        const LifetimeStatus status{productIdOr(snapshot.lifetimeProductId, m_configuration.lifetime),
                                    snapshot.lifetimeTransactionId, snapshot.lifetimePurchaseDate};
        snapshot.trialStartDate = QDateTime();
        snapshot.trialEndDate = QDateTime();
        snapshot.lastUpdated = now;
        saveSnapshot(snapshot);
        setState(PurchaseState::lifetime(status));
        return;
    }

    if (snapshot.hasSubscription()) {
        const SubscriptionStatus status = subscriptionStatusFor(
            productIdOr(snapshot.subscriptionProductId, m_configuration.subscription),
            snapshot.subscriptionTransactionId, snapshot.subscriptionExpirationDate, now);
        snapshot.lastUpdated = now;
        saveSnapshot(snapshot);
        setState(snapshot.subscriptionExpirationDate > now ? PurchaseState::subscriber(status)
                                                           : PurchaseState::subscriberLapsed(status));
        restoreBannerVisibilityIfNeeded();
        return;
    }

    if (snapshot.hasTrial()) {
        const TrialStatus status{snapshot.trialStartDate, snapshot.trialEndDate};
        snapshot.lastUpdated = now;
        saveSnapshot(snapshot);
        setState(now < snapshot.trialEndDate ? PurchaseState::trial(status) : PurchaseState::trialExpired(status));
        restoreBannerVisibilityIfNeeded();
        return;
    }

    startTrial(now);
    restoreBannerVisibilityIfNeeded();
}

SubscriptionStatus PurchaseController::subscriptionStatusFor(const QString& productId, const QString& transactionId,
                                                             const QDateTime& expirationDate,
                                                             const QDateTime& now) const
{
    SubscriptionStatus status;
    status.productId = productId;
    status.transactionId = transactionId;
    status.expirationDate = expirationDate;
    status.isInGracePeriod = now <= expirationDate.addSecs(kSubscriptionGraceSeconds);
    return status;
}

void PurchaseController::startTrial(const QDateTime& now)
{
    EntitlementSnapshot snapshot = loadSnapshotOrEmpty();
    if (snapshot.legacyTrialConsumed) {
        markTrialConsumed(snapshot.legacyTrialStartedAt.isValid() ? snapshot.legacyTrialStartedAt : now, now);
        return;
    }

    if (snapshot.hasTrial()) {
        const TrialStatus status{snapshot.trialStartDate, snapshot.trialEndDate};
        setState(now < snapshot.trialEndDate ? PurchaseState::trial(status) : PurchaseState::trialExpired(status));
        return;
    }

    const QDateTime trialEnd = now.addSecs(m_configuration.trialDurationSeconds);
    snapshot.trialStartDate = now;
    snapshot.trialEndDate = trialEnd;
    snapshot.lastUpdated = now;
    setTrialBannerDismissed(false, snapshot);
    saveSnapshot(snapshot);
    qCInfo(lcPurchase) << "Started trial ending" << trialEnd;
    setState(PurchaseState::trial({now, trialEnd}));
}

void PurchaseController::markTrialConsumed(const QDateTime& originalStart, const QDateTime& now)
{
    EntitlementSnapshot snapshot = loadSnapshotOrEmpty();
    QDateTime effectiveStart = originalStart;
    if (snapshot.legacyTrialStartedAt.isValid())
        effectiveStart = std::min(originalStart, snapshot.legacyTrialStartedAt);

    const QDateTime trialEnd = effectiveStart.addSecs(m_configuration.trialDurationSeconds);
    snapshot.legacyTrialConsumed = true;
    snapshot.legacyTrialStartedAt = effectiveStart;
    snapshot.trialStartDate = effectiveStart;
    snapshot.trialEndDate = trialEnd;
    snapshot.lastUpdated = now;
    setTrialBannerDismissed(false, snapshot);
    saveSnapshot(snapshot);

    const TrialStatus status{effectiveStart, trialEnd};
    setState(now < trialEnd ? PurchaseState::trial(status) : PurchaseState::trialExpired(status));
}

void PurchaseController::restoreBannerVisibilityIfNeeded()
{
    switch (m_state.kind()) {
    case PurchaseState::Kind::Trial:
    case PurchaseState::Kind::TrialExpired:
    case PurchaseState::Kind::SubscriberLapsed:
        break;
    default:
        return;
    }
    if (!m_trialBannerDismissed)
        return;
    EntitlementSnapshot snapshot = loadSnapshotOrEmpty();
    setTrialBannerDismissed(false, snapshot);
    saveSnapshot(snapshot);
}

void PurchaseController::dismissTrialBanner()
{
    if (m_trialBannerDismissed)
        return;
    EntitlementSnapshot snapshot = loadSnapshotOrEmpty();
    setTrialBannerDismissed(true, snapshot);
    saveSnapshot(snapshot);
}

bool PurchaseController::applyCachedEntitlementIfAvailable(const EntitlementSnapshot& cached, const QDateTime& now)
{
    EntitlementSnapshot snapshot = cached;
    if (snapshot.hasLifetime()) {
        const LifetimeStatus status{productIdOr(snapshot.lifetimeProductId, m_configuration.lifetime),
                                    snapshot.lifetimeTransactionId, snapshot.lifetimePurchaseDate};
        setTrialBannerDismissed(true, snapshot);
        saveSnapshot(snapshot);
        setState(PurchaseState::lifetime(status));
        return true;
    }

    if (snapshot.hasSubscription()) {
        const SubscriptionStatus status = subscriptionStatusFor(
            productIdOr(snapshot.subscriptionProductId, m_configuration.subscription),
            snapshot.subscriptionTransactionId, snapshot.subscriptionExpirationDate, now);
        if (snapshot.subscriptionExpirationDate > now) {
            setTrialBannerDismissed(true, snapshot);
            saveSnapshot(snapshot);
            setState(PurchaseState::subscriber(status));
            return true;
        }
        if (status.isInGracePeriod) {
            setState(PurchaseState::subscriberLapsed(status));
            return true;
        }
    }
    return false;
}

bool PurchaseController::handleTransaction(const PurchaseTransaction& transaction)
{
    const auto config = m_configuration.configurationFor(transaction.productId);
    if (!config) {
        qCDebug(lcPurchase) << "Ignoring transaction for unknown product" << transaction.productId;
        return false;
    }

    if (transaction.revocationDate.isValid()) {
        handleRevocation(transaction.productId, transaction.revocationDate);
        return true;
    }

    applyTransaction(transaction, config->kind);
    validateReceiptIfNeeded();
    return true;
}

void PurchaseController::applyTransaction(const PurchaseTransaction& transaction, PurchaseProductKind kind)
{
    switch (kind) {
    case PurchaseProductKind::Lifetime:
        recordLifetimePurchase(transaction.productId, transaction.transactionId, transaction.purchaseDate);
        break;
    case PurchaseProductKind::Subscription:
        recordSubscription(transaction.productId, transaction.transactionId, transaction.expirationDate,
                           transaction.purchaseDate);
        break;
    }
}

void PurchaseController::recordLifetimePurchase(const QString& productId, const QString& transactionId,
                                                const QDateTime& purchaseDate)
{
    EntitlementSnapshot snapshot = loadSnapshotOrEmpty();
    snapshot.lifetimeProductId = productId;
    snapshot.lifetimeTransactionId = transactionId;
    snapshot.lifetimePurchaseDate = purchaseDate.toUTC();
    snapshot.trialStartDate = QDateTime();
    snapshot.trialEndDate = QDateTime();
    snapshot.lastUpdated = now();
    setTrialBannerDismissed(true, snapshot);
    saveSnapshot(snapshot);

    qCInfo(lcPurchase) << "Recorded lifetime purchase" << productId << transactionId;
    setState(PurchaseState::lifetime({productId, transactionId, purchaseDate.toUTC()}));
}

void PurchaseController::recordSubscription(const QString& productId, const QString& transactionId,
                                            const QDateTime& expirationDate, const QDateTime& purchaseDate)
{
    const QDateTime current = now();
    const QDateTime effectiveExpiration = expirationDate.isValid()
        ? expirationDate.toUTC()
        : purchaseDate.toUTC().addSecs(m_configuration.trialDurationSeconds);

    EntitlementSnapshot snapshot = loadSnapshotOrEmpty();
    snapshot.subscriptionProductId = productId;
    snapshot.subscriptionTransactionId = transactionId;
    snapshot.subscriptionExpirationDate = effectiveExpiration;
    snapshot.lastUpdated = current;

    const SubscriptionStatus status = subscriptionStatusFor(productId, transactionId, effectiveExpiration, current);
    const bool active = effectiveExpiration > current;
    if (active)
        setTrialBannerDismissed(true, snapshot);
    saveSnapshot(snapshot);

    qCInfo(lcPurchase) << "Recorded subscription" << productId << "expiring" << effectiveExpiration;
    setState(active ? PurchaseState::subscriber(status) : PurchaseState::subscriberLapsed(status));
}

void PurchaseController::handleRevocation(const QString& productId, const QDateTime& date)
{
    EntitlementSnapshot snapshot = loadSnapshotOrEmpty();
    if (snapshot.lifetimeProductId == productId) {
        snapshot.lifetimeProductId.clear();
        snapshot.lifetimeTransactionId.clear();
        snapshot.lifetimePurchaseDate = QDateTime();
    }
    if (snapshot.subscriptionProductId == productId) {
        snapshot.subscriptionProductId.clear();
        snapshot.subscriptionTransactionId.clear();
        snapshot.subscriptionExpirationDate = QDateTime();
    }
    snapshot.lastUpdated = date.toUTC();
    setTrialBannerDismissed(false, snapshot);
    saveSnapshot(snapshot);

    qCWarning(lcPurchase) << "Entitlement for" << productId << "revoked at" << date;
    setState(PurchaseState::revoked(RevocationReason::Refunded));
}

void PurchaseController::syncCurrentEntitlements()
{
    if (m_purchaseStore) {
        QStringList productIds;
        for (const auto& product : m_configuration.allProducts())
            productIds.append(product.identifier);
        const QList<PurchaseTransaction> transactions = m_purchaseStore->currentEntitlements(productIds);
        for (const auto& transaction : transactions) {
            const auto config = m_configuration.configurationFor(transaction.productId);
            if (!config)
                continue;
            if (transaction.revocationDate.isValid())
                handleRevocation(transaction.productId, transaction.revocationDate);
            else
                applyTransaction(transaction, config->kind);
        }
    }

    if (m_state.is(PurchaseState::Kind::Unknown))
        refreshEntitlements();
}

void PurchaseController::validateReceiptIfNeeded()
{
    if (!m_receiptValidationEnabled || !m_receiptValidator)
        return;

    const QDateTime current = now();
    for (const auto& product : m_configuration.allProducts()) {
        QString error;
        const auto result = m_receiptValidator->validateReceipt(product.identifier, &error);
        if (!result) {
            if (error.isEmpty())
                qCDebug(lcPurchase) << "Receipt validation skipped for" << product.identifier << ": missing receipt";
            else
                qCWarning(lcPurchase) << "Receipt validation failed for" << product.identifier << ":" << error;
            continue;
        }

        if (result->revocationDate.isValid()) {
            handleRevocation(product.identifier, result->revocationDate);
            continue;
        }

        if (result->originalPurchaseDate.isValid() && result->originalPurchaseDate < current) {
            const EntitlementSnapshot snapshot = loadSnapshotOrEmpty();
            if (!snapshot.legacyTrialStartedAt.isValid()
                || result->originalPurchaseDate < snapshot.legacyTrialStartedAt)
                markTrialConsumed(result->originalPurchaseDate.toUTC(), current);
        }

        switch (product.kind) {
        case PurchaseProductKind::Lifetime:
            recordLifetimePurchase(product.identifier, result->transactionId, result->purchaseDate);
            break;
        case PurchaseProductKind::Subscription:
            recordSubscription(product.identifier, result->transactionId, result->expirationDate,
                               result->purchaseDate);
            break;
        }
    }
}

void PurchaseController::reportFailure(PurchaseError error, const QString& detail, bool restoreFlow)
{
    qCWarning(lcPurchase) << "Purchase flow failed:" << pixor::purchase::errorMessage(error, detail);
    emit purchaseFailed(error);
    if (pixor::purchase::shouldSuppressAlert(error))
        return;
    emit alertRaised(restoreFlow ? pixor::purchase::restoreFailureAlert(error, detail)
                                 : pixor::purchase::purchaseFailureAlert(error, detail));
}

bool PurchaseController::purchase(PurchaseProductKind kind, PurchaseError* error)
{
    const auto& product = kind == PurchaseProductKind::Lifetime ? m_configuration.lifetime
                                                                : m_configuration.subscription;
    auto fail = [this, error](PurchaseError code, const QString& detail) {
        if (error)
            *error = code;
        reportFailure(code, detail, false);
        setBusy(false);
        return false;
    };

    if (!product || product->identifier.isEmpty() || !m_purchaseStore)
        return fail(PurchaseError::ProductUnavailable, QString());

    setBusy(true);
    const PurchaseStoreInterface::PurchaseResult result = m_purchaseStore->purchase(product->identifier);
    switch (result.outcome) {
    case PurchaseStoreInterface::Outcome::Success:
        break;
    case PurchaseStoreInterface::Outcome::Cancelled:
        return fail(PurchaseError::PurchaseCancelled, result.errorMessage);
    case PurchaseStoreInterface::Outcome::Pending:
        return fail(PurchaseError::PurchasePending, result.errorMessage);
    case PurchaseStoreInterface::Outcome::Unavailable:
        return fail(PurchaseError::ProductUnavailable, result.errorMessage);
    case PurchaseStoreInterface::Outcome::Failed:
        return fail(PurchaseError::Unknown, result.errorMessage);
    }

    if (!result.verified)
        return fail(PurchaseError::FailedVerification, result.errorMessage);

    PurchaseTransaction transaction = result.transaction;
    if (transaction.productId.isEmpty())
        transaction.productId = product->identifier;
    if (!transaction.purchaseDate.isValid())
        transaction.purchaseDate = now();
    handleTransaction(transaction);

    setBusy(false);
    emit purchaseSucceeded(kind);
    return true;
}

bool PurchaseController::restorePurchases(PurchaseError* error)
{
    setBusy(true);
    const QDateTime current = now();

    QString syncError;
    const bool synced = m_purchaseStore && m_purchaseStore->sync(&syncError);
    if (synced) {
        syncCurrentEntitlements();
        validateReceiptIfNeeded();
        if (m_state.is(PurchaseState::Kind::Subscriber) || m_state.is(PurchaseState::Kind::Lifetime)) {
            setBusy(false);
            return true;
        }
    } else {
        qCWarning(lcPurchase) << "Store sync failed:" << (m_purchaseStore ? syncError : QStringLiteral("no store"));
    }

    if (auto snapshot = m_store.load(); snapshot && applyCachedEntitlementIfAvailable(*snapshot, current)) {
        setBusy(false);
        return true;
    }

    if (error)
        *error = PurchaseError::RestoreFailed;
    reportFailure(PurchaseError::RestoreFailed, syncError, true);
    setBusy(false);
    return false;
}

bool PurchaseController::refreshReceipt(PurchaseError* error)
{
    if (m_refreshingReceipt)
        return true;
    m_refreshingReceipt = true;

    QString refreshError;
    const bool refreshed = m_receiptValidator && m_receiptValidator->refreshReceipt(&refreshError);
    if (!refreshed) {
        m_refreshingReceipt = false;
        if (error)
            *error = PurchaseError::ReceiptRefreshFailed;
        reportFailure(PurchaseError::ReceiptRefreshFailed, refreshError, true);
        return false;
    }

    syncCurrentEntitlements();
    validateReceiptIfNeeded();
    m_refreshingReceipt = false;
    return true;
}

void PurchaseController::purchaseFullVersion()
{
    purchase(PurchaseProductKind::Lifetime);
}

void PurchaseController::purchaseSubscription()
{
    purchase(PurchaseProductKind::Subscription);
}

void PurchaseController::restore()
{
    restorePurchases();
}
