#pragma once

#include <QDateTime>
#include <QObject>
#include <QString>

#include <functional>
#include <memory>

#include "app/AlertContent.hpp"
#include "purchase/EntitlementStore.hpp"
#include "purchase/PurchaseBackends.hpp"
#include "purchase/PurchaseConfiguration.hpp"
#include "purchase/PurchaseError.hpp"
#include "purchase/PurchaseState.hpp"

/**
 * @brief Drives the PurchaseState machine from the cached entitlement
 *        snapshot, store transactions and (optionally) receipt validation.
 *
 * All methods run on the GUI thread.
 */
class PurchaseController : public QObject {
    Q_OBJECT
    Q_PROPERTY(QString stateName READ stateName NOTIFY stateChanged)
    Q_PROPERTY(bool entitled READ isEntitled NOTIFY stateChanged)
    Q_PROPERTY(bool trialExpired READ isTrialExpired NOTIFY stateChanged)
    Q_PROPERTY(QDateTime trialEndDate READ trialEndDate NOTIFY stateChanged)
    Q_PROPERTY(bool trialBannerDismissed READ trialBannerDismissed NOTIFY trialBannerDismissedChanged)
    Q_PROPERTY(bool busy READ busy NOTIFY busyChanged)

public:
    static constexpr qint64 kClockSkewToleranceSeconds = 5 * 60;
    static constexpr qint64 kSubscriptionGraceSeconds = 3 * 24 * 60 * 60;

    explicit PurchaseController(const PurchaseConfiguration& configuration, QObject* parent = nullptr);
    ~PurchaseController() override;

    //! Takes effect for the next initialize() or refresh.
    void setConfiguration(const PurchaseConfiguration& configuration);
    void setEntitlementStorePath(const QString& path);
    QString entitlementStorePath() const { return m_store.path(); }
    void setPurchaseStore(const std::shared_ptr<PurchaseStoreInterface>& store);
    void setReceiptValidator(const std::shared_ptr<ReceiptValidatorInterface>& validator);
    void setReceiptValidationEnabled(bool enabled);
    bool receiptValidationEnabled() const { return m_receiptValidationEnabled; }
    void setClockForTesting(std::function<QDateTime()> clock);

    //! Derive the state from the snapshot, then reconcile with the store and receipts.
    void initialize();

    PurchaseState state() const { return m_state; }
    QString stateName() const { return PurchaseState::kindName(m_state.kind()); }
    bool isEntitled() const;
    bool isTrialExpired() const { return m_state.is(PurchaseState::Kind::TrialExpired); }
    QDateTime trialEndDate() const { return m_state.trialStatus().endDate; }
    bool trialBannerDismissed() const { return m_trialBannerDismissed; }
    bool busy() const { return m_busy; }
    const PurchaseConfiguration& configuration() const { return m_configuration; }

    void refreshEntitlements();
    void refreshEntitlements(const QDateTime& now);
    bool handleTransaction(const PurchaseTransaction& transaction);

    bool purchase(PurchaseProductKind kind, PurchaseError* error = nullptr);
    bool restorePurchases(PurchaseError* error = nullptr);
    bool refreshReceipt(PurchaseError* error = nullptr);

    Q_INVOKABLE void purchaseFullVersion();
    Q_INVOKABLE void purchaseSubscription();
    Q_INVOKABLE void restore();
    Q_INVOKABLE void dismissTrialBanner();
    Q_INVOKABLE QString trialRemainingDescription() const;

signals:
    void stateChanged(const PurchaseState& state);
    void trialBannerDismissedChanged();
    void busyChanged();
    void purchaseSucceeded(PurchaseProductKind kind);
    void purchaseFailed(PurchaseError error);
    void alertRaised(const AlertContent& alert);

private:
    QDateTime now() const;
    EntitlementSnapshot loadSnapshotOrEmpty() const;
    void saveSnapshot(const EntitlementSnapshot& snapshot);
    void setState(const PurchaseState& state);
    void setTrialBannerDismissed(bool dismissed, EntitlementSnapshot& snapshot);
    void setBusy(bool busy);

    void startTrial(const QDateTime& now);
    void markTrialConsumed(const QDateTime& originalStart, const QDateTime& now);
    void restoreBannerVisibilityIfNeeded();
    bool applyCachedEntitlementIfAvailable(const EntitlementSnapshot& snapshot, const QDateTime& now);
    void syncCurrentEntitlements();
    void validateReceiptIfNeeded();
    void applyTransaction(const PurchaseTransaction& transaction, PurchaseProductKind kind);

    void recordLifetimePurchase(const QString& productId, const QString& transactionId, const QDateTime& purchaseDate);
    void recordSubscription(const QString& productId, const QString& transactionId, const QDateTime& expirationDate,
                            const QDateTime& purchaseDate);
    void handleRevocation(const QString& productId, const QDateTime& date);
    SubscriptionStatus subscriptionStatusFor(const QString& productId, const QString& transactionId,
                                             const QDateTime& expirationDate, const QDateTime& now) const;

    void reportFailure(PurchaseError error, const QString& detail, bool restoreFlow);

    PurchaseConfiguration m_configuration;
    EntitlementStore m_store;
    std::shared_ptr<PurchaseStoreInterface> m_purchaseStore;
    std::shared_ptr<ReceiptValidatorInterface> m_receiptValidator;
    std::function<QDateTime()> m_clock;

    PurchaseState m_state;
    bool m_trialBannerDismissed = false;
    bool m_receiptValidationEnabled = false;
    bool m_refreshingReceipt = false;
    bool m_busy = false;
};
