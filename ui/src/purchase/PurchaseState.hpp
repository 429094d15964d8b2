#pragma once

#include <QDateTime>
#include <QMetaType>
#include <QString>

struct TrialStatus {
    QDateTime startDate;
    QDateTime endDate;

    bool operator==(const TrialStatus& other) const
    {
        return startDate == other.startDate && endDate == other.endDate;
    }
    bool operator!=(const TrialStatus& other) const { return !(*this == other); }
};

struct SubscriptionStatus {
    QString productId;
    QString transactionId;     // empty when unknown
    QDateTime expirationDate;  // invalid when the subscription does not expire
    bool isInGracePeriod = false;

    bool operator==(const SubscriptionStatus& other) const
    {
        return productId == other.productId && transactionId == other.transactionId
            && expirationDate == other.expirationDate && isInGracePeriod == other.isInGracePeriod;
    }
    bool operator!=(const SubscriptionStatus& other) const { return !(*this == other); }
};

struct LifetimeStatus {
    QString productId;
    QString transactionId;
    QDateTime purchaseDate;

    bool operator==(const LifetimeStatus& other) const
    {
        return productId == other.productId && transactionId == other.transactionId
            && purchaseDate == other.purchaseDate;
    }
    bool operator!=(const LifetimeStatus& other) const { return !(*this == other); }
};

enum class RevocationReason {
    Refunded,
    ValidationFailed,
    DeveloperAction,
    Unknown,
};

/**
 * @brief Aggregated entitlement state of the application.
 *
 * Exactly one variant is active. Instances are only built through the named
 * factories, so a payload always belongs to the active variant; accessors for
 * other variants return default-constructed values.
 */
class PurchaseState {
public:
    enum class Kind {
        Unknown,
        Onboarding,
        Trial,
        TrialExpired,
        Subscriber,
        SubscriberLapsed,
        Lifetime,
        Revoked,
    };

    PurchaseState() = default;

    static PurchaseState unknown();
    static PurchaseState onboarding();
    static PurchaseState trial(const TrialStatus& status);
    static PurchaseState trialExpired(const TrialStatus& status);
    static PurchaseState subscriber(const SubscriptionStatus& status);
    static PurchaseState subscriberLapsed(const SubscriptionStatus& status);
    static PurchaseState lifetime(const LifetimeStatus& status);
    static PurchaseState revoked(RevocationReason reason);

    Kind kind() const { return m_kind; }
    bool is(Kind kind) const { return m_kind == kind; }

    TrialStatus trialStatus() const;
    SubscriptionStatus subscriptionStatus() const;
    LifetimeStatus lifetimeStatus() const;
    RevocationReason revocationReason() const;

    //! Whether the state grants the full feature set at @p now.
    bool isEntitled(const QDateTime& now) const;

    QString toString() const;
    static QString kindName(Kind kind);

    bool operator==(const PurchaseState& other) const;
    bool operator!=(const PurchaseState& other) const { return !(*this == other); }

private:
    explicit PurchaseState(Kind kind)
        : m_kind(kind)
    {
    }

    Kind m_kind = Kind::Unknown;
    TrialStatus m_trial;
    SubscriptionStatus m_subscription;
    LifetimeStatus m_lifetime;
    RevocationReason m_revocation = RevocationReason::Unknown;
};

Q_DECLARE_METATYPE(PurchaseState)
