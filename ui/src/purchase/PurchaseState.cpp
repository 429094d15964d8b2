#include "PurchaseState.hpp"

PurchaseState PurchaseState::unknown()
{
    return PurchaseState(Kind::Unknown);
}

PurchaseState PurchaseState::onboarding()
{
    return PurchaseState(Kind::Onboarding);
}

PurchaseState PurchaseState::trial(const TrialStatus& status)
{
    PurchaseState state(Kind::Trial);
    state.m_trial = status;
    return state;
}

PurchaseState PurchaseState::trialExpired(const TrialStatus& status)
{
    PurchaseState state(Kind::TrialExpired);
    state.m_trial = status;
    return state;
}

PurchaseState PurchaseState::subscriber(const SubscriptionStatus& status)
{
    PurchaseState state(Kind::Subscriber);
    state.m_subscription = status;
    return state;
}

PurchaseState PurchaseState::subscriberLapsed(const SubscriptionStatus& status)
{
    PurchaseState state(Kind::SubscriberLapsed);
    state.m_subscription = status;
    return state;
}

PurchaseState PurchaseState::lifetime(const LifetimeStatus& status)
{
    PurchaseState state(Kind::Lifetime);
    state.m_lifetime = status;
    return state;
}

PurchaseState PurchaseState::revoked(RevocationReason reason)
{
    PurchaseState state(Kind::Revoked);
    state.m_revocation = reason;
    return state;
}

TrialStatus PurchaseState::trialStatus() const
{
    if (m_kind == Kind::Trial || m_kind == Kind::TrialExpired)
        return m_trial;
    return {};
}

SubscriptionStatus PurchaseState::subscriptionStatus() const
{
    if (m_kind == Kind::Subscriber || m_kind == Kind::SubscriberLapsed)
        return m_subscription;
    return {};
}

LifetimeStatus PurchaseState::lifetimeStatus() const
{
    if (m_kind == Kind::Lifetime)
        return m_lifetime;
    return {};
}

RevocationReason PurchaseState::revocationReason() const
{
    if (m_kind == Kind::Revoked)
        return m_revocation;
    return RevocationReason::Unknown;
}

bool PurchaseState::isEntitled(const QDateTime& now) const
{
    switch (m_kind) {
    case Kind::Trial:
    case Kind::Lifetime:
        return true;
    case Kind::Subscriber:
        return m_subscription.isInGracePeriod || !m_subscription.expirationDate.isValid()
            || m_subscription.expirationDate > now;
    case Kind::SubscriberLapsed:
        return m_subscription.isInGracePeriod;
    case Kind::Unknown:
    case Kind::Onboarding:
    case Kind::TrialExpired:
    case Kind::Revoked:
        return false;
    }
    return false;
}

QString PurchaseState::kindName(Kind kind)
{
    switch (kind) {
    case Kind::Unknown:
        return QStringLiteral("unknown");
    case Kind::Onboarding:
        return QStringLiteral("onboarding");
    case Kind::Trial:
        return QStringLiteral("trial");
    case Kind::TrialExpired:
        return QStringLiteral("trialExpired");
    case Kind::Subscriber:
        return QStringLiteral("subscriber");
    case Kind::SubscriberLapsed:
        return QStringLiteral("subscriberLapsed");
    case Kind::Lifetime:
        return QStringLiteral("lifetime");
    case Kind::Revoked:
        return QStringLiteral("revoked");
    }
    return QStringLiteral("unknown");
}

QString PurchaseState::toString() const
{
    const QString name = kindName(m_kind);
    switch (m_kind) {
    case Kind::Trial:
    case Kind::TrialExpired:
        return QStringLiteral("%1(%2 .. %3)")
            .arg(name, m_trial.startDate.toString(Qt::ISODate), m_trial.endDate.toString(Qt::ISODate));
    case Kind::Subscriber:
    case Kind::SubscriberLapsed:
        return QStringLiteral("%1(%2, expires %3%4)")
            .arg(name, m_subscription.productId,
                 m_subscription.expirationDate.isValid() ? m_subscription.expirationDate.toString(Qt::ISODate)
                                                         : QStringLiteral("never"),
                 m_subscription.isInGracePeriod ? QStringLiteral(", grace") : QString());
    case Kind::Lifetime:
        return QStringLiteral("%1(%2)").arg(name, m_lifetime.productId);
    case Kind::Revoked:
        return QStringLiteral("%1(%2)").arg(name).arg(static_cast<int>(m_revocation));
    case Kind::Unknown:
    case Kind::Onboarding:
        break;
    }
    return name;
}

bool PurchaseState::operator==(const PurchaseState& other) const
{
    if (m_kind != other.m_kind)
        return false;
    switch (m_kind) {
    case Kind::Trial:
    case Kind::TrialExpired:
        return m_trial == other.m_trial;
    case Kind::Subscriber:
    case Kind::SubscriberLapsed:
        return m_subscription == other.m_subscription;
    case Kind::Lifetime:
        return m_lifetime == other.m_lifetime;
    case Kind::Revoked:
        return m_revocation == other.m_revocation;
    case Kind::Unknown:
    case Kind::Onboarding:
        return true;
    }
    return true;
}
