#include "FeatureGatekeeper.hpp"

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcPurchase)

namespace pixor::purchase {

QString featureName(AppFeature feature)
{
    switch (feature) {
    case AppFeature::Transform:
        return QStringLiteral("transform");
    case AppFeature::Crop:
        return QStringLiteral("crop");
    case AppFeature::Generic:
        return QStringLiteral("generic");
    case AppFeature::Exif:
        return QStringLiteral("exif");
    case AppFeature::Slideshow:
        return QStringLiteral("slideshow");
    case AppFeature::Tags:
        return QStringLiteral("tags");
    }
    return QStringLiteral("generic");
}

std::optional<AppFeature> featureFromName(const QString& name)
{
    const QString normalized = name.trimmed().toLower();
    for (AppFeature feature : {AppFeature::Transform, AppFeature::Crop, AppFeature::Generic, AppFeature::Exif,
                               AppFeature::Slideshow, AppFeature::Tags}) {
        if (featureName(feature) == normalized)
            return feature;
    }
    return std::nullopt;
}

QString upgradeContextName(UpgradePromptContext context)
{
    switch (context) {
    case UpgradePromptContext::GenericFeature:
        return QStringLiteral("generic");
    case UpgradePromptContext::Crop:
        return QStringLiteral("crop");
    case UpgradePromptContext::Transform:
        return QStringLiteral("transform");
    case UpgradePromptContext::Exif:
        return QStringLiteral("exif");
    case UpgradePromptContext::Slideshow:
        return QStringLiteral("slideshow");
    case UpgradePromptContext::Tags:
        return QStringLiteral("tags");
    case UpgradePromptContext::TrialExpired:
        return QStringLiteral("trialExpired");
    }
    return QStringLiteral("generic");
}

} // namespace pixor::purchase

FeatureAccessPolicy FeatureAccessPolicy::fromNames(const QStringList& names, QStringList* rejected)
{
    FeatureAccessPolicy policy;
    for (const QString& name : names) {
        const auto feature = pixor::purchase::featureFromName(name);
        if (!feature) {
            if (rejected)
                rejected->append(name);
            continue;
        }
        if (!policy.freeFeatures.contains(*feature))
            policy.freeFeatures.append(*feature);
    }
    return policy;
}

FeatureGatekeeper::FeatureGatekeeper(QObject* parent)
    : FeatureGatekeeper(FeatureAccessPolicy::standard(), parent)
{
}

FeatureGatekeeper::FeatureGatekeeper(const FeatureAccessPolicy& policy, QObject* parent)
    : QObject(parent)
    , m_policy(policy)
    , m_state(PurchaseState::unknown())
    , m_clock([]() { return QDateTime::currentDateTimeUtc(); })
{
    qRegisterMetaType<UpgradePromptContext>("UpgradePromptContext");
}

void FeatureGatekeeper::setPolicy(const FeatureAccessPolicy& policy)
{
    m_policy = policy;
    emit accessChanged();
}

void FeatureGatekeeper::setPurchaseState(const PurchaseState& state)
{
    if (m_state == state)
        return;
    m_state = state;
    emit accessChanged();
}

void FeatureGatekeeper::setUpgradeCallback(UpgradeCallback callback)
{
    m_upgradeCallback = std::move(callback);
}

void FeatureGatekeeper::setClockForTesting(std::function<QDateTime()> clock)
{
    if (clock)
        m_clock = std::move(clock);
    else
        m_clock = []() { return QDateTime::currentDateTimeUtc(); };
}

QDateTime FeatureGatekeeper::now() const
{
    return m_clock();
}

bool FeatureGatekeeper::isEntitled(AppFeature feature) const
{
    if (m_policy.freeFeatures.contains(feature))
        return true;
    return m_policy.allows(feature, m_state.isEntitled(now()));
}

bool FeatureGatekeeper::hasFullAccess() const
{
    return m_state.isEntitled(now());
}

bool FeatureGatekeeper::isFeatureEntitled(const QString& featureName) const
{
    const auto feature = pixor::purchase::featureFromName(featureName);
    if (!feature) {
        qCWarning(lcPurchase) << "Unknown feature queried from QML:" << featureName;
        return false;
    }
    return isEntitled(*feature);
}

bool FeatureGatekeeper::perform(AppFeature feature, UpgradePromptContext context, const std::function<void()>& action)
{
    if (isEntitled(feature)) {
        if (action)
            action();
        return true;
    }

    const UpgradePromptContext effective =
        m_state.is(PurchaseState::Kind::TrialExpired) && context == UpgradePromptContext::GenericFeature
        ? UpgradePromptContext::TrialExpired
        : context;
    qCInfo(lcPurchase) << "Feature" << pixor::purchase::featureName(feature) << "locked in state"
                       << m_state.toString() << "; requesting upgrade prompt"
                       << pixor::purchase::upgradeContextName(effective);
    emit upgradeRequested(effective);
    if (m_upgradeCallback)
        m_upgradeCallback(effective);
    return false;
}
