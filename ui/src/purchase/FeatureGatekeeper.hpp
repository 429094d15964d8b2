#pragma once

#include <QDateTime>
#include <QList>
#include <QMetaType>
#include <QObject>
#include <QString>
#include <QStringList>

#include <functional>
#include <optional>

#include "purchase/PurchaseState.hpp"

enum class AppFeature {
    Transform,
    Crop,
    Generic,
    Exif,
    Slideshow,
    Tags,
};

enum class UpgradePromptContext {
    GenericFeature,
    Crop,
    Transform,
    Exif,
    Slideshow,
    Tags,
    TrialExpired,
};

Q_DECLARE_METATYPE(AppFeature)
Q_DECLARE_METATYPE(UpgradePromptContext)

namespace pixor::purchase {

QString featureName(AppFeature feature);
std::optional<AppFeature> featureFromName(const QString& name);
QString upgradeContextName(UpgradePromptContext context);

} // namespace pixor::purchase

struct FeatureAccessPolicy {
    QList<AppFeature> freeFeatures;

    static FeatureAccessPolicy standard() { return {}; }
    //! Builds a policy from feature names ("crop", "tags", ...); unknown names are reported in @p rejected.
    static FeatureAccessPolicy fromNames(const QStringList& names, QStringList* rejected = nullptr);

    bool allows(AppFeature feature, bool entitled) const { return entitled || freeFeatures.contains(feature); }
};

/**
 * @brief Answers whether a feature is usable right now and guards gated actions.
 *
 * The gatekeeper holds a copy of the current PurchaseState; the application
 * forwards PurchaseController::stateChanged into setPurchaseState().
 */
class FeatureGatekeeper : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool entitled READ hasFullAccess NOTIFY accessChanged)

public:
    using UpgradeCallback = std::function<void(UpgradePromptContext)>;

    explicit FeatureGatekeeper(QObject* parent = nullptr);
    FeatureGatekeeper(const FeatureAccessPolicy& policy, QObject* parent = nullptr);

    void setPolicy(const FeatureAccessPolicy& policy);
    const FeatureAccessPolicy& policy() const { return m_policy; }

    void setPurchaseState(const PurchaseState& state);
    PurchaseState purchaseState() const { return m_state; }

    void setUpgradeCallback(UpgradeCallback callback);
    void setClockForTesting(std::function<QDateTime()> clock);

    bool isEntitled(AppFeature feature) const;
    bool hasFullAccess() const;

    //! Runs @p action when @p feature is usable; otherwise requests an upgrade prompt. Returns whether it ran.
    bool perform(AppFeature feature, UpgradePromptContext context, const std::function<void()>& action);

    Q_INVOKABLE bool isFeatureEntitled(const QString& featureName) const;

signals:
    void accessChanged();
    void upgradeRequested(UpgradePromptContext context);

private:
    QDateTime now() const;

    FeatureAccessPolicy m_policy;
    PurchaseState m_state;
    UpgradeCallback m_upgradeCallback;
    std::function<QDateTime()> m_clock;
};
