#include "PurchaseConfiguration.hpp"

#include <QByteArray>
#include <QLoggingCategory>
#include <QtGlobal>

Q_DECLARE_LOGGING_CATEGORY(lcPurchase)

namespace {

constexpr auto kLifetimeIdEnv = "PIXOR_IAP_LIFETIME_ID";
constexpr auto kLegacyProductIdEnv = "PIXOR_IAP_PRODUCT_ID";
constexpr auto kSubscriptionIdEnv = "PIXOR_IAP_SUBSCRIPTION_ID";
constexpr auto kTrialDaysEnv = "PIXOR_TRIAL_DAYS";

QString envString(const char* name)
{
    if (!qEnvironmentVariableIsSet(name))
        return {};
    return qEnvironmentVariable(name).trimmed();
}

} // namespace

QList<PurchaseProductConfiguration> PurchaseConfiguration::allProducts() const
{
    QList<PurchaseProductConfiguration> products;
    if (subscription)
        products.append(*subscription);
    if (lifetime)
        products.append(*lifetime);
    return products;
}

std::optional<PurchaseProductConfiguration> PurchaseConfiguration::configurationFor(const QString& productId) const
{
    for (const auto& product : allProducts()) {
        if (product.identifier == productId)
            return product;
    }
    return std::nullopt;
}

PurchaseConfiguration PurchaseConfiguration::loadDefault(int trialDays)
{
    int days = trialDays;
    const QString daysEnv = envString(kTrialDaysEnv);
    if (!daysEnv.isEmpty()) {
        bool ok = false;
        const int parsed = daysEnv.toInt(&ok);
        if (ok && parsed >= 0)
            days = parsed;
        else
            qCWarning(lcPurchase) << "Ignoring invalid" << kTrialDaysEnv << "value" << daysEnv;
    }

    QString lifetimeId = envString(kLifetimeIdEnv);
    if (lifetimeId.isEmpty())
        lifetimeId = envString(kLegacyProductIdEnv);
    if (lifetimeId.isEmpty())
        lifetimeId = QStringLiteral("app.pixor.fullversion");

    QString subscriptionId = envString(kSubscriptionIdEnv);
    if (subscriptionId.isEmpty())
        subscriptionId = QStringLiteral("app.pixor.subscription.yearly");

    PurchaseConfiguration configuration;
    configuration.trialDurationSeconds = static_cast<qint64>(days) * 24 * 60 * 60;
    configuration.lifetime = PurchaseProductConfiguration{lifetimeId, PurchaseProductKind::Lifetime, 0};
    configuration.subscription = PurchaseProductConfiguration{subscriptionId, PurchaseProductKind::Subscription,
                                                             configuration.trialDurationSeconds};
    return configuration;
}
