#pragma once

#include <QList>
#include <QString>

#include <optional>

enum class PurchaseProductKind {
    Subscription,
    Lifetime,
};

struct PurchaseProductConfiguration {
    QString identifier;
    PurchaseProductKind kind = PurchaseProductKind::Lifetime;
    qint64 introductoryTrialSeconds = 0;
};

struct PurchaseConfiguration {
    std::optional<PurchaseProductConfiguration> subscription;
    std::optional<PurchaseProductConfiguration> lifetime;
    qint64 trialDurationSeconds = 7 * 24 * 60 * 60;

    QList<PurchaseProductConfiguration> allProducts() const;
    std::optional<PurchaseProductConfiguration> configurationFor(const QString& productId) const;

    //! Product identifiers and trial length from PIXOR_IAP_* / PIXOR_TRIAL_DAYS, falling back to built-in ids.
    static PurchaseConfiguration loadDefault(int trialDays = 7);
};
