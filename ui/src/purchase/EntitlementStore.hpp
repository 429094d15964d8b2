#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>

#include <optional>

struct EntitlementSnapshot {
    static constexpr int kCurrentSchemaVersion = 3;

    int schemaVersion = kCurrentSchemaVersion;
    QDateTime trialStartDate;
    QDateTime trialEndDate;
    QDateTime lifetimePurchaseDate;
    QString lifetimeTransactionId;
    QString lifetimeProductId;
    QDateTime subscriptionExpirationDate;
    QString subscriptionTransactionId;
    QString subscriptionProductId;
    QDateTime lastUpdated;

    bool trialBannerDismissed = false;
    bool legacyTrialConsumed = false;
    QDateTime legacyTrialStartedAt;

    bool hasTrial() const { return trialStartDate.isValid() && trialEndDate.isValid(); }
    bool hasLifetime() const { return lifetimePurchaseDate.isValid(); }
    bool hasSubscription() const { return subscriptionExpirationDate.isValid(); }
    bool isEmpty() const { return !hasLifetime() && !trialStartDate.isValid() && !hasSubscription(); }

    QJsonObject toJson() const;
    static EntitlementSnapshot fromJson(const QJsonObject& object, const QDateTime& now);
};

/**
 * @brief Local cache of entitlement data, stored as a JSON document.
 *
 * Writes go through QSaveFile so an interrupted save leaves the previous
 * snapshot intact. The store keeps no state besides its path; every call
 * reads or writes the file.
 */
class EntitlementStore {
public:
    explicit EntitlementStore(const QString& path = QString());

    QString path() const { return m_path; }
    void setPath(const QString& path);

    //! Returns std::nullopt when no snapshot exists or the file holds no entitlement data.
    std::optional<EntitlementSnapshot> load(QString* errorMessage = nullptr) const;
    bool save(const EntitlementSnapshot& snapshot, QString* errorMessage = nullptr) const;
    bool clear(QString* errorMessage = nullptr) const;

private:
    QString m_path;
};
