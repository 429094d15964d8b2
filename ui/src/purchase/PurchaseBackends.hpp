#pragma once

#include <QDateTime>
#include <QList>
#include <QString>
#include <QStringList>

#include <optional>

//! A store transaction that already passed the platform's signature verification.
struct PurchaseTransaction {
    QString productId;
    QString transactionId;
    QDateTime purchaseDate;
    QDateTime expirationDate;  // subscriptions only
    QDateTime revocationDate;  // set when refunded or revoked
};

/**
 * @brief Seam to the platform app store.
 *
 * Calls are synchronous and made from the GUI thread; implementations that
 * talk to a remote service are expected to run their own event loop or to
 * answer from a local cache.
 */
class PurchaseStoreInterface {
public:
    enum class Outcome {
        Success,
        Cancelled,
        Pending,
        Unavailable,
        Failed,
    };

    struct PurchaseResult {
        Outcome outcome = Outcome::Failed;
        PurchaseTransaction transaction;
        bool verified = false;
        QString errorMessage;
    };

    virtual ~PurchaseStoreInterface() = default;

    virtual PurchaseResult purchase(const QString& productId) = 0;
    virtual bool sync(QString* errorMessage = nullptr) = 0;
    virtual QList<PurchaseTransaction> currentEntitlements(const QStringList& productIds) = 0;
};

struct ReceiptValidationResult {
    QString transactionId;
    QDateTime purchaseDate;
    QDateTime expirationDate;
    QDateTime revocationDate;
    QDateTime originalPurchaseDate;
    QString environment;
};

class ReceiptValidatorInterface {
public:
    virtual ~ReceiptValidatorInterface() = default;

    //! std::nullopt with an empty @p errorMessage means "no receipt for this product".
    virtual std::optional<ReceiptValidationResult> validateReceipt(const QString& productId,
                                                                   QString* errorMessage = nullptr) = 0;
    virtual bool refreshReceipt(QString* errorMessage = nullptr) = 0;
};
