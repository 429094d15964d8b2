#pragma once

#include <QString>

#include "purchase/PurchaseBackends.hpp"

/**
 * @brief Receipt validator backed by a local JSON document.
 *
 * Expected layout:
 * @code
 * {"receipts": [{"product_id": "...", "transaction_id": "...",
 *                "purchase_date": "2024-01-01T00:00:00Z", "expiration_date": "...",
 *                "revocation_date": "...", "original_purchase_date": "...",
 *                "environment": "production"}]}
 * @endcode
 * The latest purchase wins when a product appears more than once.
 */
class ReceiptFileValidator : public ReceiptValidatorInterface {
public:
    explicit ReceiptFileValidator(const QString& path);

    QString path() const { return m_path; }

    std::optional<ReceiptValidationResult> validateReceipt(const QString& productId,
                                                           QString* errorMessage = nullptr) override;
    //! Re-reads the document; fails when it is missing or malformed.
    bool refreshReceipt(QString* errorMessage = nullptr) override;

private:
    QString m_path;
};
