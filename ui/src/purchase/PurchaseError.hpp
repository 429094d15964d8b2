#pragma once

#include <QMetaType>
#include <QString>

#include "app/AlertContent.hpp"

enum class PurchaseError {
    ProductUnavailable,
    FailedVerification,
    PurchaseCancelled,
    PurchasePending,
    RestoreFailed,
    ReceiptRefreshFailed,
    Unknown,
};

Q_DECLARE_METATYPE(PurchaseError)

namespace pixor::purchase {

QString errorMessage(PurchaseError error, const QString& detail = QString());

//! Cancelling the store sheet is a user decision, never an error worth an alert.
bool shouldSuppressAlert(PurchaseError error);

AlertContent purchaseFailureAlert(PurchaseError error, const QString& detail = QString());
AlertContent restoreFailureAlert(PurchaseError error, const QString& detail = QString());

} // namespace pixor::purchase
