#include "PurchaseError.hpp"

#include <QCoreApplication>

namespace pixor::purchase {

QString errorMessage(PurchaseError error, const QString& detail)
{
    switch (error) {
    case PurchaseError::ProductUnavailable:
        return QCoreApplication::translate("PurchaseError", "The product is currently unavailable.");
    case PurchaseError::FailedVerification:
        return QCoreApplication::translate("PurchaseError", "The purchase could not be verified.");
    case PurchaseError::PurchaseCancelled:
        return QCoreApplication::translate("PurchaseError", "The purchase was cancelled.");
    case PurchaseError::PurchasePending:
        return QCoreApplication::translate("PurchaseError", "The purchase is pending approval.");
    case PurchaseError::RestoreFailed:
        return QCoreApplication::translate("PurchaseError", "No previous purchase could be restored.");
    case PurchaseError::ReceiptRefreshFailed:
        return QCoreApplication::translate("PurchaseError", "The purchase receipt could not be refreshed.");
    case PurchaseError::Unknown:
        break;
    }
    if (!detail.isEmpty())
        return detail;
    return QCoreApplication::translate("PurchaseError", "An unknown purchase error occurred.");
}

bool shouldSuppressAlert(PurchaseError error)
{
    return error == PurchaseError::PurchaseCancelled;
}

AlertContent purchaseFailureAlert(PurchaseError error, const QString& detail)
{
    return AlertContent{QCoreApplication::translate("PurchaseError", "Purchase failed"), errorMessage(error, detail)};
}

AlertContent restoreFailureAlert(PurchaseError error, const QString& detail)
{
    return AlertContent{QCoreApplication::translate("PurchaseError", "Restore failed"), errorMessage(error, detail)};
}

} // namespace pixor::purchase
