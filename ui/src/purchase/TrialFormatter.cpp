#include "TrialFormatter.hpp"

#include <QCoreApplication>
#include <QtGlobal>

namespace pixor::purchase {

QString trialRemainingDescription(const QDateTime& now, const QDateTime& endDate)
{
    const qint64 remaining = qMax<qint64>(0, now.secsTo(endDate));
    if (remaining < 60)
        return QCoreApplication::translate("TrialFormatter", "Less than a minute left");

    const qint64 days = remaining / 86400;
    const qint64 hours = (remaining % 86400) / 3600;
    const qint64 minutes = (remaining % 3600) / 60;

    if (days > 0)
        return QCoreApplication::translate("TrialFormatter", "%1 d %2 h left").arg(days).arg(hours);
    if (hours > 0)
        return QCoreApplication::translate("TrialFormatter", "%1 h %2 min left").arg(hours).arg(minutes);
    return QCoreApplication::translate("TrialFormatter", "%1 min left").arg(minutes);
}

} // namespace pixor::purchase
