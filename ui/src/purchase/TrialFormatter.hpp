#pragma once

#include <QDateTime>
#include <QString>

namespace pixor::purchase {

//! Human readable time left in the trial ("2 d 4 h", "3 h 12 min", "5 min").
QString trialRemainingDescription(const QDateTime& now, const QDateTime& endDate);

} // namespace pixor::purchase
