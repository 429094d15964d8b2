#pragma once

#include <QString>
#include <QStringList>

namespace pixor::utils {

//! Expand $VAR, ${VAR} and %VAR% placeholders. Unknown variables are left untouched.
QString expandEnvironmentPlaceholders(const QString& text);

//! Expand '~', environment placeholders and file: URLs, then make the path absolute and clean.
QString expandPath(const QString& path);

//! Cleaned absolute form used as the identity of an image file (deduplication, tag keys).
QString standardizedPath(const QString& path);

//! Numeric-aware, case-insensitive ordering ("img2" < "img10").
bool naturalLessThan(const QString& lhs, const QString& rhs);

//! Tri-state variant of naturalLessThan: negative, zero or positive.
int naturalCompare(const QString& lhs, const QString& rhs);

} // namespace pixor::utils
