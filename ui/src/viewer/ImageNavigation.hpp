#pragma once

#include <QMetaType>
#include <QString>

#include <optional>

enum class NavigationMode {
    LeftRight,
    UpDown,
    PageUpDown,
};

Q_DECLARE_METATYPE(NavigationMode)

namespace pixor::viewer {

struct NavigationKeys {
    int previous = 0;
    int next = 0;
};

QString navigationModeName(NavigationMode mode);
std::optional<NavigationMode> navigationModeFromName(const QString& name);

//! The plain key pair that navigates under @p mode.
NavigationKeys navigationKeys(NavigationMode mode);

//! Index to show after @p key under @p mode, wrapping at both ends.
//! std::nullopt when the key does not navigate in this mode or the inputs are out of range.
std::optional<int> nextIndex(int key, NavigationMode mode, int currentIndex, int totalCount);

} // namespace pixor::viewer
