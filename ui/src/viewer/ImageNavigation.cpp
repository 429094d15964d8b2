#include "ImageNavigation.hpp"

namespace pixor::viewer {

QString navigationModeName(NavigationMode mode)
{
    switch (mode) {
    case NavigationMode::LeftRight:
        return QStringLiteral("leftRight");
    case NavigationMode::UpDown:
        return QStringLiteral("upDown");
    case NavigationMode::PageUpDown:
        return QStringLiteral("pageUpDown");
    }
    return QStringLiteral("leftRight");
}

std::optional<NavigationMode> navigationModeFromName(const QString& name)
{
    for (NavigationMode mode : {NavigationMode::LeftRight, NavigationMode::UpDown, NavigationMode::PageUpDown}) {
        if (navigationModeName(mode).compare(name, Qt::CaseInsensitive) == 0)
            return mode;
    }
    return std::nullopt;
}

NavigationKeys navigationKeys(NavigationMode mode)
{
    switch (mode) {
    case NavigationMode::LeftRight:
        break;
    case NavigationMode::UpDown:
        return {Qt::Key_Up, Qt::Key_Down};
    case NavigationMode::PageUpDown:
        return {Qt::Key_PageUp, Qt::Key_PageDown};
    }
    return {Qt::Key_Left, Qt::Key_Right};
}

std::optional<int> nextIndex(int key, NavigationMode mode, int currentIndex, int totalCount)
{
    if (totalCount <= 0 || currentIndex < 0 || currentIndex >= totalCount)
        return std::nullopt;

    const NavigationKeys keys = navigationKeys(mode);
    if (key == keys.previous)
        return (currentIndex - 1 + totalCount) % totalCount;
    if (key == keys.next)
        return (currentIndex + 1) % totalCount;
    return std::nullopt;
}

} // namespace pixor::viewer
