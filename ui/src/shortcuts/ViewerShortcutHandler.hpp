#pragma once

#include <QObject>
#include <QPointer>

#include "shortcuts/ShortcutRouter.hpp"

class QKeyEvent;
class ShortcutCatalog;
class ViewerSession;
class ViewerSettings;

/**
 * @brief Key handling of a viewer window.
 *
 * Bound catalog actions win over the navigation keys of the configured
 * NavigationMode. Unbound plain keys (arrows, Escape) are only honoured
 * without Ctrl, Alt or Meta held.
 */
class ViewerShortcutHandler : public QObject {
    Q_OBJECT

public:
    ViewerShortcutHandler(ViewerSession* session, ShortcutCatalog* catalog, ViewerSettings* settings,
                          QObject* parent = nullptr);

    bool handleKeyEvent(QKeyEvent* event);

    //! Callable suitable for ShortcutRouter::registerWindow().
    ShortcutRouter::Handler routerHandler();

private:
    bool deleteAllowed(bool primaryKey) const;

    QPointer<ViewerSession> m_session;
    QPointer<ShortcutCatalog> m_catalog;
    QPointer<ViewerSettings> m_settings;
};
