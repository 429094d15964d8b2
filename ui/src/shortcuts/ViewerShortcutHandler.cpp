#include "ViewerShortcutHandler.hpp"

#include <QKeyEvent>
#include <QLoggingCategory>

#include "app/ViewerSettings.hpp"
#include "shortcuts/ShortcutCatalog.hpp"
#include "viewer/ImageNavigation.hpp"
#include "viewer/ViewerSession.hpp"

Q_DECLARE_LOGGING_CATEGORY(lcShortcuts)

namespace {

constexpr Qt::KeyboardModifiers kCommandModifiers = Qt::ControlModifier | Qt::AltModifier | Qt::MetaModifier;

} // namespace

ViewerShortcutHandler::ViewerShortcutHandler(ViewerSession* session, ShortcutCatalog* catalog,
                                             ViewerSettings* settings, QObject* parent)
    : QObject(parent)
    , m_session(session)
    , m_catalog(catalog)
    , m_settings(settings)
{
}

ShortcutRouter::Handler ViewerShortcutHandler::routerHandler()
{
    QPointer<ViewerShortcutHandler> guard(this);
    return [guard](QKeyEvent* event) { return guard && guard->handleKeyEvent(event); };
}

bool ViewerShortcutHandler::deleteAllowed(bool primaryKey) const
{
    if (!m_settings)
        return true;
    return primaryKey ? m_settings->deleteBackspaceEnabled() : m_settings->deleteForwardEnabled();
}

bool ViewerShortcutHandler::handleKeyEvent(QKeyEvent* event)
{
    if (!event || event->type() != QEvent::KeyPress || !m_session)
        return false;

    if (m_catalog) {
        if (const auto action = m_catalog->actionFor(event)) {
            qCDebug(lcShortcuts) << "Shortcut" << ShortcutCatalog::actionName(*action);
            switch (*action) {
            case ShortcutAction::RotateCounterclockwise:
                m_session->rotateCounterclockwise();
                return true;
            case ShortcutAction::RotateClockwise:
                m_session->rotateClockwise();
                return true;
            case ShortcutAction::MirrorHorizontal:
                m_session->mirrorHorizontal();
                return true;
            case ShortcutAction::MirrorVertical:
                m_session->mirrorVertical();
                return true;
            case ShortcutAction::ResetTransform:
                m_session->resetTransform();
                return true;
            case ShortcutAction::NavigatePrevious:
                m_session->navigatePrevious();
                return true;
            case ShortcutAction::NavigateNext:
                m_session->navigateNext();
                return true;
            case ShortcutAction::DeletePrimary:
            case ShortcutAction::DeleteSecondary:
                if (!deleteAllowed(*action == ShortcutAction::DeletePrimary))
                    return false;
                m_session->deleteCurrent();
                return true;
            }
        }
    }

    if (event->modifiers() & kCommandModifiers)
        return false;

    if (event->key() == Qt::Key_Escape)
        return m_session->closeInfoPanel();

    if (!m_catalog && (event->key() == Qt::Key_Backspace || event->key() == Qt::Key_Delete)) {
        if (!deleteAllowed(event->key() == Qt::Key_Backspace))
            return false;
        m_session->deleteCurrent();
        return true;
    }

    const NavigationMode mode = m_settings ? m_settings->navigationMode() : NavigationMode::LeftRight;
    const auto target = pixor::viewer::nextIndex(event->key(), mode, m_session->currentIndex(),
                                                 m_session->imageCount());
    if (!target)
        return false;
    m_session->selectIndex(*target);
    return true;
}
