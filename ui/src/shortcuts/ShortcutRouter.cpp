#include "ShortcutRouter.hpp"

#include <QCoreApplication>
#include <QEvent>
#include <QGuiApplication>
#include <QInputMethodQueryEvent>
#include <QKeyEvent>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcShortcuts, "pixor.shortcuts")

namespace {

bool isSheetOrDialog(const QWindow* window)
{
    const Qt::WindowType type = window->type();
    return type == Qt::Dialog || type == Qt::Sheet;
}

bool inheritsClass(const QMetaObject* meta, const char* className)
{
    for (; meta; meta = meta->superClass()) {
        if (qstrcmp(meta->className(), className) == 0)
            return true;
    }
    return false;
}

//! Qt Quick popups are items of the window they open in, not windows of their own.
bool hasOpenQuickDialog(const QWindow* window)
{
    const QList<QObject*> children = window->findChildren<QObject*>();
    for (const QObject* child : children) {
        const QMetaObject* meta = child->metaObject();
        if (!inheritsClass(meta, "QQuickPopup") || !child->property("visible").toBool())
            continue;
        if (child->property("modal").toBool() || inheritsClass(meta, "QQuickDialog"))
            return true;
    }
    return false;
}

} // namespace

ShortcutRouter::ShortcutRouter(QObject* parent)
    : QObject(parent)
    , m_interactionCheck(&ShortcutRouter::defaultInteraction)
{
}

ShortcutRouter::~ShortcutRouter()
{
    for (const Entry& entry : std::as_const(m_entries))
        disconnect(entry.destroyedConnection);
    if (m_monitoring && QCoreApplication::instance())
        QCoreApplication::instance()->removeEventFilter(this);
}

QUuid ShortcutRouter::registerWindow(QWindow* window, Handler handler)
{
    pruneDestroyedWindows();
    if (!window) {
        qCWarning(lcShortcuts) << "Refusing to register a null window";
        return {};
    }

    const int existing = indexOf(window);
    if (existing >= 0) {
        m_entries[existing].handler = std::move(handler);
        qCDebug(lcShortcuts) << "Updated handler for already registered window" << window;
        return m_entries.at(existing).token;
    }

    Entry entry;
    entry.token = QUuid::createUuid();
    entry.window = window;
    entry.handler = std::move(handler);
    const QUuid token = entry.token;
    entry.destroyedConnection = connect(window, &QObject::destroyed, this, [this, token]() {
        const int index = indexOf(token);
        if (index >= 0)
            removeAt(index);
    });
    m_entries.append(entry);
    qCDebug(lcShortcuts) << "Registered window" << window << "as" << token;

    updateMonitoring();
    emit entriesChanged();
    return token;
}

void ShortcutRouter::update(const QUuid& token, Handler handler)
{
    pruneDestroyedWindows();
    const int index = indexOf(token);
    if (index < 0) {
        qCDebug(lcShortcuts) << "Ignoring handler update for unknown token" << token;
        return;
    }
    m_entries[index].handler = std::move(handler);
}

void ShortcutRouter::unregister(const QUuid& token)
{
    const int index = indexOf(token);
    if (index >= 0)
        removeAt(index);
    pruneDestroyedWindows();
}

bool ShortcutRouter::dispatch(QEvent* event, QWindow* window)
{
    if (!event || event->type() != QEvent::KeyPress)
        return false;

    pruneDestroyedWindows();
    QWindow* target = window ? window : QGuiApplication::focusWindow();
    if (!target)
        return false;

    const int index = indexOf(target);
    if (index < 0)
        return false;

    if (m_interactionCheck) {
        const WindowInteraction interaction = m_interactionCheck(target);
        if (!interaction.isInteractive()) {
            qCDebug(lcShortcuts) << "Window" << target << "is not interactive; passing key through";
            return false;
        }
    }

    // The handler may unregister its own window, so call a copy.
    const Handler handler = m_entries.at(index).handler;
    if (!handler)
        return false;
    return handler(static_cast<QKeyEvent*>(event));
}

QUuid ShortcutRouter::tokenFor(QWindow* window) const
{
    const int index = indexOf(window);
    return index >= 0 ? m_entries.at(index).token : QUuid();
}

void ShortcutRouter::setInteractionCheck(InteractionCheck check)
{
    m_interactionCheck = check ? std::move(check) : InteractionCheck(&ShortcutRouter::defaultInteraction);
}

WindowInteraction ShortcutRouter::defaultInteraction(QWindow* window)
{
    WindowInteraction interaction;
    if (!window)
        return interaction;

    const QWindowList windows = QGuiApplication::topLevelWindows();
    for (const QWindow* candidate : windows) {
        if (candidate != window && candidate->transientParent() == window && candidate->isVisible()
            && isSheetOrDialog(candidate)) {
            interaction.sheetAttached = true;
            break;
        }
    }
    if (!interaction.sheetAttached)
        interaction.sheetAttached = hasOpenQuickDialog(window);

    const QWindow* modal = QGuiApplication::modalWindow();
    interaction.modalActive = modal && modal != window;

    if (QObject* focus = window->focusObject()) {
        QInputMethodQueryEvent query(Qt::ImEnabled);
        QCoreApplication::sendEvent(focus, &query);
        interaction.textInputFocused = query.value(Qt::ImEnabled).toBool();
    }
    return interaction;
}

bool ShortcutRouter::eventFilter(QObject* watched, QEvent* event)
{
    switch (event->type()) {
    case QEvent::KeyPress:
        // Qt forwards key events from the window to its items; only the window-level delivery is routed.
        if (auto* window = qobject_cast<QWindow*>(watched))
            return dispatch(event, window);
        break;
    case QEvent::Close:
        if (auto* window = qobject_cast<QWindow*>(watched); window && indexOf(window) >= 0) {
            // A closing handler may still reject the close; look again once delivery has finished.
            QPointer<QWindow> closing(window);
            QMetaObject::invokeMethod(this, [this, closing]() { dropClosedWindow(closing); }, Qt::QueuedConnection);
        }
        break;
    default:
        break;
    }
    return QObject::eventFilter(watched, event);
}

void ShortcutRouter::dropClosedWindow(const QPointer<QWindow>& window)
{
    if (window.isNull()) {
        pruneDestroyedWindows();
        return;
    }
    if (window->isVisible())
        return;
    const int index = indexOf(window.data());
    if (index >= 0) {
        qCDebug(lcShortcuts) << "Window" << window.data() << "closed; dropping shortcut entry";
        removeAt(index);
    }
}

int ShortcutRouter::indexOf(const QUuid& token) const
{
    if (token.isNull())
        return -1;
    for (qsizetype i = 0; i < m_entries.size(); ++i) {
        if (m_entries.at(i).token == token)
            return static_cast<int>(i);
    }
    return -1;
}

int ShortcutRouter::indexOf(const QWindow* window) const
{
    if (!window)
        return -1;
    for (qsizetype i = 0; i < m_entries.size(); ++i) {
        if (m_entries.at(i).window == window)
            return static_cast<int>(i);
    }
    return -1;
}

void ShortcutRouter::removeAt(int index)
{
    const Entry entry = m_entries.takeAt(index);
    disconnect(entry.destroyedConnection);
    qCDebug(lcShortcuts) << "Removed shortcut entry" << entry.token;
    updateMonitoring();
    emit entriesChanged();
}

void ShortcutRouter::pruneDestroyedWindows()
{
    bool removed = false;
    for (qsizetype i = m_entries.size() - 1; i >= 0; --i) {
        if (m_entries.at(i).window.isNull()) {
            disconnect(m_entries.at(i).destroyedConnection);
            m_entries.removeAt(i);
            removed = true;
        }
    }
    if (removed) {
        updateMonitoring();
        emit entriesChanged();
    }
}

void ShortcutRouter::updateMonitoring()
{
    const bool shouldMonitor = !m_entries.isEmpty();
    if (shouldMonitor == m_monitoring)
        return;

    QCoreApplication* app = QCoreApplication::instance();
    if (!app) {
        qCWarning(lcShortcuts) << "No application instance; shortcut monitor not installed";
        return;
    }
    if (shouldMonitor)
        app->installEventFilter(this);
    else
        app->removeEventFilter(this);
    m_monitoring = shouldMonitor;
    qCDebug(lcShortcuts) << (m_monitoring ? "Installed" : "Removed") << "application shortcut monitor";
    emit monitoringChanged(m_monitoring);
}
