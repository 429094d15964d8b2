#pragma once

#include <QList>
#include <QMetaObject>
#include <QObject>
#include <QPointer>
#include <QUuid>
#include <QWindow>

#include <functional>

class QEvent;
class QKeyEvent;

//! Snapshot of the state that makes a window unsuitable as a shortcut target.
struct WindowInteraction {
    bool sheetAttached = false;
    bool modalActive = false;
    bool textInputFocused = false;

    bool isInteractive() const { return !sheetAttached && !modalActive && !textInputFocused; }
};

/**
 * @brief Routes application-wide key presses to the handler of the window that owns them.
 *
 * A single event filter is installed on the application object while at
 * least one window is registered. A window is not interactive while a dialog
 * window or an open modal Qt Quick popup covers it. Events for unregistered
 * or non-interactive windows, and events a handler declines, continue through
 * Qt's normal delivery untouched. Must only be used from the GUI thread.
 */
class ShortcutRouter : public QObject {
    Q_OBJECT
    Q_PROPERTY(int entryCount READ entryCount NOTIFY entriesChanged)
    Q_PROPERTY(bool monitoring READ isMonitoring NOTIFY monitoringChanged)

public:
    //! Returns true when the event was consumed.
    using Handler = std::function<bool(QKeyEvent*)>;
    using InteractionCheck = std::function<WindowInteraction(QWindow*)>;

    explicit ShortcutRouter(QObject* parent = nullptr);
    ~ShortcutRouter() override;

    QUuid registerWindow(QWindow* window, Handler handler);
    void update(const QUuid& token, Handler handler);
    void unregister(const QUuid& token);

    bool dispatch(QEvent* event, QWindow* window);

    int entryCount() const { return static_cast<int>(m_entries.size()); }
    bool isMonitoring() const { return m_monitoring; }
    QUuid tokenFor(QWindow* window) const;

    void setInteractionCheck(InteractionCheck check);
    static WindowInteraction defaultInteraction(QWindow* window);

signals:
    void entriesChanged();
    void monitoringChanged(bool monitoring);

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    struct Entry {
        QUuid token;
        QPointer<QWindow> window;
        Handler handler;
        QMetaObject::Connection destroyedConnection;
    };

    int indexOf(const QUuid& token) const;
    int indexOf(const QWindow* window) const;
    void removeAt(int index);
    void dropClosedWindow(const QPointer<QWindow>& window);
    void pruneDestroyedWindows();
    void updateMonitoring();

    QList<Entry> m_entries;
    InteractionCheck m_interactionCheck;
    bool m_monitoring = false;
};
