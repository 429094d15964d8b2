#pragma once

#include <QJsonObject>
#include <QList>
#include <QMap>
#include <QMetaType>
#include <QObject>
#include <QString>

#include <optional>

class QKeyEvent;

enum class ShortcutAction {
    RotateCounterclockwise,
    RotateClockwise,
    MirrorHorizontal,
    MirrorVertical,
    ResetTransform,
    NavigatePrevious,
    NavigateNext,
    DeletePrimary,
    DeleteSecondary,
};

Q_DECLARE_METATYPE(ShortcutAction)

//! A key plus the modifiers that must be held. Keypad and group-switch flags are ignored.
struct KeyCombination {
    int key = 0;
    Qt::KeyboardModifiers modifiers = Qt::NoModifier;

    KeyCombination() = default;
    KeyCombination(int keyValue, Qt::KeyboardModifiers mods = Qt::NoModifier);

    static KeyCombination fromEvent(const QKeyEvent* event);
    //! Parses the portable text form ("Ctrl+Shift+H"); std::nullopt for anything but a single key.
    static std::optional<KeyCombination> fromString(const QString& text);

    bool isValid() const { return key != 0; }
    QString toString() const;

    bool operator==(const KeyCombination& other) const { return key == other.key && modifiers == other.modifiers; }
    bool operator!=(const KeyCombination& other) const { return !(*this == other); }
};

struct ShortcutDefinition {
    ShortcutAction action = ShortcutAction::RotateClockwise;
    QString name;
    QString title;
    QList<KeyCombination> defaultCombinations;
};

/**
 * @brief Registry of customisable shortcut actions and their key bindings.
 *
 * Every action carries at least one default combination. User overrides are
 * kept per action; an action without an override uses its defaults.
 */
class ShortcutCatalog : public QObject {
    Q_OBJECT

public:
    explicit ShortcutCatalog(QObject* parent = nullptr);

    static QList<ShortcutAction> allActions();
    static ShortcutDefinition definition(ShortcutAction action);
    static QList<KeyCombination> defaultCombinations(ShortcutAction action);
    static QString actionName(ShortcutAction action);
    static std::optional<ShortcutAction> actionFromName(const QString& name);

    QList<KeyCombination> bindings(ShortcutAction action) const;
    bool setBindings(ShortcutAction action, const QList<KeyCombination>& combinations,
                     QString* errorMessage = nullptr);
    bool hasCustomBindings(ShortcutAction action) const { return m_overrides.contains(action); }
    void resetToDefaults();

    std::optional<ShortcutAction> actionFor(const KeyCombination& combination) const;
    std::optional<ShortcutAction> actionFor(const QKeyEvent* event) const;

    //! Only overridden actions are written; `loadJson` ignores unknown names and invalid bindings.
    QJsonObject toJson() const;
    bool loadJson(const QJsonObject& object, QString* errorMessage = nullptr);

    Q_INVOKABLE QString bindingText(const QString& actionName) const;

signals:
    void bindingsChanged();

private:
    QMap<ShortcutAction, QList<KeyCombination>> m_overrides;
};
