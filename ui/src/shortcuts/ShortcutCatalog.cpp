#include "ShortcutCatalog.hpp"

#include <QJsonArray>
#include <QKeyEvent>
#include <QKeySequence>
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcShortcuts)

namespace {

constexpr Qt::KeyboardModifiers kRelevantModifiers =
    Qt::ShiftModifier | Qt::ControlModifier | Qt::AltModifier | Qt::MetaModifier;

} // namespace

KeyCombination::KeyCombination(int keyValue, Qt::KeyboardModifiers mods)
    : key(keyValue)
    , modifiers(mods & kRelevantModifiers)
{
}

KeyCombination KeyCombination::fromEvent(const QKeyEvent* event)
{
    if (!event)
        return {};
    return KeyCombination(event->key(), event->modifiers());
}

std::optional<KeyCombination> KeyCombination::fromString(const QString& text)
{
    const QKeySequence sequence = QKeySequence::fromString(text.trimmed(), QKeySequence::PortableText);
    if (sequence.count() != 1)
        return std::nullopt;
    const QKeyCombination combination = sequence[0];
    if (combination.key() == Qt::Key_unknown || combination.key() == 0)
        return std::nullopt;
    return KeyCombination(combination.key(), combination.keyboardModifiers());
}

QString KeyCombination::toString() const
{
    if (!isValid())
        return {};
    return QKeySequence(QKeyCombination(modifiers, static_cast<Qt::Key>(key))).toString(QKeySequence::PortableText);
}

ShortcutCatalog::ShortcutCatalog(QObject* parent)
    : QObject(parent)
{
}

QList<ShortcutAction> ShortcutCatalog::allActions()
{
    return {ShortcutAction::RotateCounterclockwise, ShortcutAction::RotateClockwise, ShortcutAction::MirrorHorizontal,
            ShortcutAction::MirrorVertical,         ShortcutAction::ResetTransform,  ShortcutAction::NavigatePrevious,
            ShortcutAction::NavigateNext,           ShortcutAction::DeletePrimary,   ShortcutAction::DeleteSecondary};
}

ShortcutDefinition ShortcutCatalog::definition(ShortcutAction action)
{
    ShortcutDefinition def;
    def.action = action;
    def.name = actionName(action);
    switch (action) {
    case ShortcutAction::RotateCounterclockwise:
        def.title = tr("Rotate counterclockwise");
        def.defaultCombinations = {KeyCombination(Qt::Key_BracketLeft, Qt::ControlModifier)};
        break;
    case ShortcutAction::RotateClockwise:
        def.title = tr("Rotate clockwise");
        def.defaultCombinations = {KeyCombination(Qt::Key_BracketRight, Qt::ControlModifier)};
        break;
    case ShortcutAction::MirrorHorizontal:
        def.title = tr("Mirror horizontally");
        def.defaultCombinations = {KeyCombination(Qt::Key_H, Qt::ControlModifier | Qt::ShiftModifier)};
        break;
    case ShortcutAction::MirrorVertical:
        def.title = tr("Mirror vertically");
        def.defaultCombinations = {KeyCombination(Qt::Key_V, Qt::ControlModifier | Qt::ShiftModifier)};
        break;
    case ShortcutAction::ResetTransform:
        def.title = tr("Reset transform");
        def.defaultCombinations = {KeyCombination(Qt::Key_0, Qt::AltModifier)};
        break;
    case ShortcutAction::NavigatePrevious:
        def.title = tr("Previous image");
        def.defaultCombinations = {KeyCombination(Qt::Key_Left)};
        break;
    case ShortcutAction::NavigateNext:
        def.title = tr("Next image");
        def.defaultCombinations = {KeyCombination(Qt::Key_Right)};
        break;
    case ShortcutAction::DeletePrimary:
        def.title = tr("Delete image");
        def.defaultCombinations = {KeyCombination(Qt::Key_Backspace)};
        break;
    case ShortcutAction::DeleteSecondary:
        def.title = tr("Delete image (forward delete)");
        def.defaultCombinations = {KeyCombination(Qt::Key_Delete)};
        break;
    }
    return def;
}

QList<KeyCombination> ShortcutCatalog::defaultCombinations(ShortcutAction action)
{
    return definition(action).defaultCombinations;
}

QString ShortcutCatalog::actionName(ShortcutAction action)
{
    switch (action) {
    case ShortcutAction::RotateCounterclockwise:
        return QStringLiteral("rotateCounterclockwise");
    case ShortcutAction::RotateClockwise:
        return QStringLiteral("rotateClockwise");
    case ShortcutAction::MirrorHorizontal:
        return QStringLiteral("mirrorHorizontal");
    case ShortcutAction::MirrorVertical:
        return QStringLiteral("mirrorVertical");
    case ShortcutAction::ResetTransform:
        return QStringLiteral("resetTransform");
    case ShortcutAction::NavigatePrevious:
        return QStringLiteral("navigatePrevious");
    case ShortcutAction::NavigateNext:
        return QStringLiteral("navigateNext");
    case ShortcutAction::DeletePrimary:
        return QStringLiteral("deletePrimary");
    case ShortcutAction::DeleteSecondary:
        return QStringLiteral("deleteSecondary");
    }
    return {};
}

std::optional<ShortcutAction> ShortcutCatalog::actionFromName(const QString& name)
{
    for (ShortcutAction action : allActions()) {
        if (actionName(action) == name)
            return action;
    }
    return std::nullopt;
}

QList<KeyCombination> ShortcutCatalog::bindings(ShortcutAction action) const
{
    const auto it = m_overrides.constFind(action);
    if (it != m_overrides.constEnd())
        return it.value();
    return defaultCombinations(action);
}

bool ShortcutCatalog::setBindings(ShortcutAction action, const QList<KeyCombination>& combinations,
                                  QString* errorMessage)
{
    QList<KeyCombination> unique;
    for (const KeyCombination& combination : combinations) {
        if (!combination.isValid()) {
            if (errorMessage)
                *errorMessage = tr("Invalid key combination for %1").arg(actionName(action));
            return false;
        }
        if (!unique.contains(combination))
            unique.append(combination);
    }
    if (unique.isEmpty()) {
        if (errorMessage)
            *errorMessage = tr("%1 needs at least one key combination").arg(actionName(action));
        return false;
    }

    for (ShortcutAction other : allActions()) {
        if (other == action)
            continue;
        const QList<KeyCombination> taken = bindings(other);
        for (const KeyCombination& combination : unique) {
            if (taken.contains(combination)) {
                if (errorMessage)
                    *errorMessage = tr("%1 is already bound to %2").arg(combination.toString(), actionName(other));
                return false;
            }
        }
    }

    if (unique == defaultCombinations(action))
        m_overrides.remove(action);
    else
        m_overrides.insert(action, unique);
    emit bindingsChanged();
    return true;
}

void ShortcutCatalog::resetToDefaults()
{
    if (m_overrides.isEmpty())
        return;
    m_overrides.clear();
    emit bindingsChanged();
}

std::optional<ShortcutAction> ShortcutCatalog::actionFor(const KeyCombination& combination) const
{
    if (!combination.isValid())
        return std::nullopt;
    for (ShortcutAction action : allActions()) {
        if (bindings(action).contains(combination))
            return action;
    }
    return std::nullopt;
}

std::optional<ShortcutAction> ShortcutCatalog::actionFor(const QKeyEvent* event) const
{
    return actionFor(KeyCombination::fromEvent(event));
}

QJsonObject ShortcutCatalog::toJson() const
{
    QJsonObject object;
    for (auto it = m_overrides.constBegin(); it != m_overrides.constEnd(); ++it) {
        QJsonArray combos;
        for (const KeyCombination& combination : it.value())
            combos.append(combination.toString());
        object.insert(actionName(it.key()), combos);
    }
    return object;
}

bool ShortcutCatalog::loadJson(const QJsonObject& object, QString* errorMessage)
{
    QMap<ShortcutAction, QList<KeyCombination>> overrides;
    QStringList problems;
    for (auto it = object.constBegin(); it != object.constEnd(); ++it) {
        const auto action = actionFromName(it.key());
        if (!action) {
            problems.append(tr("Unknown shortcut action %1").arg(it.key()));
            continue;
        }
        QList<KeyCombination> combos;
        for (const QJsonValue& value : it.value().toArray()) {
            const auto combination = KeyCombination::fromString(value.toString());
            if (combination && !combos.contains(*combination))
                combos.append(*combination);
            else if (!combination)
                problems.append(tr("Invalid key combination %1").arg(value.toString()));
        }
        if (combos.isEmpty()) {
            problems.append(tr("%1 has no usable key combination").arg(it.key()));
            continue;
        }
        overrides.insert(*action, combos);
    }

    m_overrides = overrides;
    emit bindingsChanged();

    if (!problems.isEmpty()) {
        qCWarning(lcShortcuts) << "Shortcut bindings loaded with problems:" << problems;
        if (errorMessage)
            *errorMessage = problems.join(QStringLiteral("; "));
        return false;
    }
    return true;
}

QString ShortcutCatalog::bindingText(const QString& name) const
{
    const auto action = actionFromName(name);
    if (!action)
        return {};
    QStringList parts;
    for (const KeyCombination& combination : bindings(*action))
        parts.append(QKeySequence(combination.toString(), QKeySequence::PortableText)
                         .toString(QKeySequence::NativeText));
    return parts.join(QStringLiteral(", "));
}
