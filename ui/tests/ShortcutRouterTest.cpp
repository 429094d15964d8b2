#include <QtTest/QtTest>
#include <QCloseEvent>
#include <QKeyEvent>
#include <QQmlComponent>
#include <QQmlEngine>
#include <QQuickWindow>
#include <QSignalSpy>
#include <QWindow>

#include <memory>

#include "shortcuts/ShortcutRouter.hpp"

namespace {

QKeyEvent keyPress(int key, Qt::KeyboardModifiers modifiers = Qt::NoModifier)
{
    return QKeyEvent(QEvent::KeyPress, key, modifiers);
}

WindowInteraction interactive(QWindow*)
{
    return {};
}

class CloseRejectingWindow : public QWindow {
protected:
    void closeEvent(QCloseEvent* event) override { event->ignore(); }
};

const QByteArray kPopupWindowQml = QByteArrayLiteral(
    "import QtQuick\n"
    "import QtQuick.Controls\n"
    "Window {\n"
    "    width: 320; height: 240; visible: true\n"
    "    property alias confirmation: confirmation\n"
    "    property alias hint: hint\n"
    "    property alias question: question\n"
    "    Popup { id: confirmation; modal: true; width: 120; height: 80 }\n"
    "    Popup { id: hint; width: 60; height: 40 }\n"
    "    Dialog { id: question; title: \"Delete?\"; standardButtons: Dialog.Ok | Dialog.Cancel }\n"
    "}\n");

} // namespace

class ShortcutRouterTest : public QObject {
    Q_OBJECT

private slots:
    void dispatchesToRegisteredWindow();
    void sheetAttachedBlocksEveryWindow();
    void modalOrTextInputBlocksDispatch();
    void unregisteredWindowPassesThrough();
    void registeringTwiceUpdatesHandlerInPlace();
    void updateReplacesHandlerAndIgnoresUnknownToken();
    void declinedEventPassesThrough();
    void ignoresNonKeyPressEvents();
    void monitorFollowsEntryCount();
    void destroyedWindowIsPruned();
    void closeEventRemovesEntry();
    void rejectedCloseKeepsEntry();
    void applicationFilterRoutesWindowKeyPress();
    void attachedDialogBlocksDispatch();
    void openQuickPopupBlocksDispatch();
    void nullWindowIsRejected();
};

void ShortcutRouterTest::dispatchesToRegisteredWindow()
{
    ShortcutRouter router;
    router.setInteractionCheck(&interactive);
    QWindow window;

    int calls = 0;
    int seenKey = 0;
    const QUuid token = router.registerWindow(&window, [&](QKeyEvent* event) {
        ++calls;
        seenKey = event->key();
        return true;
    });
    QVERIFY(!token.isNull());
    QCOMPARE(router.tokenFor(&window), token);

    QKeyEvent event = keyPress(Qt::Key_Right);
    QVERIFY(router.dispatch(&event, &window));
    QCOMPARE(calls, 1);
    QCOMPARE(seenKey, int(Qt::Key_Right));
}

void ShortcutRouterTest::sheetAttachedBlocksEveryWindow()
{
    ShortcutRouter router;
    router.setInteractionCheck([](QWindow*) {
        WindowInteraction interaction;
        interaction.sheetAttached = true;
        return interaction;
    });

    QWindow first;
    QWindow second;
    int calls = 0;
    const auto handler = [&](QKeyEvent*) {
        ++calls;
        return true;
    };
    router.registerWindow(&first, handler);
    router.registerWindow(&second, handler);

    for (QWindow* window : {&first, &second}) {
        QKeyEvent event = keyPress(Qt::Key_Left);
        QVERIFY(!router.dispatch(&event, window));
    }
    QCOMPARE(calls, 0);
}

void ShortcutRouterTest::modalOrTextInputBlocksDispatch()
{
    ShortcutRouter router;
    WindowInteraction state;
    router.setInteractionCheck([&state](QWindow*) { return state; });

    QWindow window;
    int calls = 0;
    router.registerWindow(&window, [&](QKeyEvent*) {
        ++calls;
        return true;
    });

    state.modalActive = true;
    QKeyEvent first = keyPress(Qt::Key_Delete);
    QVERIFY(!router.dispatch(&first, &window));

    state = WindowInteraction{};
    state.textInputFocused = true;
    QKeyEvent second = keyPress(Qt::Key_Backspace);
    QVERIFY(!router.dispatch(&second, &window));
    QCOMPARE(calls, 0);

    state = WindowInteraction{};
    QKeyEvent third = keyPress(Qt::Key_Backspace);
    QVERIFY(router.dispatch(&third, &window));
    QCOMPARE(calls, 1);
}

void ShortcutRouterTest::unregisteredWindowPassesThrough()
{
    ShortcutRouter router;
    router.setInteractionCheck(&interactive);
    QWindow window;

    int calls = 0;
    const QUuid token = router.registerWindow(&window, [&](QKeyEvent*) {
        ++calls;
        return true;
    });

    QKeyEvent before = keyPress(Qt::Key_Right);
    QVERIFY(router.dispatch(&before, &window));
    QCOMPARE(calls, 1);

    router.unregister(token);
    QCOMPARE(router.entryCount(), 0);
    QVERIFY(router.tokenFor(&window).isNull());

    QKeyEvent after = keyPress(Qt::Key_Right);
    QVERIFY(!router.dispatch(&after, &window));
    QCOMPARE(calls, 1);

    // Unknown tokens are harmless.
    router.unregister(token);
    router.unregister(QUuid::createUuid());
    QCOMPARE(router.entryCount(), 0);
}

void ShortcutRouterTest::registeringTwiceUpdatesHandlerInPlace()
{
    ShortcutRouter router;
    router.setInteractionCheck(&interactive);
    QWindow window;
    QSignalSpy entriesSpy(&router, &ShortcutRouter::entriesChanged);

    int firstCalls = 0;
    int secondCalls = 0;
    const QUuid firstToken = router.registerWindow(&window, [&](QKeyEvent*) {
        ++firstCalls;
        return true;
    });
    const QUuid secondToken = router.registerWindow(&window, [&](QKeyEvent*) {
        ++secondCalls;
        return true;
    });

    QCOMPARE(secondToken, firstToken);
    QCOMPARE(router.entryCount(), 1);
    QCOMPARE(entriesSpy.count(), 1);

    QKeyEvent event = keyPress(Qt::Key_Left);
    QVERIFY(router.dispatch(&event, &window));
    QCOMPARE(firstCalls, 0);
    QCOMPARE(secondCalls, 1);
}

void ShortcutRouterTest::updateReplacesHandlerAndIgnoresUnknownToken()
{
    ShortcutRouter router;
    router.setInteractionCheck(&interactive);
    QWindow window;

    int original = 0;
    int replacement = 0;
    const QUuid token = router.registerWindow(&window, [&](QKeyEvent*) {
        ++original;
        return true;
    });
    router.update(QUuid::createUuid(), [&](QKeyEvent*) { return false; });
    router.update(token, [&](QKeyEvent*) {
        ++replacement;
        return true;
    });

    QKeyEvent event = keyPress(Qt::Key_Right);
    QVERIFY(router.dispatch(&event, &window));
    QCOMPARE(original, 0);
    QCOMPARE(replacement, 1);
    QCOMPARE(router.entryCount(), 1);
}

void ShortcutRouterTest::declinedEventPassesThrough()
{
    ShortcutRouter router;
    router.setInteractionCheck(&interactive);
    QWindow window;
    router.registerWindow(&window, [](QKeyEvent*) { return false; });

    QKeyEvent event = keyPress(Qt::Key_A);
    QVERIFY(!router.dispatch(&event, &window));
}

void ShortcutRouterTest::ignoresNonKeyPressEvents()
{
    ShortcutRouter router;
    router.setInteractionCheck(&interactive);
    QWindow window;
    int calls = 0;
    router.registerWindow(&window, [&](QKeyEvent*) {
        ++calls;
        return true;
    });

    QKeyEvent release(QEvent::KeyRelease, Qt::Key_Right, Qt::NoModifier);
    QVERIFY(!router.dispatch(&release, &window));
    QEvent other(QEvent::MouseButtonPress);
    QVERIFY(!router.dispatch(&other, &window));
    QVERIFY(!router.dispatch(nullptr, &window));
    QCOMPARE(calls, 0);
}

void ShortcutRouterTest::monitorFollowsEntryCount()
{
    ShortcutRouter router;
    QSignalSpy monitoringSpy(&router, &ShortcutRouter::monitoringChanged);
    QVERIFY(!router.isMonitoring());

    QWindow first;
    QWindow second;
    const QUuid firstToken = router.registerWindow(&first, [](QKeyEvent*) { return true; });
    QVERIFY(router.isMonitoring());
    const QUuid secondToken = router.registerWindow(&second, [](QKeyEvent*) { return true; });
    QCOMPARE(monitoringSpy.count(), 1);

    router.unregister(firstToken);
    QVERIFY(router.isMonitoring());
    router.unregister(secondToken);
    QVERIFY(!router.isMonitoring());
    QCOMPARE(monitoringSpy.count(), 2);
    QCOMPARE(monitoringSpy.last().at(0).toBool(), false);
}

void ShortcutRouterTest::destroyedWindowIsPruned()
{
    ShortcutRouter router;
    auto window = std::make_unique<QWindow>();
    router.registerWindow(window.get(), [](QKeyEvent*) { return true; });
    QCOMPARE(router.entryCount(), 1);

    window.reset();
    QCOMPARE(router.entryCount(), 0);
    QVERIFY(!router.isMonitoring());

    QKeyEvent event = keyPress(Qt::Key_Right);
    QVERIFY(!router.dispatch(&event, nullptr));
}

void ShortcutRouterTest::closeEventRemovesEntry()
{
    ShortcutRouter router;
    QWindow window;
    router.registerWindow(&window, [](QKeyEvent*) { return true; });
    QCOMPARE(router.entryCount(), 1);

    QCloseEvent close;
    QCoreApplication::sendEvent(&window, &close);
    QTRY_COMPARE(router.entryCount(), 0);
    QVERIFY(!router.isMonitoring());
}

void ShortcutRouterTest::rejectedCloseKeepsEntry()
{
    CloseRejectingWindow window;
    window.resize(200, 120);
    window.show();
    QVERIFY(QTest::qWaitForWindowExposed(&window));

    ShortcutRouter router;
    router.setInteractionCheck(&interactive);
    int calls = 0;
    const QUuid token = router.registerWindow(&window, [&](QKeyEvent*) {
        ++calls;
        return true;
    });

    QCloseEvent close;
    QCoreApplication::sendEvent(&window, &close);
    QVERIFY(!close.isAccepted());
    QCoreApplication::processEvents();

    QVERIFY(window.isVisible());
    QCOMPARE(router.entryCount(), 1);
    QCOMPARE(router.tokenFor(&window), token);
    QKeyEvent event = keyPress(Qt::Key_Right);
    QVERIFY(router.dispatch(&event, &window));
    QCOMPARE(calls, 1);
}

void ShortcutRouterTest::applicationFilterRoutesWindowKeyPress()
{
    ShortcutRouter router;
    router.setInteractionCheck(&interactive);
    QWindow window;
    QWindow unregistered;

    int calls = 0;
    router.registerWindow(&window, [&](QKeyEvent*) {
        ++calls;
        return true;
    });

    QKeyEvent routed = keyPress(Qt::Key_Right);
    QCoreApplication::sendEvent(&window, &routed);
    QCOMPARE(calls, 1);

    QKeyEvent ignored = keyPress(Qt::Key_Right);
    QCoreApplication::sendEvent(&unregistered, &ignored);
    QCOMPARE(calls, 1);

    // Non-window receivers are left to Qt's delivery.
    QObject plain;
    QKeyEvent toObject = keyPress(Qt::Key_Right);
    QCoreApplication::sendEvent(&plain, &toObject);
    QCOMPARE(calls, 1);
}

void ShortcutRouterTest::attachedDialogBlocksDispatch()
{
    QWindow main;
    main.resize(320, 240);
    main.show();
    QVERIFY(QTest::qWaitForWindowExposed(&main));
    QVERIFY(!ShortcutRouter::defaultInteraction(&main).sheetAttached);

    QWindow dialog;
    dialog.setFlags(Qt::Dialog);
    dialog.setTransientParent(&main);
    dialog.resize(100, 80);
    dialog.show();
    QVERIFY(QTest::qWaitForWindowExposed(&dialog));

    QVERIFY(ShortcutRouter::defaultInteraction(&main).sheetAttached);
    QVERIFY(!ShortcutRouter::defaultInteraction(&main).isInteractive());

    ShortcutRouter router;
    int calls = 0;
    router.registerWindow(&main, [&](QKeyEvent*) {
        ++calls;
        return true;
    });
    QKeyEvent event = keyPress(Qt::Key_Right);
    QVERIFY(!router.dispatch(&event, &main));
    QCOMPARE(calls, 0);

    dialog.hide();
    QVERIFY(!ShortcutRouter::defaultInteraction(&main).sheetAttached);
}

void ShortcutRouterTest::openQuickPopupBlocksDispatch()
{
    QQmlEngine engine;
    QQmlComponent component(&engine);
    component.setData(kPopupWindowQml, QUrl());
    std::unique_ptr<QObject> root(component.create());
    QVERIFY2(root, qPrintable(component.errorString()));
    auto* window = qobject_cast<QQuickWindow*>(root.get());
    QVERIFY(window);
    QVERIFY(QTest::qWaitForWindowExposed(window));

    QObject* confirmation = root->property("confirmation").value<QObject*>();
    QObject* hint = root->property("hint").value<QObject*>();
    QObject* question = root->property("question").value<QObject*>();
    QVERIFY(confirmation && hint && question);
    QVERIFY(ShortcutRouter::defaultInteraction(window).isInteractive());

    ShortcutRouter router;
    int calls = 0;
    router.registerWindow(window, [&](QKeyEvent*) {
        ++calls;
        return true;
    });

    // A non-modal popup leaves shortcuts active.
    QVERIFY(QMetaObject::invokeMethod(hint, "open"));
    QTRY_VERIFY(hint->property("visible").toBool());
    QVERIFY(!ShortcutRouter::defaultInteraction(window).sheetAttached);
    QVERIFY(QMetaObject::invokeMethod(hint, "close"));
    QTRY_VERIFY(!hint->property("visible").toBool());

    QVERIFY(QMetaObject::invokeMethod(confirmation, "open"));
    QTRY_VERIFY(confirmation->property("visible").toBool());
    QVERIFY(ShortcutRouter::defaultInteraction(window).sheetAttached);
    QKeyEvent blocked = keyPress(Qt::Key_Right);
    QCoreApplication::sendEvent(window, &blocked);
    QCOMPARE(calls, 0);
    QVERIFY(QMetaObject::invokeMethod(confirmation, "close"));
    QTRY_VERIFY(!confirmation->property("visible").toBool());

    // Dialogs count whether or not they are modal.
    QVERIFY(QMetaObject::invokeMethod(question, "open"));
    QTRY_VERIFY(question->property("visible").toBool());
    QKeyEvent alsoBlocked = keyPress(Qt::Key_Right);
    QVERIFY(!router.dispatch(&alsoBlocked, window));
    QCOMPARE(calls, 0);
    QVERIFY(QMetaObject::invokeMethod(question, "close"));
    QTRY_VERIFY(!question->property("visible").toBool());

    QKeyEvent routed = keyPress(Qt::Key_Right);
    QVERIFY(router.dispatch(&routed, window));
    QCOMPARE(calls, 1);
}

void ShortcutRouterTest::nullWindowIsRejected()
{
    ShortcutRouter router;
    QVERIFY(router.registerWindow(nullptr, [](QKeyEvent*) { return true; }).isNull());
    QCOMPARE(router.entryCount(), 0);
    QVERIFY(!router.isMonitoring());
}

QTEST_MAIN(ShortcutRouterTest)
#include "ShortcutRouterTest.moc"
