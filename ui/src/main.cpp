#include <QApplication>
#include <QCommandLineParser>
#include <QGuiApplication>
#include <QQmlApplicationEngine>
#include <QTextStream>

#include "app/Application.hpp"

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    QGuiApplication::setOrganizationName(QStringLiteral("Pixor"));
    QGuiApplication::setApplicationName(QStringLiteral("Pixor"));
    QGuiApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    QQmlApplicationEngine engine;
    Application controller(engine);

    QCommandLineParser parser;
    controller.configureParser(parser);
    parser.process(app);
    if (!controller.applyParser(parser))
        QTextStream(stderr) << QObject::tr("Some options were invalid and have been ignored.") << Qt::endl;

    engine.load(QUrl(QStringLiteral("qrc:/qml/main.qml")));
    if (engine.rootObjects().isEmpty()) {
        return -1;
    }

    QMetaObject::invokeMethod(&controller, &Application::start, Qt::QueuedConnection);
    const int exitCode = app.exec();
    controller.stop();
    return exitCode;
}
