#include <QCommandLineParser>
#include <QCoreApplication>

#include "app/Application.hpp"

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("summit"));
    QCoreApplication::setApplicationName(QStringLiteral("Summit"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    Application controller;

    QCommandLineParser parser;
    controller.configureParser(parser);
    parser.process(app);
    if (!controller.applyParser(parser))
        return Application::ExitConfigError;

    const int exitCode = controller.start();
    controller.stop();
    return exitCode;
}
