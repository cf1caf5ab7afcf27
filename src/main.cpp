#include <QApplication>
#include <QCommandLineParser>
#include <QDir>
#include "mainwindow.h"
#include "utils/logging.h"
#include "version.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    app.setApplicationName("pendrivebutler");
    app.setApplicationDisplayName("Pendrive Butler");
    app.setApplicationVersion(BUTLER_VERSION);
    app.setOrganizationName("pendrivebutler");

    QCommandLineParser parser;
    parser.setApplicationDescription("Copies media files to a removable drive through a sequential queue");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("paths", "Files or folders to queue on startup", "[paths...]");

    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");
    parser.addOption(verboseOption);

    parser.process(app);

    butler::verboseLogging = parser.isSet(verboseOption);
    LOG_VERBOSE() << "Verbose logging enabled";

    QStringList startupPaths;
    for (const QString &arg : parser.positionalArguments()) {
        startupPaths.append(QDir::cleanPath(QDir::current().absoluteFilePath(arg)));
    }

    MainWindow window;
    window.show();
    window.queueStartupPaths(startupPaths);

    return app.exec();
}
