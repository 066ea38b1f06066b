#include <QApplication>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QString>
#include <string>
#include "ShellWindow.hpp"
#include "core/config/ConfigStore.hpp"
#include "utils/Logger.hpp"

int main(int argc, char** argv) {
    QCoreApplication::setAttribute(Qt::AA_ShareOpenGLContexts);
    QApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("consoletabs"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription("Tabbed shell for remote gateway consoles");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption debugOpt({"d", "debug"}, "Enable verbose diagnostic output");
    parser.addOption(debugOpt);

    parser.process(app);

    if (parser.isSet(debugOpt))
        ct::setLogLevel(ct::LogLevel::Debug);

    CT_LOG(ct::LogLevel::Info, "ConsoleTabs starting");

    ct::ConfigStore config(ct::ConfigStore::defaultPaths());
    CT_LOG(ct::LogLevel::Debug, "Install config: " + config.paths().installPath.toStdString());
    CT_LOG(ct::LogLevel::Debug, "User config: " + config.paths().userPath.toStdString());

    std::string startupError;
    try {
        config.loadInitial();
    } catch (const ct::ConfigError &e) {
        // Keep the built-in defaults; the window reports the problem.
        CT_LOG(ct::LogLevel::Error, std::string("Invalid configuration: ") + e.what());
        startupError = e.what();
    }

    ShellWindow win(config);
    win.openSession();
    if (!startupError.empty())
        win.showNotice("Could not load configuration (" + startupError + ")");
    win.show();
    return app.exec();
}
