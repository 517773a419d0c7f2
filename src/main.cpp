#include "bridge/async_bridge.h"
#include "console.h"
#include "core/logger.h"
#include "core/settings.h"
#include "engine/mock_engine.h"
#include "engine/renode_engine.h"
#ifdef SIMSHELL_ENABLE_GUI
#include "gui/main_window.h"
#include <QApplication>
#endif
#include <QCoreApplication>
#include <QSettings>
#include <chrono>
#include <cstring>
#include <iostream>
#include <memory>

using namespace SimShell;

static std::shared_ptr<Engine> make_engine(const Settings& settings){
    if(settings.backend == Settings::Backend::Renode){
        RenodeEngine::Endpoint endpoint;
        endpoint.host = settings.host;
        endpoint.port = settings.port;
        endpoint.io_timeout = std::chrono::milliseconds(settings.io_timeout_ms);
        return std::make_shared<RenodeEngine>(endpoint);
    }
    return std::make_shared<MockEngine>();
}

int main(int argc, char** argv){
    bool useGui = true;
    for(int i=1;i<argc;++i) {
        if(std::strcmp(argv[i], "--nogui")==0 || std::strcmp(argv[i], "--cli")==0) {
            useGui = false;
            break;
        }
    }

    std::unique_ptr<QCoreApplication> app;
#ifdef SIMSHELL_ENABLE_GUI
    if(useGui) app = std::make_unique<QApplication>(argc, argv);
#else
    useGui = false;
#endif
    if(!app) app = std::make_unique<QCoreApplication>(argc, argv);
    app->setApplicationName("SimShell");
    app->setApplicationVersion("1.0");
    app->setOrganizationName("SimShell");

    QSettings store("SimShell", "SimShell");
    Settings settings;
    settings.load(store);
    settings.apply_environment();
    QString error;
    if(!settings.apply_arguments(app->arguments(), error)){
        std::cerr<<error.toStdString()<<"\n";
        return 1;
    }
    if(settings.show_help){
        std::cout<<settings.help_text.toStdString();
        return 0;
    }
    log::set_level(settings.log_level);
    log::info(std::string("starting with ") + to_string(settings.backend) + " backend");

    AsyncBridge::Options options;
    options.workers = static_cast<size_t>(settings.workers);
    options.poll_interval = std::chrono::milliseconds(settings.poll_interval_ms);
    options.call_timeout = std::chrono::milliseconds(settings.call_timeout_ms);
    options.shutdown_grace = std::chrono::milliseconds(settings.shutdown_grace_ms);
    AsyncBridge bridge(make_engine(settings), options);

    if(!settings.startup_script.empty()){
        bridge.requestLoadScript(QString::fromStdString(settings.startup_script));
    }

    int rc = 0;
#ifdef SIMSHELL_ENABLE_GUI
    if(useGui){
        MainWindow window(&bridge, &store);
        window.show();
        rc = app->exec();
        bridge.shutdown();
        return rc;
    }
#endif

    Console console(bridge);
    QObject::connect(&console, &Console::finished, app.get(), &QCoreApplication::quit);
    console.start();
    rc = app->exec();
    bridge.shutdown();
    return rc;
}
