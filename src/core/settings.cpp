#include "settings.h"
#include <QCommandLineParser>
#include <QSettings>
#include <QtGlobal>
#include <algorithm>

namespace SimShell {

const char* to_string(Settings::Backend backend){
    return backend == Settings::Backend::Renode ? "renode" : "mock";
}

bool parse_backend(const QString& text, Settings::Backend& out){
    QString t = text.trimmed().toLower();
    if(t == "mock"){ out = Settings::Backend::Mock; return true; }
    if(t == "renode" || t == "real"){ out = Settings::Backend::Renode; return true; }
    return false;
}

bool parse_endpoint(const QString& text, std::string& host, uint16_t& port){
    int colon = text.lastIndexOf(':');
    if(colon <= 0) return false;
    bool ok = false;
    uint p = text.mid(colon + 1).toUInt(&ok);
    if(!ok || p == 0 || p > 65535) return false;
    host = text.left(colon).toStdString();
    port = static_cast<uint16_t>(p);
    return true;
}

void Settings::load(QSettings& store){
    Backend b = backend;
    if(parse_backend(store.value("engine/backend", to_string(backend)).toString(), b)) backend = b;
    host = store.value("engine/host", QString::fromStdString(host)).toString().toStdString();
    port = static_cast<uint16_t>(store.value("engine/port", port).toUInt());
    workers = store.value("engine/workers", workers).toInt();
    call_timeout_ms = store.value("engine/callTimeoutMs", call_timeout_ms).toInt();
    io_timeout_ms = store.value("engine/ioTimeoutMs", io_timeout_ms).toInt();
    poll_interval_ms = store.value("poll/intervalMs", poll_interval_ms).toInt();
    if(auto lvl = log::parse_level(store.value("log/level", log::level_name(log_level)).toString().toStdString())) log_level = *lvl;
    clamp();
}

void Settings::save(QSettings& store) const {
    store.setValue("engine/backend", to_string(backend));
    store.setValue("engine/host", QString::fromStdString(host));
    store.setValue("engine/port", port);
    store.setValue("engine/workers", workers);
    store.setValue("engine/callTimeoutMs", call_timeout_ms);
    store.setValue("engine/ioTimeoutMs", io_timeout_ms);
    store.setValue("poll/intervalMs", poll_interval_ms);
    store.setValue("log/level", log::level_name(log_level));
}

void Settings::apply_environment(){
    QString env = qEnvironmentVariable("SIMSHELL_BACKEND");
    Backend b = backend;
    if(!env.isEmpty()){
        if(parse_backend(env, b)) backend = b;
        else log::warn("ignoring SIMSHELL_BACKEND=" + env.toStdString());
    }
    env = qEnvironmentVariable("SIMSHELL_MONITOR");
    if(!env.isEmpty() && !parse_endpoint(env, host, port)){
        log::warn("ignoring SIMSHELL_MONITOR=" + env.toStdString());
    }
}

bool Settings::apply_arguments(const QStringList& arguments, QString& error){
    QCommandLineParser parser;
    parser.setApplicationDescription("Desktop shell for a hardware simulation engine");
    parser.addHelpOption();
    parser.addOptions({
        {"backend", "Engine backend: mock or renode.", "name"},
        {"host", "Monitor host of the renode backend.", "host"},
        {"port", "Monitor port of the renode backend.", "port"},
        {"workers", "Number of engine worker threads.", "count"},
        {"poll-interval", "Watch poll interval in milliseconds.", "ms"},
        {"call-timeout", "Per-call engine timeout in milliseconds (0 = none).", "ms"},
        {"script", "Script to load at startup.", "path"},
        {"log-level", "trace, debug, info, warn, error.", "level"},
        QCommandLineOption(QStringList{"cli", "nogui"}, "Run the headless console instead of the GUI."),
    });

    if(!parser.parse(arguments)){
        error = parser.errorText();
        return false;
    }
    if(parser.isSet("help")){
        show_help = true;
        help_text = parser.helpText();
        return true;
    }

    auto int_option = [&](const char* name, int& out) -> bool {
        if(!parser.isSet(name)) return true;
        bool ok = false;
        int v = parser.value(name).toInt(&ok);
        if(!ok){
            error = QString("invalid value for --%1: %2").arg(QString::fromLatin1(name), parser.value(name));
            return false;
        }
        out = v;
        return true;
    };

    if(parser.isSet("backend") && !parse_backend(parser.value("backend"), backend)){
        error = "unknown backend: " + parser.value("backend");
        return false;
    }
    if(parser.isSet("host")) host = parser.value("host").toStdString();
    int p = port;
    if(!int_option("port", p)) return false;
    if(p <= 0 || p > 65535){
        error = QString("port out of range: %1").arg(p);
        return false;
    }
    port = static_cast<uint16_t>(p);
    if(!int_option("workers", workers)) return false;
    if(!int_option("poll-interval", poll_interval_ms)) return false;
    if(!int_option("call-timeout", call_timeout_ms)) return false;
    if(parser.isSet("script")) startup_script = parser.value("script").toStdString();
    if(parser.isSet("log-level")){
        auto lvl = log::parse_level(parser.value("log-level").toStdString());
        if(!lvl){
            error = "unknown log level: " + parser.value("log-level");
            return false;
        }
        log_level = *lvl;
    }
    cli = parser.isSet("cli");
    clamp();
    return true;
}

void Settings::clamp(){
    workers = std::clamp(workers, 1, 16);
    poll_interval_ms = std::clamp(poll_interval_ms, 50, 10000);
    call_timeout_ms = std::max(call_timeout_ms, 0);
    io_timeout_ms = std::clamp(io_timeout_ms, 100, 120000);
    if(port == 0) port = 1234;
}

} // namespace SimShell
