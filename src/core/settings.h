#pragma once
#include "core/logger.h"
#include <QString>
#include <QStringList>
#include <cstdint>
#include <string>

class QSettings;

namespace SimShell {

struct Settings {
    enum class Backend { Mock, Renode };

    Backend backend{Backend::Mock};
    std::string host{"127.0.0.1"};
    uint16_t port{1234};
    int workers{2};
    int poll_interval_ms{500};
    int call_timeout_ms{0};      // 0 = wait forever
    int io_timeout_ms{10000};
    int shutdown_grace_ms{2000};
    log::Level log_level{log::Level::Info};

    // Command line only.
    std::string startup_script;
    bool cli{false};
    bool show_help{false};
    QString help_text;

    void load(QSettings& store);
    void save(QSettings& store) const;

    // SIMSHELL_BACKEND, SIMSHELL_MONITOR=host:port
    void apply_environment();

    // Returns false and fills error on a malformed argument list.
    bool apply_arguments(const QStringList& arguments, QString& error);

    void clamp();
};

const char* to_string(Settings::Backend backend);
bool parse_backend(const QString& text, Settings::Backend& out);
bool parse_endpoint(const QString& text, std::string& host, uint16_t& port);

} // namespace SimShell
