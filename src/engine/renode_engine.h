#pragma once
#include "engine.h"
#include <chrono>
#include <memory>
#include <mutex>

class QThread;

namespace SimShell {

// Drives a running Renode instance through its monitor socket
// (renode --port <n>). All socket I/O happens on one private thread; the
// public methods block the calling worker until the reply arrives.
class RenodeEngine : public Engine {
public:
    struct Endpoint {
        std::string host{"127.0.0.1"};
        uint16_t port{1234};
        std::chrono::milliseconds io_timeout{10000};
    };

    explicit RenodeEngine(Endpoint endpoint);
    ~RenodeEngine() override;

    void load_script(const std::string& path) override;
    void start() override;
    void pause() override;
    void reset() override;
    ScalarValue read_memory(uint64_t address, DataType type) override;
    std::string send_monitor_command(const std::string& text) override;
    bool is_running() override;
    void set_log_handler(LogHandler handler) override;
    std::string name() const override { return "renode"; }

    class Connection;

private:
    std::string execute(const std::string& command);
    void emit_log(const std::string& line);

    Endpoint endpoint_;
    std::unique_ptr<QThread> thread_;
    Connection* connection_{nullptr};
    std::mutex exec_mtx_;
    std::mutex handler_mtx_;
    LogHandler log_handler_;
};

} // namespace SimShell
