#pragma once
#include "data_type.h"
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

namespace SimShell {

class EngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Synchronous gateway to the simulated hardware. Every call may block for a
// long time and reports failure by throwing EngineError.
class Engine {
public:
    using LogHandler = std::function<void(const std::string& line)>;

    virtual ~Engine() = default;

    virtual void load_script(const std::string& path) = 0;
    virtual void start() = 0;
    virtual void pause() = 0;
    virtual void reset() = 0;
    virtual ScalarValue read_memory(uint64_t address, DataType type) = 0;
    virtual std::string send_monitor_command(const std::string& text) = 0;
    virtual bool is_running() = 0;

    // The handler may be invoked from any thread.
    virtual void set_log_handler(LogHandler handler) = 0;

    virtual std::string name() const = 0;
};

} // namespace SimShell
