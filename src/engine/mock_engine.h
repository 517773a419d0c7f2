#pragma once
#include "engine.h"
#include <chrono>
#include <mutex>
#include <vector>

namespace SimShell {

// In-process substitute for a real simulator. Calls sleep for a configurable
// time and operate on a small RAM window so the UI has something to show.
class MockEngine : public Engine {
public:
    struct Timing {
        std::chrono::milliseconds load{500};
        std::chrono::milliseconds start{200};
        std::chrono::milliseconds pause{100};
        std::chrono::milliseconds reset{500};
        std::chrono::milliseconds read{10};
        std::chrono::milliseconds monitor{50};
    };

    static constexpr uint64_t kRamBase = 0x80000000ULL;
    static constexpr size_t kRamSize = 1 << 20;

    MockEngine();
    explicit MockEngine(Timing timing);

    void load_script(const std::string& path) override;
    void start() override;
    void pause() override;
    void reset() override;
    ScalarValue read_memory(uint64_t address, DataType type) override;
    std::string send_monitor_command(const std::string& text) override;
    bool is_running() override;
    void set_log_handler(LogHandler handler) override;
    std::string name() const override { return "mock"; }

private:
    void fill_ram();
    uint64_t load_raw(uint64_t address, size_t width) const;
    void store_raw(uint64_t address, size_t width, uint64_t value);
    void check_mapped(uint64_t address, size_t width) const;
    void emit_log(const std::string& line);
    std::string bus_command(const std::vector<std::string>& args);

    Timing timing_;
    mutable std::mutex mtx_;
    std::vector<uint8_t> ram_;
    std::string script_;
    bool running_{false};
    LogHandler log_handler_;
};

} // namespace SimShell
