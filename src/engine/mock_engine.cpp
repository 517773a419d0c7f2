#include "mock_engine.h"
#include "core/logger.h"
#include <cstdio>
#include <sstream>
#include <thread>

namespace SimShell {

namespace {
constexpr uint32_t kFillPattern = 0xDEADBEEF;

struct BusAccess {
    const char* name;
    size_t width;
};

constexpr BusAccess kReads[] = {
    {"ReadByte", 1}, {"ReadWord", 2}, {"ReadDoubleWord", 4}, {"ReadQuadWord", 8}};
constexpr BusAccess kWrites[] = {
    {"WriteByte", 1}, {"WriteWord", 2}, {"WriteDoubleWord", 4}, {"WriteQuadWord", 8}};

uint64_t parse_number(const std::string& text){
    size_t used = 0;
    uint64_t v = 0;
    try {
        v = std::stoull(text, &used, 0);
    } catch(const std::exception&) {
        throw EngineError("Invalid number: " + text);
    }
    if(used != text.size()) throw EngineError("Invalid number: " + text);
    return v;
}

std::string hex(uint64_t v, size_t width){
    char buf[24];
    std::snprintf(buf, sizeof(buf), "0x%0*llX", static_cast<int>(width * 2), static_cast<unsigned long long>(v));
    return buf;
}
}

MockEngine::MockEngine() : MockEngine(Timing{}) {}

MockEngine::MockEngine(Timing timing) : timing_(timing), ram_(kRamSize) {
    fill_ram();
    log::info("MockEngine initialized");
}

void MockEngine::fill_ram(){
    for(size_t i = 0; i < ram_.size(); ++i){
        ram_[i] = static_cast<uint8_t>(kFillPattern >> (8 * (i % 4)));
    }
}

void MockEngine::load_script(const std::string& path){
    log::info("Loading script: " + path);
    std::this_thread::sleep_for(timing_.load);
    if(path.empty()) throw EngineError("Invalid path");
    {
        std::lock_guard<std::mutex> lock(mtx_);
        script_ = path;
        running_ = false;
    }
    emit_log("Script loaded: " + path);
}

void MockEngine::start(){
    std::this_thread::sleep_for(timing_.start);
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if(script_.empty()) throw EngineError("No machine loaded");
        running_ = true;
    }
    emit_log("Simulation started");
}

void MockEngine::pause(){
    std::this_thread::sleep_for(timing_.pause);
    {
        std::lock_guard<std::mutex> lock(mtx_);
        running_ = false;
    }
    emit_log("Simulation paused");
}

void MockEngine::reset(){
    std::this_thread::sleep_for(timing_.reset);
    {
        std::lock_guard<std::mutex> lock(mtx_);
        running_ = false;
        script_.clear();
        fill_ram();
    }
    emit_log("Simulation reset");
}

ScalarValue MockEngine::read_memory(uint64_t address, DataType type){
    std::this_thread::sleep_for(timing_.read);
    std::lock_guard<std::mutex> lock(mtx_);
    return decode_scalar(type, load_raw(address, data_type_width(type)));
}

std::string MockEngine::send_monitor_command(const std::string& text){
    std::this_thread::sleep_for(timing_.monitor);

    std::istringstream ss(text);
    std::vector<std::string> args;
    for(std::string tok; ss >> tok;) args.push_back(tok);
    if(args.empty()) throw EngineError("Empty command");

    const std::string& cmd = args[0];
    if(cmd == "help"){
        return "Available commands:\n"
               "  help                              show this text\n"
               "  version                           show engine version\n"
               "  sysbus Read{Byte,Word,DoubleWord,QuadWord} <addr>\n"
               "  sysbus Write{Byte,Word,DoubleWord,QuadWord} <addr> <value>";
    }
    if(cmd == "version") return "SimShell mock engine 1.0";
    if(cmd == "sysbus") return bus_command(args);
    throw EngineError("Unknown command: " + cmd);
}

std::string MockEngine::bus_command(const std::vector<std::string>& args){
    if(args.size() < 2) throw EngineError("sysbus: missing operation");
    const std::string& op = args[1];

    for(const auto& r : kReads){
        if(op != r.name) continue;
        if(args.size() != 3) throw EngineError(std::string("usage: sysbus ") + r.name + " <addr>");
        uint64_t addr = parse_number(args[2]);
        std::lock_guard<std::mutex> lock(mtx_);
        return hex(load_raw(addr, r.width), r.width);
    }
    for(const auto& w : kWrites){
        if(op != w.name) continue;
        if(args.size() != 4) throw EngineError(std::string("usage: sysbus ") + w.name + " <addr> <value>");
        uint64_t addr = parse_number(args[2]);
        uint64_t value = parse_number(args[3]);
        std::lock_guard<std::mutex> lock(mtx_);
        store_raw(addr, w.width, value);
        return "";
    }
    throw EngineError("sysbus: unknown operation " + op);
}

bool MockEngine::is_running(){
    std::lock_guard<std::mutex> lock(mtx_);
    return running_;
}

void MockEngine::set_log_handler(LogHandler handler){
    std::lock_guard<std::mutex> lock(mtx_);
    log_handler_ = std::move(handler);
}

void MockEngine::check_mapped(uint64_t address, size_t width) const {
    if(address < kRamBase || address - kRamBase > kRamSize - width){
        throw EngineError("unmapped");
    }
}

uint64_t MockEngine::load_raw(uint64_t address, size_t width) const {
    check_mapped(address, width);
    uint64_t v = 0;
    size_t off = static_cast<size_t>(address - kRamBase);
    for(size_t i = 0; i < width; ++i) v |= uint64_t{ram_[off + i]} << (8 * i);
    return v;
}

void MockEngine::store_raw(uint64_t address, size_t width, uint64_t value){
    check_mapped(address, width);
    size_t off = static_cast<size_t>(address - kRamBase);
    for(size_t i = 0; i < width; ++i) ram_[off + i] = static_cast<uint8_t>(value >> (8 * i));
}

void MockEngine::emit_log(const std::string& line){
    LogHandler handler;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        handler = log_handler_;
    }
    log::info(line);
    if(handler) handler(line);
}

} // namespace SimShell
