#include "logger.h"
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <mutex>
#include <string>

namespace {
using SimShell::log::Level;

std::mutex mtx;
std::atomic<Level> g_level{Level::Info};

constexpr const char* tag(Level l) {
    switch(l){
        case Level::Trace: return "[TRACE] ";
        case Level::Debug: return "[DEBUG] ";
        case Level::Info:  return "[INFO ] ";
        case Level::Warn:  return "[WARN ] ";
        case Level::Error: return "[ERROR] ";
        case Level::Fatal: return "[FATAL] ";
    }
    return "";
}

bool enabled(Level l){
    return static_cast<int>(l) >= static_cast<int>(g_level.load());
}

void stamp(char* buf, size_t len){
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);
    std::snprintf(buf, len, "%02d:%02d:%02d.%03d ", tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
}

void out(Level l, std::string_view s){
    if(!enabled(l)) return;
    char ts[16];
    stamp(ts, sizeof(ts));
    std::lock_guard<std::mutex> lock(mtx);
    std::fwrite(ts, 1, std::char_traits<char>::length(ts), stdout);
    std::fwrite(tag(l), 1, std::char_traits<char>::length(tag(l)), stdout);
    std::fwrite(s.data(), 1, s.size(), stdout);
    std::fwrite("\n", 1, 1, stdout);
    if(l >= Level::Error) std::fflush(stdout);
}
}

namespace SimShell::log {
void set_level(Level lvl){ g_level = lvl; }
Level level(){ return g_level.load(); }

std::optional<Level> parse_level(std::string_view name){
    std::string lower;
    for(char c : name) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if(lower == "trace") return Level::Trace;
    if(lower == "debug") return Level::Debug;
    if(lower == "info") return Level::Info;
    if(lower == "warn" || lower == "warning") return Level::Warn;
    if(lower == "error") return Level::Error;
    if(lower == "fatal") return Level::Fatal;
    return std::nullopt;
}

const char* level_name(Level lvl){
    switch(lvl){
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Error: return "error";
        case Level::Fatal: return "fatal";
    }
    return "info";
}

void trace(std::string_view s){ out(Level::Trace, s); }
void debug(std::string_view s){ out(Level::Debug, s); }
void info (std::string_view s){ out(Level::Info , s); }
void warn (std::string_view s){ out(Level::Warn , s); }
void error(std::string_view s){ out(Level::Error, s); }
void fatal(std::string_view s){ out(Level::Fatal, s); }
void write(Level lvl, std::string_view s){ out(lvl, s); }
}
