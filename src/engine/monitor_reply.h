#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace SimShell {

struct MonitorReply {
    std::string text;
    bool is_error{false};
};

// Removes telnet IAC negotiation sequences; an escaped IAC (0xFF 0xFF) is kept as one 0xFF.
std::string strip_telnet(std::string_view raw);

std::string strip_ansi(std::string_view text);

// True when the text ends with an interactive prompt such as "(monitor) " or "(machine-0) ".
bool ends_with_prompt(std::string_view text);

// Turns the raw bytes received after sending command into the reply body:
// echo and prompt removed, colour codes stripped, error colouring detected.
MonitorReply parse_monitor_reply(std::string_view raw, std::string_view command);

// Parses the first token of a bus read reply ("0x001000A4" or decimal).
uint64_t parse_bus_value(std::string_view reply);

// Parses a boolean property reply ("True" / "False", any case).
bool parse_bool_reply(std::string_view reply);

} // namespace SimShell
