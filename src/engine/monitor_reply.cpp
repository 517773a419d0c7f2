#include "monitor_reply.h"
#include "engine.h"
#include <cctype>
#include <vector>

namespace SimShell {

namespace {
constexpr unsigned char IAC = 255;
constexpr unsigned char SB = 250;
constexpr unsigned char SE = 240;
constexpr unsigned char WILL = 251;
constexpr unsigned char DONT = 254;

std::string_view trim(std::string_view s){
    while(!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while(!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool is_prompt_line(std::string_view line){
    line = trim(line);
    if(line.size() < 3 || line.front() != '(' || line.back() != ')') return false;
    for(size_t i = 1; i + 1 < line.size(); ++i){
        if(line[i] == '(' || line[i] == ')' || std::isspace(static_cast<unsigned char>(line[i]))) return false;
    }
    return true;
}

bool has_error_marker(std::string_view raw, std::string_view body){
    // Errors are printed in red.
    if(raw.find("\x1b[31") != std::string_view::npos) return true;
    body = trim(body);
    for(std::string_view prefix : {"There was an error", "Could not find", "Error:"}){
        if(body.substr(0, prefix.size()) == prefix) return true;
    }
    return false;
}
}

std::string strip_telnet(std::string_view raw){
    std::string out;
    out.reserve(raw.size());
    for(size_t i = 0; i < raw.size(); ++i){
        auto c = static_cast<unsigned char>(raw[i]);
        if(c != IAC){
            out.push_back(raw[i]);
            continue;
        }
        if(i + 1 >= raw.size()) break;
        auto cmd = static_cast<unsigned char>(raw[i + 1]);
        if(cmd == IAC){
            out.push_back(raw[i]);
            ++i;
        } else if(cmd >= WILL && cmd <= DONT){
            i += 2;
        } else if(cmd == SB){
            // Skip to IAC SE.
            size_t j = i + 2;
            while(j + 1 < raw.size() && !(static_cast<unsigned char>(raw[j]) == IAC && static_cast<unsigned char>(raw[j + 1]) == SE)) ++j;
            i = j + 1;
        } else {
            ++i;
        }
    }
    return out;
}

std::string strip_ansi(std::string_view text){
    std::string out;
    out.reserve(text.size());
    for(size_t i = 0; i < text.size(); ++i){
        if(text[i] == '\r') continue;
        if(text[i] != '\x1b'){
            out.push_back(text[i]);
            continue;
        }
        if(i + 1 < text.size() && text[i + 1] == '['){
            size_t j = i + 2;
            while(j < text.size() && !std::isalpha(static_cast<unsigned char>(text[j]))) ++j;
            i = j;
        } else {
            ++i;
        }
    }
    return out;
}

bool ends_with_prompt(std::string_view text){
    std::string clean = strip_ansi(strip_telnet(text));
    if(clean.empty() || clean.back() != ' ') return false;
    size_t nl = clean.rfind('\n');
    std::string_view last = nl == std::string::npos ? std::string_view(clean) : std::string_view(clean).substr(nl + 1);
    return is_prompt_line(last);
}

MonitorReply parse_monitor_reply(std::string_view raw, std::string_view command){
    std::string telnet_free = strip_telnet(raw);
    std::string clean = strip_ansi(telnet_free);

    std::vector<std::string_view> lines;
    std::string_view rest(clean);
    while(!rest.empty()){
        size_t nl = rest.find('\n');
        lines.push_back(rest.substr(0, nl));
        if(nl == std::string_view::npos) break;
        rest.remove_prefix(nl + 1);
    }

    if(!lines.empty() && is_prompt_line(lines.back())) lines.pop_back();
    size_t first = 0;
    std::string_view cmd = trim(command);
    while(first < lines.size() && trim(lines[first]).empty()) ++first;
    if(first < lines.size()){
        std::string_view echoed = trim(lines[first]);
        // The echo may be preceded by the previous prompt.
        if(echoed == cmd || (echoed.size() > cmd.size() && echoed.substr(echoed.size() - cmd.size()) == cmd && echoed.front() == '(')) ++first;
    }
    while(lines.size() > first && trim(lines.back()).empty()) lines.pop_back();

    MonitorReply reply;
    for(size_t i = first; i < lines.size(); ++i){
        if(!reply.text.empty()) reply.text.push_back('\n');
        reply.text.append(lines[i]);
    }
    reply.is_error = has_error_marker(telnet_free, reply.text);
    return reply;
}

uint64_t parse_bus_value(std::string_view reply){
    reply = trim(reply);
    size_t end = 0;
    while(end < reply.size() && !std::isspace(static_cast<unsigned char>(reply[end]))) ++end;
    std::string token(reply.substr(0, end));
    if(token.empty()) throw EngineError("empty bus read reply");
    size_t used = 0;
    uint64_t v = 0;
    try {
        v = std::stoull(token, &used, 0);
    } catch(const std::exception&) {
        throw EngineError("unexpected bus read reply: " + std::string(reply));
    }
    if(used != token.size()) throw EngineError("unexpected bus read reply: " + std::string(reply));
    return v;
}

bool parse_bool_reply(std::string_view reply){
    reply = trim(reply);
    std::string lower;
    for(char c : reply) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if(lower == "true") return true;
    if(lower == "false") return false;
    throw EngineError("unexpected status reply: " + std::string(reply));
}

} // namespace SimShell
