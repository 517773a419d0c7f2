#include "data_type.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <cstring>

namespace SimShell {

namespace {
struct TypeInfo {
    DataType type;
    const char* name;
    size_t width;
    bool is_signed;
    bool is_float;
};

constexpr std::array<TypeInfo, 10> kTypes = {{
    {DataType::UInt8,   "uint8",   1, false, false},
    {DataType::UInt16,  "uint16",  2, false, false},
    {DataType::UInt32,  "uint32",  4, false, false},
    {DataType::UInt64,  "uint64",  8, false, false},
    {DataType::Int8,    "int8",    1, true,  false},
    {DataType::Int16,   "int16",   2, true,  false},
    {DataType::Int32,   "int32",   4, true,  false},
    {DataType::Int64,   "int64",   8, true,  false},
    {DataType::Float32, "float32", 4, true,  true},
    {DataType::Float64, "float64", 8, true,  true},
}};

const TypeInfo& info(DataType type){
    return kTypes[static_cast<size_t>(type)];
}

bool iequals(std::string_view a, std::string_view b){
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y){
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}
}

size_t data_type_width(DataType type){ return info(type).width; }
bool data_type_is_signed(DataType type){ return info(type).is_signed; }
bool data_type_is_float(DataType type){ return info(type).is_float; }
const char* data_type_name(DataType type){ return info(type).name; }

std::optional<DataType> parse_data_type(std::string_view name){
    for(const auto& t : kTypes){
        if(iequals(name, t.name)) return t.type;
    }
    if(iequals(name, "Byte")) return DataType::UInt8;
    if(iequals(name, "HalfWord")) return DataType::UInt16;
    if(iequals(name, "Word") || iequals(name, "DoubleWord")) return DataType::UInt32;
    if(iequals(name, "QuadWord")) return DataType::UInt64;
    return std::nullopt;
}

ScalarValue decode_scalar(DataType type, uint64_t raw){
    const size_t width = data_type_width(type);
    if(width < 8) raw &= (uint64_t{1} << (width * 8)) - 1;

    switch(type){
        case DataType::Float32: {
            uint32_t bits = static_cast<uint32_t>(raw);
            float f;
            std::memcpy(&f, &bits, sizeof(f));
            return static_cast<double>(f);
        }
        case DataType::Float64: {
            double d;
            std::memcpy(&d, &raw, sizeof(d));
            return d;
        }
        case DataType::Int8:  return static_cast<int64_t>(static_cast<int8_t>(raw));
        case DataType::Int16: return static_cast<int64_t>(static_cast<int16_t>(raw));
        case DataType::Int32: return static_cast<int64_t>(static_cast<int32_t>(raw));
        case DataType::Int64: return static_cast<int64_t>(raw);
        default: return raw;
    }
}

std::string format_scalar(const ScalarValue& value, DataType type){
    char buf[64];
    if(const auto* u = std::get_if<uint64_t>(&value)){
        int digits = static_cast<int>(data_type_width(type) * 2);
        std::snprintf(buf, sizeof(buf), "0x%0*llX", digits, static_cast<unsigned long long>(*u));
    } else if(const auto* i = std::get_if<int64_t>(&value)){
        std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(*i));
    } else {
        std::snprintf(buf, sizeof(buf), "%.9g", std::get<double>(value));
    }
    return buf;
}

std::optional<uint64_t> parse_address(std::string_view text){
    while(!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while(!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);

    if(text.size() < 3 || text[0] != '0' || (text[1] != 'x' && text[1] != 'X')) return std::nullopt;
    text.remove_prefix(2);
    if(text.size() > 16) return std::nullopt;

    uint64_t value = 0;
    for(char c : text){
        int digit;
        if(c >= '0' && c <= '9') digit = c - '0';
        else if(c >= 'a' && c <= 'f') digit = c - 'a' + 10;
        else if(c >= 'A' && c <= 'F') digit = c - 'A' + 10;
        else return std::nullopt;
        value = (value << 4) | static_cast<uint64_t>(digit);
    }
    return value;
}

std::string format_address(uint64_t address){
    char buf[24];
    std::snprintf(buf, sizeof(buf), "0x%08llX", static_cast<unsigned long long>(address));
    return buf;
}

} // namespace SimShell
