#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace SimShell {

enum class DataType {
    UInt8,
    UInt16,
    UInt32,
    UInt64,
    Int8,
    Int16,
    Int32,
    Int64,
    Float32,
    Float64
};

// Unsigned types decode to uint64_t, signed types to int64_t, floats to double.
using ScalarValue = std::variant<uint64_t, int64_t, double>;

size_t data_type_width(DataType type);
bool data_type_is_signed(DataType type);
bool data_type_is_float(DataType type);
const char* data_type_name(DataType type);

// Accepts the canonical names ("uint32", "float64", ...) and the legacy
// bus-width names ("Byte", "HalfWord", "Word", "DoubleWord", "QuadWord").
std::optional<DataType> parse_data_type(std::string_view name);

// Interprets the low data_type_width(type) bytes of raw as a value of type.
ScalarValue decode_scalar(DataType type, uint64_t raw);

std::string format_scalar(const ScalarValue& value, DataType type);

// "0x" or "0X" followed by 1-16 hex digits. Anything else is rejected.
std::optional<uint64_t> parse_address(std::string_view text);

std::string format_address(uint64_t address);

} // namespace SimShell
