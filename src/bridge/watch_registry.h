#pragma once
#include "engine/data_type.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace SimShell {

struct MemoryWatch {
    uint64_t id{0};
    uint64_t address{0};
    std::string name;
    DataType type{DataType::UInt32};
    std::optional<ScalarValue> last_value;
    std::optional<std::string> last_error;
    bool read_in_flight{false};
    uint64_t read_count{0};
    uint64_t failure_count{0};

    std::string display_value() const;
};

// Ordered list of watches, in creation order.
class WatchRegistry {
public:
    enum class AddError { None, EmptyName, DuplicateName, AddressOverflow };

    struct AddResult {
        AddError error{AddError::None};
        uint64_t id{0};
        bool ok() const { return error == AddError::None; }
    };

    AddResult add(uint64_t address, const std::string& name, DataType type);
    bool remove(const std::string& name);
    void clear();

    MemoryWatch* find(uint64_t id);
    const MemoryWatch* find(uint64_t id) const;
    const MemoryWatch* find(const std::string& name) const;
    const std::vector<MemoryWatch>& entries() const { return watches_; }
    size_t size() const { return watches_.size(); }
    bool empty() const { return watches_.empty(); }

    // Marks a read as started. False if one is already outstanding.
    bool begin_read(uint64_t id);
    // Settle the outstanding read. Both return false if the watch is gone.
    bool record_value(uint64_t id, const ScalarValue& value);
    bool record_error(uint64_t id, const std::string& error);
    // Settle the outstanding read without touching value or error.
    bool cancel_read(uint64_t id);

private:
    std::vector<MemoryWatch> watches_;
    uint64_t next_id_{1};
};

const char* to_string(WatchRegistry::AddError error);

} // namespace SimShell
