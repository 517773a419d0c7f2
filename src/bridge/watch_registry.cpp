#include "watch_registry.h"
#include <algorithm>
#include <limits>

namespace SimShell {

std::string MemoryWatch::display_value() const {
    if(!last_value) return "-";
    return format_scalar(*last_value, type);
}

const char* to_string(WatchRegistry::AddError error){
    switch(error){
        case WatchRegistry::AddError::None:            return "ok";
        case WatchRegistry::AddError::EmptyName:       return "watch name must not be empty";
        case WatchRegistry::AddError::DuplicateName:   return "a watch with this name already exists";
        case WatchRegistry::AddError::AddressOverflow: return "address range exceeds 64-bit space";
    }
    return "?";
}

WatchRegistry::AddResult WatchRegistry::add(uint64_t address, const std::string& name, DataType type){
    AddResult result;
    if(name.empty()){
        result.error = AddError::EmptyName;
        return result;
    }
    if(find(name)){
        result.error = AddError::DuplicateName;
        return result;
    }
    if(address > std::numeric_limits<uint64_t>::max() - (data_type_width(type) - 1)){
        result.error = AddError::AddressOverflow;
        return result;
    }

    MemoryWatch watch;
    watch.id = next_id_++;
    watch.address = address;
    watch.name = name;
    watch.type = type;
    watches_.push_back(std::move(watch));
    result.id = watches_.back().id;
    return result;
}

bool WatchRegistry::remove(const std::string& name){
    auto it = std::find_if(watches_.begin(), watches_.end(), [&](const MemoryWatch& w){ return w.name == name; });
    if(it == watches_.end()) return false;
    watches_.erase(it);
    return true;
}

void WatchRegistry::clear(){
    watches_.clear();
}

MemoryWatch* WatchRegistry::find(uint64_t id){
    auto it = std::find_if(watches_.begin(), watches_.end(), [&](const MemoryWatch& w){ return w.id == id; });
    return it == watches_.end() ? nullptr : &*it;
}

const MemoryWatch* WatchRegistry::find(uint64_t id) const {
    return const_cast<WatchRegistry*>(this)->find(id);
}

const MemoryWatch* WatchRegistry::find(const std::string& name) const {
    auto it = std::find_if(watches_.begin(), watches_.end(), [&](const MemoryWatch& w){ return w.name == name; });
    return it == watches_.end() ? nullptr : &*it;
}

bool WatchRegistry::begin_read(uint64_t id){
    MemoryWatch* w = find(id);
    if(!w || w->read_in_flight) return false;
    w->read_in_flight = true;
    return true;
}

bool WatchRegistry::record_value(uint64_t id, const ScalarValue& value){
    MemoryWatch* w = find(id);
    if(!w) return false;
    w->read_in_flight = false;
    w->last_value = value;
    w->last_error.reset();
    ++w->read_count;
    return true;
}

bool WatchRegistry::record_error(uint64_t id, const std::string& error){
    MemoryWatch* w = find(id);
    if(!w) return false;
    w->read_in_flight = false;
    w->last_error = error;
    ++w->read_count;
    ++w->failure_count;
    return true;
}

bool WatchRegistry::cancel_read(uint64_t id){
    MemoryWatch* w = find(id);
    if(!w) return false;
    w->read_in_flight = false;
    return true;
}

} // namespace SimShell
