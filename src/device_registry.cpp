#include "device_registry.hpp"
#include "fault.hpp"
#include "logging.hpp"

namespace {
constexpr const char* kTag = "REGISTRY";
} // namespace

const char* device_state_name(DeviceState state) {
    switch (state) {
        case DeviceState::Unseen: return "unseen";
        case DeviceState::Discovered: return "discovered";
        case DeviceState::Connecting: return "connecting";
        case DeviceState::Connected: return "connected";
        case DeviceState::Subscribed: return "subscribed";
        case DeviceState::Failed: return "failed";
    }
    return "unknown";
}

bool is_legal_transition(DeviceState from, DeviceState to) {
    switch (from) {
        case DeviceState::Unseen:
            return to == DeviceState::Discovered;
        case DeviceState::Discovered:
            return to == DeviceState::Connecting;
        case DeviceState::Connecting:
            return to == DeviceState::Connected || to == DeviceState::Failed;
        case DeviceState::Connected:
            return to == DeviceState::Subscribed || to == DeviceState::Failed;
        case DeviceState::Subscribed:
            return to == DeviceState::Failed;
        case DeviceState::Failed:
            return to == DeviceState::Connecting || to == DeviceState::Discovered;
    }
    return false;
}

DeviceRegistry::DeviceRegistry(const std::vector<DeviceConfig>& devices) {
    entries_.reserve(devices.size());
    for (const DeviceConfig& dev : devices) {
        if (by_name_.count(dev.name) != 0) {
            log_error(kTag, "duplicate device name %s ignored", dev.name.c_str());
            continue;
        }
        auto entry = std::make_unique<Entry>();
        entry->desc.name = dev.name;
        entry->desc.hardware_address = dev.address;
        entry->desc.state = DeviceState::Unseen;
        entry->desc.last_seen = std::chrono::system_clock::time_point{};
        entry->desc.consecutive_failures = 0;
        entry->desc.total_failures = 0;
        entry->desc.has_connection = false;
        entry->desc.connection = BleConnection{0, dev.address};
        by_name_[dev.name] = entries_.size();
        entries_.push_back(std::move(entry));
    }
}

DeviceRegistry::Entry* DeviceRegistry::lookup(const std::string& name) const {
    const auto it = by_name_.find(name);
    if (it == by_name_.end()) {
        return nullptr;
    }
    return entries_[it->second].get();
}

bool DeviceRegistry::find(const std::string& name, DeviceDescriptor& out) const {
    const Entry* entry = lookup(name);
    if (entry == nullptr) {
        return false;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    out = entry->desc;
    return true;
}

bool DeviceRegistry::find_by_address(const BleAddress& address, std::string& name_out) const {
    // Name and address are immutable after construction.
    for (const auto& entry : entries_) {
        if (entry->desc.hardware_address == address) {
            name_out = entry->desc.name;
            return true;
        }
    }
    return false;
}

std::vector<DeviceDescriptor> DeviceRegistry::snapshot() const {
    std::vector<DeviceDescriptor> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        out.push_back(entry->desc);
    }
    return out;
}

std::vector<DeviceDescriptor> DeviceRegistry::in_state(DeviceState state) const {
    std::vector<DeviceDescriptor> out;
    for (const auto& entry : entries_) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->desc.state == state) {
            out.push_back(entry->desc);
        }
    }
    return out;
}

bool DeviceRegistry::all_in_state(DeviceState state) const {
    for (const auto& entry : entries_) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->desc.state != state) {
            return false;
        }
    }
    return true;
}

bool DeviceRegistry::transition_locked(Entry& entry, DeviceState from, DeviceState to) {
    const char* name = entry.desc.name.c_str();
    if (!is_legal_transition(from, to)) {
        record_illegal_transition(name, device_state_name(from), device_state_name(to));
        return false;
    }
    if (entry.desc.state != from) {
        log_debug(kTag, "%s: expected %s but is %s, skipping -> %s",
                  name, device_state_name(from), device_state_name(entry.desc.state), device_state_name(to));
        return false;
    }
    entry.desc.state = to;
    if (to == DeviceState::Subscribed) {
        entry.desc.consecutive_failures = 0;
    }
    record_state_transition(name, device_state_name(from), device_state_name(to));
    return true;
}

bool DeviceRegistry::transition(const std::string& name, DeviceState from, DeviceState to) {
    Entry* entry = lookup(name);
    if (entry == nullptr) {
        log_warn(kTag, "transition on unknown device %s", name.c_str());
        return false;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return transition_locked(*entry, from, to);
}

bool DeviceRegistry::mark_connected(const std::string& name, const BleConnection& conn) {
    Entry* entry = lookup(name);
    if (entry == nullptr) {
        return false;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (!transition_locked(*entry, DeviceState::Connecting, DeviceState::Connected)) {
        return false;
    }
    entry->desc.has_connection = true;
    entry->desc.connection = conn;
    return true;
}

bool DeviceRegistry::mark_failed(const std::string& name, DeviceState from) {
    Entry* entry = lookup(name);
    if (entry == nullptr) {
        return false;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (!transition_locked(*entry, from, DeviceState::Failed)) {
        return false;
    }
    entry->desc.consecutive_failures += 1;
    entry->desc.total_failures += 1;
    entry->desc.has_connection = false;
    return true;
}

bool DeviceRegistry::mark_stale(const std::string& name) {
    Entry* entry = lookup(name);
    if (entry == nullptr) {
        return false;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (!transition_locked(*entry, DeviceState::Subscribed, DeviceState::Failed)) {
        return false;
    }
    entry->desc.has_connection = false;
    return true;
}

void DeviceRegistry::note_seen(const std::string& name, std::chrono::system_clock::time_point when) {
    Entry* entry = lookup(name);
    if (entry == nullptr) {
        return;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->desc.last_seen = when;
}

void DeviceRegistry::note_read_success(const std::string& name, std::chrono::system_clock::time_point when) {
    Entry* entry = lookup(name);
    if (entry == nullptr) {
        return;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->desc.last_seen = when;
    entry->desc.consecutive_failures = 0;
}

uint32_t DeviceRegistry::note_read_failure(const std::string& name) {
    Entry* entry = lookup(name);
    if (entry == nullptr) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->desc.consecutive_failures += 1;
    entry->desc.total_failures += 1;
    return entry->desc.consecutive_failures;
}
