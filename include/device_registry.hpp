#pragma once

#include "ble_transport.hpp"
#include "config.hpp"
#include "telemetry.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class DeviceState : uint8_t {
    Unseen = 0,
    Discovered,
    Connecting,
    Connected,
    Subscribed,
    Failed,
};

const char* device_state_name(DeviceState state);
bool is_legal_transition(DeviceState from, DeviceState to);

struct DeviceDescriptor {
    std::string name;
    BleAddress hardware_address;
    DeviceState state;
    std::chrono::system_clock::time_point last_seen; // epoch when never seen
    uint32_t consecutive_failures;
    uint32_t total_failures;
    bool has_connection;
    BleConnection connection;
};

// Configured devices and their live connection state. The set of entries is
// fixed at construction; each entry has its own lock and every state change
// is a compare-and-set against the state the caller last observed.
class DeviceRegistry {
public:
    explicit DeviceRegistry(const std::vector<DeviceConfig>& devices);

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    std::size_t size() const { return entries_.size(); }
    bool find(const std::string& name, DeviceDescriptor& out) const;
    bool find_by_address(const BleAddress& address, std::string& name_out) const;
    std::vector<DeviceDescriptor> snapshot() const;
    std::vector<DeviceDescriptor> in_state(DeviceState state) const;
    bool all_in_state(DeviceState state) const;

    bool transition(const std::string& name, DeviceState from, DeviceState to);
    // Connecting -> Connected, remembering the live connection.
    bool mark_connected(const std::string& name, const BleConnection& conn);
    // `from` -> Failed; bumps the failure counters and forgets the connection.
    bool mark_failed(const std::string& name, DeviceState from);
    // Subscribed -> Failed after read misses already counted by note_read_failure();
    // leaves the failure counters as they are.
    bool mark_stale(const std::string& name);

    void note_seen(const std::string& name, std::chrono::system_clock::time_point when);
    void note_read_success(const std::string& name, std::chrono::system_clock::time_point when);
    // Returns the consecutive failure count after the increment.
    uint32_t note_read_failure(const std::string& name);

private:
    struct Entry {
        mutable std::mutex mutex;
        DeviceDescriptor desc;
    };

    Entry* lookup(const std::string& name) const;
    bool transition_locked(Entry& entry, DeviceState from, DeviceState to);

    std::vector<std::unique_ptr<Entry>> entries_;
    std::unordered_map<std::string, std::size_t> by_name_;
};
