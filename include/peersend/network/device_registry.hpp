#pragma once

#include "peersend/network/protocol.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace peersend::network {

// Concurrent set of discovered peers keyed by device id.
// The first sighting of an id wins; later sightings are ignored.
class DeviceRegistry {
public:
    using DeviceAddedHandler = std::function<void(const DeviceInfo&)>;
    
    DeviceRegistry() = default;
    
    bool add_device(const DeviceInfo& device);
    bool remove_device(const std::string& device_id);
    std::optional<DeviceInfo> get_device(const std::string& device_id) const;
    std::vector<DeviceInfo> get_devices() const;
    std::size_t size() const;
    void clear();
    
    void set_device_added_handler(DeviceAddedHandler handler);

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, DeviceInfo> devices_;
    DeviceAddedHandler device_added_handler_;
};

}
