#include "peersend/network/device_registry.hpp"
#include "peersend/core/logger.hpp"

namespace peersend::network {

bool DeviceRegistry::add_device(const DeviceInfo& device) {
    DeviceAddedHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = devices_.try_emplace(device.id, device);
        if (!inserted) {
            return false;
        }
        handler = device_added_handler_;
    }
    
    LOG_INFO("Discovered device '{}' ({}) at {}:{}", device.name, device.id, device.ip, device.port);
    
    // Invoked outside the lock so the handler may query the registry
    if (handler) {
        handler(device);
    }
    return true;
}

bool DeviceRegistry::remove_device(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.erase(device_id) > 0;
}

std::optional<DeviceInfo> DeviceRegistry::get_device(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(device_id);
    if (it != devices_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<DeviceInfo> DeviceRegistry::get_devices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeviceInfo> devices;
    devices.reserve(devices_.size());
    
    for (const auto& [id, info] : devices_) {
        devices.push_back(info);
    }
    
    return devices;
}

std::size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

void DeviceRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_.clear();
}

void DeviceRegistry::set_device_added_handler(DeviceAddedHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    device_added_handler_ = std::move(handler);
}

}
