#pragma once

#include "peersend/core/config.hpp"
#include "peersend/network/device_registry.hpp"
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace peersend::network {

// One register request against a single candidate address.
class ProbeClient {
public:
    using ProbeHandler = std::function<void(std::optional<RegisterMessage>)>;
    
    virtual ~ProbeClient() = default;
    
    // The handler runs exactly once on the given io_context, with nullopt on any failure.
    virtual void async_probe(boost::asio::io_context& io_context,
                             const std::string& ip,
                             std::uint16_t port,
                             std::chrono::milliseconds timeout,
                             ProbeHandler handler) = 0;
};

class HttpProbeClient : public ProbeClient {
public:
    void async_probe(boost::asio::io_context& io_context,
                     const std::string& ip,
                     std::uint16_t port,
                     std::chrono::milliseconds timeout,
                     ProbeHandler handler) override;
};

// Active discovery: sweeps an address range with bounded concurrency.
class Prober {
public:
    Prober(const core::LocalSendConfig& config, DeviceRegistry& registry,
           std::unique_ptr<ProbeClient> client = nullptr);
    
    // Blocks until every probe has completed or failed; returns how many peers answered.
    std::size_t scan_range(const std::string& base_ip, std::uint8_t range);
    
    std::optional<DeviceInfo> check_device(const std::string& ip);
    
    // .1 .. .range above base_ip's last octet; nothing past .255, nothing for a malformed base.
    static std::vector<std::string> candidate_addresses(const std::string& base_ip, std::uint8_t range);

private:
    core::LocalSendConfig config_;
    DeviceRegistry& registry_;
    std::unique_ptr<ProbeClient> client_;
};

}
