#include "peersend/network/prober.hpp"
#include "peersend/core/logger.hpp"
#include "peersend/network/http_exchange.hpp"
#include <boost/asio.hpp>

namespace peersend::network {

void HttpProbeClient::async_probe(boost::asio::io_context& io_context,
                                  const std::string& ip,
                                  std::uint16_t port,
                                  std::chrono::milliseconds timeout,
                                  ProbeHandler handler) {
    HttpRequestOptions options;
    options.method = boost::beast::http::verb::get;
    options.host = ip;
    options.port = port;
    options.target = API_REGISTER;
    
    async_http_request(io_context, std::move(options), timeout,
        [handler = std::move(handler)](HttpResponse response) {
            if (!response.ok()) {
                handler(std::nullopt);
                return;
            }
            handler(parse_message<RegisterMessage>(response.body));
        });
}

Prober::Prober(const core::LocalSendConfig& config, DeviceRegistry& registry,
               std::unique_ptr<ProbeClient> client)
    : config_(config)
    , registry_(registry)
    , client_(client ? std::move(client) : std::make_unique<HttpProbeClient>()) {
}

std::vector<std::string> Prober::candidate_addresses(const std::string& base_ip, std::uint8_t range) {
    std::vector<std::string> candidates;
    
    boost::system::error_code ec;
    auto base = boost::asio::ip::make_address_v4(base_ip, ec);
    if (ec) {
        return candidates;
    }
    
    auto bytes = base.to_bytes();
    for (unsigned i = 1; i <= range; ++i) {
        unsigned last = bytes[3] + i;
        if (last > 255) {
            break;
        }
        auto candidate = bytes;
        candidate[3] = static_cast<unsigned char>(last);
        candidates.push_back(boost::asio::ip::address_v4(candidate).to_string());
    }
    return candidates;
}

std::size_t Prober::scan_range(const std::string& base_ip, std::uint8_t range) {
    auto candidates = candidate_addresses(base_ip, range);
    if (candidates.empty()) {
        LOG_WARN("No probe candidates for base address '{}' and range {}", base_ip, range);
        return 0;
    }
    
    LOG_INFO("Scanning {} addresses from {}", candidates.size(), candidates.front());
    
    boost::asio::io_context io_context;
    const std::size_t limit = std::max<std::size_t>(1, config_.max_concurrent_probes);
    std::size_t next = 0;
    std::size_t in_flight = 0;
    std::size_t found = 0;
    
    // Only ever runs on this thread's io_context, so no locking is needed
    std::function<void()> launch_more;
    launch_more = [&]() {
        while (in_flight < limit && next < candidates.size()) {
            const std::string ip = candidates[next++];
            ++in_flight;
            client_->async_probe(io_context, ip, config_.port, config_.probe_timeout,
                [&, ip](std::optional<RegisterMessage> reply) {
                    --in_flight;
                    if (reply && reply->id != config_.device_id) {
                        registry_.add_device(reply->to_device_info(ip, config_.port));
                        ++found;
                    } else if (!reply) {
                        LOG_TRACE("No device at {}", ip);
                    }
                    launch_more();
                });
        }
    };
    
    launch_more();
    
    try {
        io_context.run();
    } catch (const std::exception& e) {
        LOG_ERROR("Scan of {} aborted: {}", base_ip, e.what());
    }
    
    LOG_INFO("Scan finished: {} device(s) answered", found);
    return found;
}

std::optional<DeviceInfo> Prober::check_device(const std::string& ip) {
    boost::asio::io_context io_context;
    std::optional<DeviceInfo> device;
    
    client_->async_probe(io_context, ip, config_.port, config_.probe_timeout,
        [&](std::optional<RegisterMessage> reply) {
            if (reply) {
                device = reply->to_device_info(ip, config_.port);
            }
        });
    
    try {
        io_context.run();
    } catch (const std::exception& e) {
        LOG_ERROR("Probe of {} aborted: {}", ip, e.what());
    }
    return device;
}

}
