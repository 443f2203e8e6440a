#pragma once

#include "peersend/network/http_exchange.hpp"
#include "peersend/network/protocol.hpp"
#include <chrono>
#include <cstdint>
#include <span>
#include <string>

namespace peersend::network {

// Blocking client for the peer's HTTP API. Each call runs its own io_context
// on the calling thread.
class PeerClient {
public:
    explicit PeerClient(std::chrono::milliseconds timeout = std::chrono::seconds(30));
    
    HttpResponse register_with(const DeviceInfo& peer, const RegisterMessage& self);
    HttpResponse request(const DeviceInfo& peer, const FileRequest& request);
    HttpResponse prepare_upload(const DeviceInfo& peer, const PrepareRequest& request);
    HttpResponse upload(const DeviceInfo& peer, const BlockRequest& block,
                        std::span<const std::uint8_t> chunk);
    HttpResponse cancel(const DeviceInfo& peer, const CancelRequest& request);

private:
    HttpResponse perform(const DeviceInfo& peer, std::string target,
                         std::string body, std::string content_type);
    
    std::chrono::milliseconds timeout_;
};

}
