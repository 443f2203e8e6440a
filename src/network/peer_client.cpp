#include "peersend/network/peer_client.hpp"
#include "peersend/core/logger.hpp"
#include <boost/asio/io_context.hpp>

namespace peersend::network {

PeerClient::PeerClient(std::chrono::milliseconds timeout)
    : timeout_(timeout) {
}

HttpResponse PeerClient::register_with(const DeviceInfo& peer, const RegisterMessage& self) {
    return perform(peer, API_REGISTER, serialize_message(self), "application/json");
}

HttpResponse PeerClient::request(const DeviceInfo& peer, const FileRequest& request) {
    return perform(peer, API_REQUEST, serialize_message(request), "application/json");
}

HttpResponse PeerClient::prepare_upload(const DeviceInfo& peer, const PrepareRequest& request) {
    return perform(peer, API_PREPARE_UPLOAD, serialize_message(request), "application/json");
}

HttpResponse PeerClient::upload(const DeviceInfo& peer, const BlockRequest& block,
                                std::span<const std::uint8_t> chunk) {
    return perform(peer, std::string(API_UPLOAD) + "?" + block.to_query(),
                   std::string(reinterpret_cast<const char*>(chunk.data()), chunk.size()),
                   "application/octet-stream");
}

HttpResponse PeerClient::cancel(const DeviceInfo& peer, const CancelRequest& request) {
    return perform(peer, API_CANCEL, serialize_message(request), "application/json");
}

HttpResponse PeerClient::perform(const DeviceInfo& peer, std::string target,
                                 std::string body, std::string content_type) {
    boost::asio::io_context io_context;
    
    HttpRequestOptions options;
    options.method = boost::beast::http::verb::post;
    options.host = peer.ip;
    options.port = peer.port;
    options.target = std::move(target);
    options.body = std::move(body);
    options.content_type = std::move(content_type);
    
    HttpResponse result;
    async_http_request(io_context, std::move(options), timeout_,
        [&result](HttpResponse response) {
            result = std::move(response);
        });
    
    try {
        io_context.run();
    } catch (const std::exception& e) {
        result = HttpResponse{};
        result.error = e.what();
    }
    
    if (!result.transport_ok()) {
        LOG_WARN("Request to {}:{} failed: {}", peer.ip, peer.port, result.error);
    } else if (result.status != 200) {
        LOG_DEBUG("Peer {}:{} answered {}: {}", peer.ip, peer.port, result.status, result.body);
    }
    return result;
}

}
