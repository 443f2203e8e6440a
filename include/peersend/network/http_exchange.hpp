#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/beast/http/verb.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace peersend::network {

struct HttpResponse {
    unsigned status = 0;
    std::string body;
    std::string error;   // transport failure; empty when a response arrived
    
    bool transport_ok() const { return error.empty(); }
    bool ok() const { return transport_ok() && status == 200; }
};

struct HttpRequestOptions {
    boost::beast::http::verb method = boost::beast::http::verb::get;
    std::string host;
    std::uint16_t port = 0;
    std::string target;
    std::string body;
    std::string content_type = "application/json";
};

using HttpResponseHandler = std::function<void(HttpResponse)>;

// One request/response over a fresh connection. The handler runs exactly
// once on io_context; the whole exchange is bounded by timeout.
void async_http_request(boost::asio::io_context& io_context,
                        HttpRequestOptions options,
                        std::chrono::milliseconds timeout,
                        HttpResponseHandler handler);

}
