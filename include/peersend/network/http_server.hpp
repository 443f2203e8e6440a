#pragma once

#include "peersend/network/api_handler.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>

namespace peersend::network {

// Accepts HTTP/1.1 connections and hands each request to the ApiHandler.
class HttpServer {
public:
    HttpServer(boost::asio::io_context& io_context, ApiHandler& handler,
               std::size_t max_chunk_size = core::BLOCK_SIZE);
    ~HttpServer();
    
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;
    
    // Port 0 binds an ephemeral port; see port()
    bool start(std::uint16_t port);
    void stop();
    bool is_running() const { return running_; }
    std::uint16_t port() const { return bound_port_; }
    
    void set_read_timeout(std::chrono::seconds timeout) { read_timeout_ = timeout; }

private:
    void do_accept();
    
    boost::asio::io_context& io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    ApiHandler& handler_;
    std::uint64_t body_limit_;
    std::chrono::seconds read_timeout_;
    std::atomic<bool> running_;
    std::uint16_t bound_port_;
};

}
