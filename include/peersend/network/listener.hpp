#pragma once

#include "peersend/core/config.hpp"
#include "peersend/network/device_registry.hpp"
#include <boost/asio.hpp>
#include <array>
#include <atomic>
#include <string_view>

namespace peersend::network {

// Receives multicast announcements and feeds them into the registry.
class Listener {
public:
    Listener(boost::asio::io_context& io_context, const core::LocalSendConfig& config,
             DeviceRegistry& registry);
    ~Listener();
    
    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;
    
    bool start();
    void stop();
    bool is_running() const { return running_; }
    
    // Returns true when the datagram produced a new registry entry.
    bool handle_datagram(const std::string& sender_ip, std::string_view data);

private:
    void do_receive();
    
    boost::asio::io_context& io_context_;
    boost::asio::ip::udp::socket socket_;
    boost::asio::ip::udp::endpoint sender_endpoint_;
    std::array<char, 65536> receive_buffer_;
    
    core::LocalSendConfig config_;
    DeviceRegistry& registry_;
    std::atomic<bool> running_;
};

}
