#pragma once

#include "peersend/core/config.hpp"
#include "peersend/network/protocol.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <string>

namespace peersend::network {

// Periodically multicasts this device's identity.
class Announcer {
public:
    Announcer(boost::asio::io_context& io_context, const core::LocalSendConfig& config,
              std::string fingerprint = {});
    ~Announcer();
    
    Announcer(const Announcer&) = delete;
    Announcer& operator=(const Announcer&) = delete;
    
    // Opens the socket, announces immediately, then on every interval tick
    bool start();
    void stop();
    bool is_running() const { return running_; }
    
    // Returns false on a send failure; a short write only warns.
    bool send_announcement();
    
    Announcement build_announcement() const;

private:
    void schedule_next();
    
    boost::asio::io_context& io_context_;
    boost::asio::ip::udp::socket socket_;
    boost::asio::steady_timer timer_;
    boost::asio::ip::udp::endpoint multicast_endpoint_;
    
    core::LocalSendConfig config_;
    std::string fingerprint_;
    std::string announcement_id_;
    std::atomic<bool> running_;
};

}
