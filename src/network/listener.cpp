#include "peersend/network/listener.hpp"
#include "peersend/core/logger.hpp"

namespace peersend::network {

using boost::asio::ip::udp;

Listener::Listener(boost::asio::io_context& io_context, const core::LocalSendConfig& config,
                   DeviceRegistry& registry)
    : io_context_(io_context)
    , socket_(io_context)
    , config_(config)
    , registry_(registry)
    , running_(false) {
}

Listener::~Listener() {
    stop();
}

bool Listener::start() {
    if (running_) {
        LOG_WARN("Listener already running");
        return false;
    }
    
    try {
        auto group = boost::asio::ip::make_address(config_.multicast_group);
        
        socket_.open(udp::v4());
        socket_.set_option(udp::socket::reuse_address(true));
        socket_.bind(udp::endpoint(udp::v4(), config_.multicast_port));
        socket_.set_option(boost::asio::ip::multicast::join_group(group));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start multicast listener: {}", e.what());
        boost::system::error_code ec;
        socket_.close(ec);
        return false;
    }
    
    running_ = true;
    do_receive();
    
    LOG_INFO("Listening for announcements on {}:{}", config_.multicast_group, config_.multicast_port);
    return true;
}

void Listener::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    
    boost::system::error_code ec;
    socket_.close(ec);
    LOG_INFO("Listener stopped");
}

void Listener::do_receive() {
    if (!running_) {
        return;
    }
    
    socket_.async_receive_from(
        boost::asio::buffer(receive_buffer_), sender_endpoint_,
        [this](boost::system::error_code ec, std::size_t bytes_received) {
            if (!running_ || ec == boost::asio::error::operation_aborted) {
                return;
            }
            
            if (ec) {
                LOG_WARN("Multicast receive error: {}", ec.message());
            } else {
                handle_datagram(sender_endpoint_.address().to_string(),
                                std::string_view(receive_buffer_.data(), bytes_received));
            }
            do_receive();
        });
}

bool Listener::handle_datagram(const std::string& sender_ip, std::string_view data) {
    auto announcement = parse_message<Announcement>(data);
    if (!announcement) {
        LOG_DEBUG("Dropped malformed announcement from {}", sender_ip);
        return false;
    }
    
    if (announcement->type != ANNOUNCE_TYPE) {
        LOG_DEBUG("Dropped '{}' datagram from {}", announcement->type, sender_ip);
        return false;
    }
    
    if (announcement->id == config_.device_id) {
        return false;
    }
    
    return registry_.add_device(announcement->to_device_info(sender_ip, config_.port));
}

}
