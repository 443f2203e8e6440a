#include "peersend/network/announcer.hpp"
#include "peersend/core/logger.hpp"
#include "peersend/core/utils.hpp"

namespace peersend::network {

using boost::asio::ip::udp;

Announcer::Announcer(boost::asio::io_context& io_context, const core::LocalSendConfig& config,
                     std::string fingerprint)
    : io_context_(io_context)
    , socket_(io_context)
    , timer_(io_context)
    , config_(config)
    , fingerprint_(std::move(fingerprint))
    , announcement_id_(core::utils::UuidUtils::generate())
    , running_(false) {
}

Announcer::~Announcer() {
    stop();
}

bool Announcer::start() {
    if (running_) {
        LOG_WARN("Announcer already running");
        return false;
    }
    
    try {
        multicast_endpoint_ = udp::endpoint(
            boost::asio::ip::make_address(config_.multicast_group), config_.multicast_port);
        
        socket_.open(udp::v4());
        socket_.set_option(boost::asio::ip::multicast::hops(1));
        socket_.set_option(boost::asio::ip::multicast::enable_loopback(true));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start announcer: {}", e.what());
        boost::system::error_code ec;
        socket_.close(ec);
        return false;
    }
    
    running_ = true;
    LOG_INFO("Announcing on {}:{} every {} ms", config_.multicast_group,
             config_.multicast_port, config_.announce_interval.count());
    
    boost::asio::post(io_context_, [this]() {
        if (!running_) {
            return;
        }
        send_announcement();
        schedule_next();
    });
    return true;
}

void Announcer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    
    timer_.cancel();
    boost::system::error_code ec;
    socket_.close(ec);
    LOG_INFO("Announcer stopped");
}

Announcement Announcer::build_announcement() const {
    Announcement msg;
    msg.id = config_.device_id;
    msg.device_type = config_.device_type;
    msg.name = config_.device_name;
    msg.version = PEERSEND_VERSION;
    msg.protocol_version = PROTOCOL_VERSION;
    msg.download = true;
    msg.port = config_.port;
    msg.announcement_id = announcement_id_;
    msg.uses_password = false;
    if (!fingerprint_.empty()) {
        msg.fingerprint = fingerprint_;
    }
    return msg;
}

bool Announcer::send_announcement() {
    auto payload = serialize_message(build_announcement());
    
    boost::system::error_code ec;
    auto sent = socket_.send_to(boost::asio::buffer(payload), multicast_endpoint_, 0, ec);
    if (ec) {
        LOG_ERROR("Failed to send announcement: {}", ec.message());
        return false;
    }
    
    if (sent < payload.size()) {
        LOG_WARN("Partial announcement sent: {} of {} bytes", sent, payload.size());
    } else {
        LOG_DEBUG("Sent announcement ({} bytes)", sent);
    }
    return true;
}

void Announcer::schedule_next() {
    if (!running_) {
        return;
    }
    
    timer_.expires_after(config_.announce_interval);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !running_) {
            return;
        }
        send_announcement();
        schedule_next();
    });
}

}
