#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <future>
#include <iostream>
#include <string>
#include "peersend/core/logger.hpp"
#include "peersend/core/config.hpp"
#include "peersend/core/context.hpp"
#include "peersend/core/utils.hpp"
#include "peersend/crypto/key_manager.hpp"
#include "peersend/network/announcer.hpp"
#include "peersend/network/api_handler.hpp"
#include "peersend/network/http_server.hpp"
#include "peersend/network/listener.hpp"
#include "peersend/transfer/session_manager.hpp"
#include "peersend/transfer/transfer_manager.hpp"

using namespace peersend;

namespace {

// Expires idle sessions and drops terminal ones on every tick
class SessionJanitor {
public:
    SessionJanitor(core::Context& context, std::chrono::seconds interval)
        : context_(context)
        , timer_(context.io_context())
        , interval_(interval) {
    }
    
    void start() { schedule(); }
    void stop() { timer_.cancel(); }

private:
    void schedule() {
        timer_.expires_after(interval_);
        timer_.async_wait([this](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            auto& sessions = context_.session_manager();
            sessions.cleanup_expired(context_.config().session_timeout);
            context_.transfer_manager().cleanup_engines();
            sessions.remove_finished_sessions();
            schedule();
        });
    }
    
    core::Context& context_;
    boost::asio::steady_timer timer_;
    std::chrono::seconds interval_;
};

}

int main(int argc, char* argv[]) {
    std::string config_file = argc > 1 ? argv[1] : "peersend.conf";
    
    core::Config config;
    config.set_defaults();
    
    if (core::utils::FileUtils::exists(config_file)) {
        if (!config.load_from_file(config_file)) {
            std::cerr << "Error: cannot read " << config_file << "\n";
            return 1;
        }
    }
    
    auto level = core::Logger::parse_level(config.get_string("log.level", "info"));
    core::Logger::initialize(config.get_string("log.file", "peersend.log"), level);
    
    auto settings = core::LocalSendConfig::from_config(config);
    
    // Keep the generated identity stable across restarts
    if (!config.contains("device.id")) {
        config.set("device.id", settings.device_id);
        config.set("server.api_key", settings.api_key);
        if (!config.save_to_file(config_file)) {
            LOG_WARN("Could not persist generated identity to {}", config_file);
        }
    }
    
    if (!settings.validate()) {
        LOG_CRITICAL("Invalid configuration in {}", config_file);
        core::Logger::shutdown();
        return 1;
    }
    
    LOG_INFO("PeerSend {} starting as '{}' ({})", network::PEERSEND_VERSION,
             settings.device_name, settings.device_id);
    if (settings.use_tls) {
        LOG_WARN("server.use_tls is set but TLS is not supported, serving plain HTTP");
    }

    std::shared_ptr<core::Context> context;
    try {
        context = core::Context::create(settings);
    } catch (const std::exception& e) {
        LOG_CRITICAL("Startup failed: {}", e.what());
        core::Logger::shutdown();
        return 1;
    }
    
    network::ApiHandler api(settings, context->device_registry(), context->session_manager(),
                            context->transfer_manager(), context->key_manager());
    network::HttpServer server(context->io_context(), api, settings.chunk_size);
    network::Announcer announcer(context->io_context(), settings, context->key_manager().fingerprint());
    network::Listener listener(context->io_context(), settings, context->device_registry());
    SessionJanitor janitor(*context, std::chrono::seconds(30));
    
    if (!server.start(settings.port)) {
        core::Logger::shutdown();
        return 1;
    }
    
    if (config.get_bool("discovery.enabled", true)) {
        listener.start();
        announcer.start();
    } else {
        LOG_INFO("Multicast discovery disabled");
    }
    janitor.start();
    
    std::promise<int> shutdown_signal;
    auto shutdown_future = shutdown_signal.get_future();
    
    boost::asio::signal_set signals(context->io_context(), SIGINT, SIGTERM);
    signals.async_wait([&shutdown_signal](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            shutdown_signal.set_value(signal_number);
        }
    });
    
    context->start();
    
    auto signal_number = shutdown_future.get();
    LOG_INFO("Received signal {}, shutting down", signal_number);
    
    // Stop sources of new work before the pool goes away
    janitor.stop();
    announcer.stop();
    listener.stop();
    server.stop();
    signals.cancel();
    context->stop();
    
    LOG_INFO("PeerSend stopped");
    core::Logger::shutdown();
    return 0;
}
