#pragma once

#include "peersend/core/config.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <atomic>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace peersend::crypto {
    class KeyManager;
}

namespace peersend::network {
    class DeviceRegistry;
}

namespace peersend::transfer {
    class SessionManager;
    class TransferManager;
}

namespace peersend::core {

// Everything one running instance shares: configuration, the io_context and
// its worker pool, and the registries. Built once at startup.
class Context {
public:
    static std::shared_ptr<Context> create(const LocalSendConfig& config);
    ~Context();
    
    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;
    
    bool start();
    void stop();
    bool is_running() const { return running_; }
    
    const LocalSendConfig& config() const { return config_; }
    boost::asio::io_context& io_context() { return io_context_; }
    std::size_t worker_count() const { return workers_.size(); }
    
    crypto::KeyManager& key_manager() { return *key_manager_; }
    network::DeviceRegistry& device_registry() { return *device_registry_; }
    transfer::SessionManager& session_manager() { return *session_manager_; }
    transfer::TransferManager& transfer_manager() { return *transfer_manager_; }

private:
    explicit Context(const LocalSendConfig& config);
    
    LocalSendConfig config_;
    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_;
    
    std::unique_ptr<crypto::KeyManager> key_manager_;
    std::unique_ptr<network::DeviceRegistry> device_registry_;
    std::unique_ptr<transfer::SessionManager> session_manager_;
    std::unique_ptr<transfer::TransferManager> transfer_manager_;
};

}
