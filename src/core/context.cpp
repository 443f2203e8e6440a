#include "peersend/core/context.hpp"
#include "peersend/core/logger.hpp"
#include "peersend/crypto/key_manager.hpp"
#include "peersend/network/device_registry.hpp"
#include "peersend/transfer/session_manager.hpp"
#include "peersend/transfer/transfer_manager.hpp"
#include <algorithm>
#include <stdexcept>

namespace peersend::core {

std::shared_ptr<Context> Context::create(const LocalSendConfig& config) {
    if (!config.validate()) {
        throw std::runtime_error("Invalid configuration");
    }
    return std::shared_ptr<Context>(new Context(config));
}

Context::Context(const LocalSendConfig& config)
    : config_(config)
    , running_(false)
    , key_manager_(std::make_unique<crypto::KeyManager>())
    , device_registry_(std::make_unique<network::DeviceRegistry>())
    , session_manager_(std::make_unique<transfer::SessionManager>()) {
    
    if (!key_manager_->initialize()) {
        throw std::runtime_error("Failed to initialize key manager");
    }
    
    transfer_manager_ = std::make_unique<transfer::TransferManager>(
        config_, *session_manager_, *key_manager_);
}

Context::~Context() {
    stop();
}

bool Context::start() {
    if (running_) {
        LOG_WARN("Context already running");
        return false;
    }
    
    std::size_t count = config_.worker_threads;
    if (count == 0) {
        count = std::max<std::size_t>(2, std::thread::hardware_concurrency());
    }
    
    io_context_.restart();
    work_guard_.emplace(boost::asio::make_work_guard(io_context_));
    running_ = true;
    
    for (std::size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this, i]() {
            LOG_DEBUG("Worker {} started", i);
            while (running_) {
                try {
                    io_context_.run();
                    break;
                } catch (const std::exception& e) {
                    LOG_ERROR("Worker {} error: {}", i, e.what());
                }
            }
            LOG_DEBUG("Worker {} stopped", i);
        });
    }
    
    LOG_INFO("Context started with {} worker thread(s)", count);
    return true;
}

void Context::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    
    work_guard_.reset();
    io_context_.stop();
    
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    
    LOG_INFO("Context stopped");
}

}
