#include "peersend/transfer/session_manager.hpp"
#include "peersend/core/logger.hpp"
#include "peersend/core/utils.hpp"

namespace peersend::transfer {

std::shared_ptr<FileSession> SessionManager::create_session(const std::string& sender_id,
                                                            const std::string& receiver_id,
                                                            std::vector<FileInfo> files) {
    auto file_count = files.size();
    auto session = std::make_shared<FileSession>(
        core::utils::UuidUtils::generate(), sender_id, receiver_id, std::move(files));
    
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_[session->id()] = session;
    }
    
    LOG_INFO("Created session {} ({} -> {}, {} file(s), {} bytes)", session->id(),
             sender_id, receiver_id, file_count, session->total_bytes());
    return session;
}

std::shared_ptr<FileSession> SessionManager::get_session(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        return it->second;
    }
    return nullptr;
}

void SessionManager::remove_session(const std::string& session_id) {
    std::shared_ptr<FileSession> removed;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return;
        }
        removed = std::move(it->second);
        sessions_.erase(it);
    }
    
    removed->clear_session_key();
    LOG_DEBUG("Removed session {}", session_id);
}

std::vector<std::shared_ptr<FileSession>> SessionManager::get_all_sessions() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    std::vector<std::shared_ptr<FileSession>> sessions;
    sessions.reserve(sessions_.size());
    
    for (const auto& [id, session] : sessions_) {
        sessions.push_back(session);
    }
    return sessions;
}

std::size_t SessionManager::session_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

std::size_t SessionManager::cleanup_expired(std::chrono::seconds timeout) {
    auto now = std::chrono::steady_clock::now();
    std::size_t expired = 0;
    
    // Session locks are taken outside the map lock
    for (const auto& session : get_all_sessions()) {
        if (session->is_terminal()) {
            continue;
        }
        if (now - session->last_activity() <= timeout) {
            continue;
        }
        if (session->fail(ErrorCause::TIMEOUT, "no activity for " + std::to_string(timeout.count()) + "s")) {
            session->clear_session_key();
            ++expired;
        }
    }
    
    if (expired > 0) {
        LOG_INFO("Expired {} idle session(s)", expired);
    }
    return expired;
}

std::size_t SessionManager::remove_finished_sessions() {
    std::vector<std::shared_ptr<FileSession>> removed;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->second->is_terminal()) {
                removed.push_back(std::move(it->second));
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }
    
    for (const auto& session : removed) {
        session->clear_session_key();
    }
    
    if (!removed.empty()) {
        LOG_DEBUG("Removed {} finished session(s)", removed.size());
    }
    return removed.size();
}

}
