#pragma once

#include "peersend/transfer/file_session.hpp"
#include "peersend/core/config.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace peersend::transfer {

class SessionManager {
public:
    SessionManager() = default;
    
    std::shared_ptr<FileSession> create_session(const std::string& sender_id,
                                                const std::string& receiver_id,
                                                std::vector<FileInfo> files);
    
    std::shared_ptr<FileSession> get_session(const std::string& session_id) const;
    void remove_session(const std::string& session_id);
    std::vector<std::shared_ptr<FileSession>> get_all_sessions() const;
    std::size_t session_count() const;
    
    // Moves every non-terminal session idle longer than timeout to ERROR(TIMEOUT)
    std::size_t cleanup_expired(std::chrono::seconds timeout = std::chrono::seconds(core::SESSION_TIMEOUT_SECS));
    
    std::size_t remove_finished_sessions();

private:
    mutable std::mutex sessions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<FileSession>> sessions_;
};

}
