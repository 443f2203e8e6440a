#pragma once

#include "peersend/transfer/transfer_types.hpp"
#include "peersend/crypto/crypto_types.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace peersend::transfer {

// One negotiated transfer. State and progress have separate locks so
// readers never wait on a chunk write.
class FileSession {
public:
    FileSession(std::string id, std::string sender_id, std::string receiver_id,
                std::vector<FileInfo> files);
    ~FileSession();
    
    FileSession(const FileSession&) = delete;
    FileSession& operator=(const FileSession&) = delete;
    
    const std::string& id() const { return id_; }
    const std::string& sender_id() const { return sender_id_; }
    const std::string& receiver_id() const { return receiver_id_; }
    const std::vector<FileInfo>& files() const { return files_; }
    std::optional<FileInfo> find_file(const std::string& file_id) const;
    
    // State machine; every method returns false when the edge is illegal
    SessionState state() const;
    SessionStatus status() const;
    bool is_terminal() const;
    bool start_transfer();
    bool finish();
    bool cancel();
    bool fail(ErrorCause cause, std::string detail);
    
    // Progress
    TransferProgress progress() const;
    double progress_fraction() const;
    bool add_bytes(std::uint64_t count);
    std::uint64_t total_bytes() const { return total_bytes_; }
    
    // Cooperative cancellation checkpoint for the sending loop
    void request_cancel() { cancel_requested_ = true; }
    bool cancel_requested() const { return cancel_requested_; }
    
    void set_session_key(const crypto::SymmetricKey& key);
    std::optional<crypto::SymmetricKey> session_key() const;
    void clear_session_key();
    
    void set_token(std::string token);
    std::string token() const;
    
    // Id the peer assigned to this transfer; differs from id() on the sending side
    void set_remote_session_id(std::string remote_id);
    std::string remote_session_id() const;
    
    void touch();
    std::chrono::steady_clock::time_point created_at() const { return created_at_; }
    std::chrono::steady_clock::time_point last_activity() const;

private:
    bool transition_locked(SessionStatus next);
    
    const std::string id_;
    const std::string sender_id_;
    const std::string receiver_id_;
    const std::vector<FileInfo> files_;
    const std::uint64_t total_bytes_;
    const std::chrono::steady_clock::time_point created_at_;
    
    mutable std::mutex state_mutex_;
    SessionState state_;
    std::chrono::steady_clock::time_point last_activity_;
    
    mutable std::mutex progress_mutex_;
    std::uint64_t bytes_transferred_;
    std::optional<std::chrono::steady_clock::time_point> transfer_started_;
    
    mutable std::mutex key_mutex_;
    crypto::SymmetricKey session_key_;
    bool has_session_key_;
    std::string token_;
    std::string remote_session_id_;
    
    std::atomic<bool> cancel_requested_;
};

}
