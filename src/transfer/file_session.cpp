#include "peersend/transfer/file_session.hpp"
#include "peersend/crypto/crypto_provider.hpp"
#include "peersend/core/logger.hpp"
#include <numeric>

namespace peersend::transfer {

namespace {
    std::uint64_t sum_sizes(const std::vector<FileInfo>& files) {
        return std::accumulate(files.begin(), files.end(), std::uint64_t{0},
            [](std::uint64_t total, const FileInfo& file) { return total + file.size; });
    }
}

FileSession::FileSession(std::string id, std::string sender_id, std::string receiver_id,
                         std::vector<FileInfo> files)
    : id_(std::move(id))
    , sender_id_(std::move(sender_id))
    , receiver_id_(std::move(receiver_id))
    , files_(std::move(files))
    , total_bytes_(sum_sizes(files_))
    , created_at_(std::chrono::steady_clock::now())
    , last_activity_(created_at_)
    , bytes_transferred_(0)
    , session_key_{}
    , has_session_key_(false)
    , cancel_requested_(false) {
}

FileSession::~FileSession() {
    clear_session_key();
}

std::optional<FileInfo> FileSession::find_file(const std::string& file_id) const {
    for (const auto& file : files_) {
        if (file.id == file_id) {
            return file;
        }
    }
    return std::nullopt;
}

SessionState FileSession::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

SessionStatus FileSession::status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_.status;
}

bool FileSession::is_terminal() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_.is_terminal();
}

bool FileSession::transition_locked(SessionStatus next) {
    if (state_.is_terminal()) {
        return false;
    }
    
    bool legal = false;
    switch (next) {
        case SessionStatus::TRANSFERRING:
            legal = state_.status == SessionStatus::WAITING;
            break;
        case SessionStatus::FINISHED:
            legal = state_.status == SessionStatus::TRANSFERRING ||
                    (state_.status == SessionStatus::WAITING && total_bytes_ == 0);
            break;
        case SessionStatus::CANCELLED:
        case SessionStatus::ERROR:
            legal = true;
            break;
        case SessionStatus::WAITING:
            legal = false;
            break;
    }
    
    if (!legal) {
        LOG_DEBUG("Session {}: refused transition {} -> {}", id_,
                  to_string(state_.status), to_string(next));
        return false;
    }
    
    LOG_DEBUG("Session {}: {} -> {}", id_, to_string(state_.status), to_string(next));
    state_.status = next;
    last_activity_ = std::chrono::steady_clock::now();
    return true;
}

bool FileSession::start_transfer() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!transition_locked(SessionStatus::TRANSFERRING)) {
        return false;
    }
    
    std::lock_guard<std::mutex> progress_lock(progress_mutex_);
    if (!transfer_started_) {
        transfer_started_ = std::chrono::steady_clock::now();
    }
    return true;
}

bool FileSession::finish() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return transition_locked(SessionStatus::FINISHED);
}

bool FileSession::cancel() {
    cancel_requested_ = true;
    std::lock_guard<std::mutex> lock(state_mutex_);
    return transition_locked(SessionStatus::CANCELLED);
}

bool FileSession::fail(ErrorCause cause, std::string detail) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!transition_locked(SessionStatus::ERROR)) {
        return false;
    }
    
    LOG_WARN("Session {} failed ({}): {}", id_, to_string(cause), detail);
    state_.cause = cause;
    state_.detail = std::move(detail);
    return true;
}

TransferProgress FileSession::progress() const {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    TransferProgress progress;
    progress.bytes_transferred = bytes_transferred_;
    progress.total_bytes = total_bytes_;
    
    if (transfer_started_) {
        auto elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - *transfer_started_).count();
        if (elapsed > 0.0) {
            progress.speed_bytes_per_sec = static_cast<double>(bytes_transferred_) / elapsed;
        }
    }
    return progress;
}

double FileSession::progress_fraction() const {
    if (total_bytes_ == 0) {
        return status() == SessionStatus::FINISHED ? 1.0 : 0.0;
    }
    
    std::lock_guard<std::mutex> lock(progress_mutex_);
    return static_cast<double>(bytes_transferred_) / static_cast<double>(total_bytes_);
}

bool FileSession::add_bytes(std::uint64_t count) {
    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        if (count > total_bytes_ - bytes_transferred_) {
            return false;
        }
        bytes_transferred_ += count;
        if (!transfer_started_) {
            transfer_started_ = std::chrono::steady_clock::now();
        }
    }
    touch();
    return true;
}

void FileSession::set_session_key(const crypto::SymmetricKey& key) {
    std::lock_guard<std::mutex> lock(key_mutex_);
    session_key_ = key;
    has_session_key_ = true;
}

std::optional<crypto::SymmetricKey> FileSession::session_key() const {
    std::lock_guard<std::mutex> lock(key_mutex_);
    if (!has_session_key_) {
        return std::nullopt;
    }
    return session_key_;
}

void FileSession::clear_session_key() {
    std::lock_guard<std::mutex> lock(key_mutex_);
    crypto::CryptoProvider::clear_key(std::span(session_key_));
    has_session_key_ = false;
}

void FileSession::set_token(std::string token) {
    std::lock_guard<std::mutex> lock(key_mutex_);
    token_ = std::move(token);
}

std::string FileSession::token() const {
    std::lock_guard<std::mutex> lock(key_mutex_);
    return token_;
}

void FileSession::set_remote_session_id(std::string remote_id) {
    std::lock_guard<std::mutex> lock(key_mutex_);
    remote_session_id_ = std::move(remote_id);
}

std::string FileSession::remote_session_id() const {
    std::lock_guard<std::mutex> lock(key_mutex_);
    return remote_session_id_;
}

void FileSession::touch() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_activity_ = std::chrono::steady_clock::now();
}

std::chrono::steady_clock::time_point FileSession::last_activity() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_activity_;
}

}
