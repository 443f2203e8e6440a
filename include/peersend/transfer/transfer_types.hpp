#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace peersend::transfer {

struct FileInfo {
    std::string id;
    std::string name;
    std::uint64_t size = 0;
    std::string file_type;
    std::optional<nlohmann::json> metadata;
    
    // Sending side only; never leaves this device
    std::filesystem::path source_path;
};

enum class SessionStatus {
    WAITING,
    TRANSFERRING,
    FINISHED,
    CANCELLED,
    ERROR
};

enum class ErrorCause {
    IO_FAILURE,
    CRYPTO_FAILURE,
    PROTOCOL_VIOLATION,
    PATH_REJECTED,
    TIMEOUT
};

const char* to_string(SessionStatus status);
const char* to_string(ErrorCause cause);

struct SessionState {
    SessionStatus status = SessionStatus::WAITING;
    std::optional<ErrorCause> cause;
    std::string detail;
    
    bool is_terminal() const {
        return status == SessionStatus::FINISHED ||
               status == SessionStatus::CANCELLED ||
               status == SessionStatus::ERROR;
    }
};

struct TransferProgress {
    std::uint64_t bytes_transferred = 0;
    std::uint64_t total_bytes = 0;
    double speed_bytes_per_sec = 0.0;
};

enum class TransferError {
    SUCCESS = 0,
    IO_FAILURE,
    PATH_REJECTED,
    SIZE_MISMATCH,
    INVALID_STATE
};

const char* to_string(TransferError error);

struct TransferResult {
    TransferError error;
    std::string message;
    
    TransferResult(TransferError err = TransferError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == TransferError::SUCCESS; }
    operator bool() const { return success(); }
};

// Session-level cause for an engine failure
ErrorCause to_error_cause(TransferError error);

}
