#include "peersend/transfer/transfer_types.hpp"

namespace peersend::transfer {

const char* to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::WAITING: return "waiting";
        case SessionStatus::TRANSFERRING: return "transferring";
        case SessionStatus::FINISHED: return "finished";
        case SessionStatus::CANCELLED: return "cancelled";
        case SessionStatus::ERROR: return "error";
    }
    return "unknown";
}

const char* to_string(ErrorCause cause) {
    switch (cause) {
        case ErrorCause::IO_FAILURE: return "io failure";
        case ErrorCause::CRYPTO_FAILURE: return "crypto failure";
        case ErrorCause::PROTOCOL_VIOLATION: return "protocol violation";
        case ErrorCause::PATH_REJECTED: return "path rejected";
        case ErrorCause::TIMEOUT: return "timeout";
    }
    return "unknown";
}

const char* to_string(TransferError error) {
    switch (error) {
        case TransferError::SUCCESS: return "success";
        case TransferError::IO_FAILURE: return "io failure";
        case TransferError::PATH_REJECTED: return "path rejected";
        case TransferError::SIZE_MISMATCH: return "size mismatch";
        case TransferError::INVALID_STATE: return "invalid state";
    }
    return "unknown";
}

ErrorCause to_error_cause(TransferError error) {
    switch (error) {
        case TransferError::PATH_REJECTED: return ErrorCause::PATH_REJECTED;
        case TransferError::SIZE_MISMATCH:
        case TransferError::INVALID_STATE: return ErrorCause::PROTOCOL_VIOLATION;
        case TransferError::SUCCESS:
        case TransferError::IO_FAILURE: break;
    }
    return ErrorCause::IO_FAILURE;
}

}
