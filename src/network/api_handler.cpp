#include "peersend/network/api_handler.hpp"
#include "peersend/crypto/key_manager.hpp"
#include "peersend/transfer/session_manager.hpp"
#include "peersend/transfer/transfer_manager.hpp"
#include "peersend/core/logger.hpp"
#include <unordered_set>

namespace peersend::network {

using transfer::ErrorCause;
using transfer::SessionStatus;

ApiResponse make_error(unsigned status, const std::string& message) {
    ApiResponse response;
    response.status = status;
    response.body = make_error_body(message);
    return response;
}

ApiHandler::ApiHandler(const core::LocalSendConfig& config,
                       DeviceRegistry& registry,
                       transfer::SessionManager& sessions,
                       transfer::TransferManager& transfers,
                       crypto::KeyManager& key_manager)
    : config_(config)
    , registry_(registry)
    , sessions_(sessions)
    , transfers_(transfers)
    , key_manager_(key_manager) {
}

RegisterMessage ApiHandler::self_info() const {
    RegisterMessage self;
    self.id = config_.device_id;
    self.device_type = config_.device_type;
    self.name = config_.device_name;
    self.version = PEERSEND_VERSION;
    self.protocol_version = PROTOCOL_VERSION;
    self.download = true;
    self.port = config_.port;
    self.uses_password = false;
    if (!key_manager_.fingerprint().empty()) {
        self.fingerprint = key_manager_.fingerprint();
    }
    return self;
}

ApiResponse ApiHandler::handle(RequestType type, std::string_view body, std::string_view query,
                               const std::string& remote_ip) {
    LOG_DEBUG("API {} from {} ({} bytes)", to_string(type), remote_ip, body.size());
    
    switch (type) {
        case RequestType::REGISTER: return handle_register(body, remote_ip);
        case RequestType::REQUEST: return handle_request(body);
        case RequestType::PREPARE: return handle_prepare(body);
        case RequestType::BLOCK: return handle_upload(body, query);
        case RequestType::CANCEL: return handle_cancel(body);
        case RequestType::UNKNOWN: break;
    }
    return make_error(404, "not found");
}

ApiResponse ApiHandler::handle_register(std::string_view body, const std::string& remote_ip) {
    if (!body.empty()) {
        auto peer = parse_message<RegisterMessage>(body);
        if (peer && peer->id != config_.device_id) {
            registry_.add_device(peer->to_device_info(remote_ip, config_.port));
        } else if (!peer) {
            LOG_DEBUG("Ignoring malformed register body from {}", remote_ip);
        }
    }
    
    ApiResponse response;
    response.body = serialize_message(self_info());
    return response;
}

ApiResponse ApiHandler::handle_request(std::string_view body) {
    auto request = parse_message<FileRequest>(body);
    if (!request) {
        return make_error(400, "invalid request body");
    }
    if (request->files.empty()) {
        return make_error(400, "no files offered");
    }
    
    auto peer_key = crypto::KeyManager::public_key_from_string(request->public_key);
    if (!peer_key) {
        return make_error(400, "missing or invalid public key");
    }
    
    std::unordered_set<std::string> seen;
    std::vector<transfer::FileInfo> files;
    for (const auto& offered : request->files) {
        if (!seen.insert(offered.id).second) {
            return make_error(400, "duplicate file id " + offered.id);
        }
        transfer::FileInfo file;
        file.id = offered.id;
        file.name = offered.name;
        file.size = offered.size;
        file.file_type = offered.file_type;
        file.metadata = offered.metadata;
        files.push_back(std::move(file));
    }
    
    auto session = sessions_.create_session(request->id, config_.device_id, std::move(files));
    session->set_remote_session_id(request->session_id);
    
    auto ephemeral = key_manager_.generate_ephemeral_keys();
    crypto::SymmetricKey session_key{};
    auto derived = key_manager_.derive_session_key(ephemeral.secret_key, *peer_key,
                                                   session->id(), session_key);
    crypto::CryptoProvider::clear_key(std::span(ephemeral.secret_key));
    if (!derived) {
        return fail_session(*session, ErrorCause::CRYPTO_FAILURE, derived.message, 400);
    }
    session->set_session_key(session_key);
    crypto::CryptoProvider::clear_key(std::span(session_key));
    
    auto token = key_manager_.issue_token(session->id());
    session->set_token(token);
    transfers_.create_receiver(*session, config_.download_dir);
    
    LOG_INFO("Accepted {} file(s) from '{}' as session {}", request->files.size(),
             request->sender, session->id());
    
    FileResponse reply;
    reply.id = config_.device_id;
    reply.session_id = session->id();
    reply.accepted = true;
    reply.token = token;
    reply.public_key = crypto::KeyManager::public_key_to_string(ephemeral.public_key);
    
    ApiResponse response;
    response.body = serialize_message(reply);
    return response;
}

ApiResponse ApiHandler::handle_prepare(std::string_view body) {
    auto request = parse_message<PrepareRequest>(body);
    if (!request) {
        return make_error(400, "invalid request body");
    }
    
    auto session = sessions_.get_session(request->session_id);
    if (!session) {
        return make_error(404, "session not found");
    }
    if (!key_manager_.verify_token(session->id(), request->token)) {
        return make_error(403, "invalid token");
    }
    if (session->status() != SessionStatus::WAITING) {
        return make_error(409, "session is not waiting");
    }
    
    auto receiver = transfers_.get_receiver(session->id());
    if (!receiver) {
        return make_error(409, "session has no receiver");
    }
    
    PrepareResponse reply;
    reply.id = config_.device_id;
    reply.session_id = session->id();
    
    for (auto file : request->files) {
        auto known = session->find_file(file.id);
        if (!known || known->size != file.size) {
            return fail_session(*session, ErrorCause::PROTOCOL_VIOLATION,
                                "file " + file.id + " does not belong to the session", 400);
        }
        
        auto name = file.save_as.value_or(known->name);
        auto result = receiver->set_save_as(file.id, name);
        if (!result) {
            auto cause = transfer::to_error_cause(result.error);
            return fail_session(*session, cause, result.message, 400);
        }
        
        file.save_as = name;
        reply.files.push_back(std::move(file));
    }
    
    session->touch();
    ApiResponse response;
    response.body = serialize_message(reply);
    return response;
}

ApiResponse ApiHandler::handle_upload(std::string_view body, std::string_view query) {
    auto block = BlockRequest::from_query(query);
    if (!block) {
        return make_error(400, "invalid block parameters");
    }
    
    auto session = sessions_.get_session(block->session_id);
    if (!session) {
        return make_error(404, "session not found");
    }
    if (!key_manager_.verify_token(session->id(), block->token)) {
        return make_error(403, "invalid token");
    }
    if (session->is_terminal()) {
        return make_error(409, std::string("session is ") + transfer::to_string(session->status()));
    }
    if (session->cancel_requested()) {
        session->cancel();
        session->clear_session_key();
        transfers_.remove_engines(session->id());
        LOG_INFO("Session {} cancelled before block of {}", session->id(), block->file_id);
        return make_error(409, "session is cancelled");
    }
    
    auto receiver = transfers_.get_receiver(session->id());
    auto key = session->session_key();
    if (!receiver || !key) {
        return make_error(409, "session is not ready");
    }
    
    // Early out before decrypting; write_chunk repeats the check under the receiver lock
    auto current = receiver->current_file_info();
    if (!current || current->id != block->file_id) {
        return fail_session(*session, ErrorCause::PROTOCOL_VIOLATION,
                            "unexpected file " + block->file_id, 400);
    }
    
    std::vector<std::uint8_t> plaintext;
    auto encrypted = std::span(reinterpret_cast<const std::uint8_t*>(body.data()), body.size());
    auto opened = key_manager_.provider().decrypt(encrypted, std::span(*key), plaintext);
    crypto::CryptoProvider::clear_key(std::span(*key));
    if (!opened) {
        return fail_session(*session, ErrorCause::CRYPTO_FAILURE, opened.message, 400);
    }
    
    if (plaintext.size() != block->size) {
        return fail_session(*session, ErrorCause::PROTOCOL_VIOLATION,
                            "block size " + std::to_string(plaintext.size()) +
                            " does not match declared " + std::to_string(block->size), 400);
    }
    
    if (session->status() == SessionStatus::WAITING) {
        session->start_transfer();
    }
    
    auto written = receiver->write_chunk(std::span(plaintext), block->file_id);
    if (!written) {
        auto cause = transfer::to_error_cause(written.error);
        unsigned status = cause == ErrorCause::IO_FAILURE ? 500 : 400;
        return fail_session(*session, cause, written.message, status);
    }
    
    session->add_bytes(plaintext.size());
    
    if (receiver->is_complete()) {
        session->finish();
        session->clear_session_key();
        transfers_.remove_engines(session->id());
        LOG_INFO("Session {} finished ({} bytes)", session->id(), session->total_bytes());
    }
    
    return ApiResponse{};
}

ApiResponse ApiHandler::handle_cancel(std::string_view body) {
    auto request = parse_message<CancelRequest>(body);
    if (!request) {
        return make_error(400, "invalid request body");
    }
    
    auto session = sessions_.get_session(request->session_id);
    if (!session) {
        return make_error(404, "session not found");
    }
    
    if (!session->cancel()) {
        return make_error(409, "invalid request");
    }
    
    session->clear_session_key();
    transfers_.remove_engines(session->id());
    LOG_INFO("Session {} cancelled by peer{}", session->id(),
             request->reason.empty() ? "" : ": " + request->reason);
    return ApiResponse{};
}

ApiResponse ApiHandler::fail_session(transfer::FileSession& session, ErrorCause cause,
                                     const std::string& detail, unsigned status) {
    session.fail(cause, detail);
    session.clear_session_key();
    transfers_.remove_engines(session.id());
    return make_error(status, detail);
}

}
