#include "peersend/transfer/transfer_manager.hpp"
#include "peersend/crypto/key_manager.hpp"
#include "peersend/network/peer_client.hpp"
#include "peersend/network/protocol.hpp"
#include "peersend/core/logger.hpp"
#include "peersend/core/utils.hpp"

namespace peersend::transfer {

namespace fs = std::filesystem;
using core::utils::StringUtils;

namespace {
    std::string guess_file_type(const fs::path& path) {
        static const std::unordered_map<std::string, std::string> types = {
            {".txt", "text/plain"},
            {".md", "text/markdown"},
            {".html", "text/html"},
            {".json", "application/json"},
            {".pdf", "application/pdf"},
            {".zip", "application/zip"},
            {".png", "image/png"},
            {".jpg", "image/jpeg"},
            {".jpeg", "image/jpeg"},
            {".gif", "image/gif"},
            {".mp3", "audio/mpeg"},
            {".mp4", "video/mp4"},
            {".apk", "application/vnd.android.package-archive"}
        };
        
        auto it = types.find(StringUtils::to_lower(path.extension().string()));
        return it != types.end() ? it->second : "application/octet-stream";
    }
    
    std::string describe_failure(const network::HttpResponse& response) {
        if (!response.transport_ok()) {
            return response.error;
        }
        return "HTTP " + std::to_string(response.status) + " " + response.body;
    }
    
    ErrorCause failure_cause(const network::HttpResponse& response) {
        return response.transport_ok() ? ErrorCause::PROTOCOL_VIOLATION : ErrorCause::IO_FAILURE;
    }
}

TransferManager::TransferManager(const core::LocalSendConfig& config,
                                 SessionManager& sessions,
                                 crypto::KeyManager& key_manager,
                                 std::unique_ptr<network::PeerClient> client)
    : config_(config)
    , sessions_(sessions)
    , key_manager_(key_manager)
    , client_(client ? std::move(client) : std::make_unique<network::PeerClient>()) {
}

TransferManager::~TransferManager() = default;

std::shared_ptr<FileReceiver> TransferManager::create_receiver(const FileSession& session,
                                                               const fs::path& output_dir) {
    auto receiver = std::make_shared<FileReceiver>(session.files(), output_dir);
    std::lock_guard<std::mutex> lock(engines_mutex_);
    receivers_[session.id()] = receiver;
    return receiver;
}

std::shared_ptr<FileSender> TransferManager::create_sender(const FileSession& session) {
    auto sender = std::make_shared<FileSender>(session.files(), config_.chunk_size);
    std::lock_guard<std::mutex> lock(engines_mutex_);
    senders_[session.id()] = sender;
    return sender;
}

std::shared_ptr<FileReceiver> TransferManager::get_receiver(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(engines_mutex_);
    auto it = receivers_.find(session_id);
    return it != receivers_.end() ? it->second : nullptr;
}

std::shared_ptr<FileSender> TransferManager::get_sender(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(engines_mutex_);
    auto it = senders_.find(session_id);
    return it != senders_.end() ? it->second : nullptr;
}

void TransferManager::remove_engines(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(engines_mutex_);
    receivers_.erase(session_id);
    senders_.erase(session_id);
}

std::size_t TransferManager::cleanup_engines() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(engines_mutex_);
        for (const auto& [id, receiver] : receivers_) {
            ids.push_back(id);
        }
        for (const auto& [id, sender] : senders_) {
            ids.push_back(id);
        }
    }
    
    std::size_t removed = 0;
    for (const auto& id : ids) {
        auto session = sessions_.get_session(id);
        if (!session || session->is_terminal()) {
            std::lock_guard<std::mutex> lock(engines_mutex_);
            removed += receivers_.erase(id) + senders_.erase(id);
        }
    }
    return removed;
}

TransferResult TransferManager::describe_files(const std::vector<fs::path>& paths,
                                               std::vector<FileInfo>& out_files) {
    out_files.clear();
    for (const auto& path : paths) {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            return TransferResult(TransferError::IO_FAILURE, "Not a regular file: " + path.string());
        }
        auto size = fs::file_size(path, ec);
        if (ec) {
            return TransferResult(TransferError::IO_FAILURE,
                                  "Cannot stat " + path.string() + ": " + ec.message());
        }
        
        FileInfo file;
        file.id = core::utils::UuidUtils::generate();
        file.name = path.filename().string();
        file.size = size;
        file.file_type = guess_file_type(path);
        file.source_path = path;
        out_files.push_back(std::move(file));
    }
    return TransferResult();
}

bool TransferManager::cancel_session(const std::string& session_id) {
    auto session = sessions_.get_session(session_id);
    if (!session || session->is_terminal()) {
        return false;
    }
    
    if (get_sender(session_id)) {
        session->request_cancel();
        return true;
    }
    
    // No sending loop to observe the flag, so settle the state here
    if (!session->cancel()) {
        return false;
    }
    session->clear_session_key();
    remove_engines(session_id);
    LOG_INFO("Session {} cancelled locally", session_id);
    return true;
}

std::shared_ptr<FileSession> TransferManager::send_files(const network::DeviceInfo& device,
                                                         const std::vector<fs::path>& paths) {
    std::vector<FileInfo> files;
    auto described = describe_files(paths, files);
    if (!described) {
        LOG_ERROR("Cannot send to {}: {}", device.name, described.message);
        return nullptr;
    }
    
    auto session = sessions_.create_session(config_.device_id, device.id, files);
    auto ephemeral = key_manager_.generate_ephemeral_keys();
    
    // Offer the files
    network::FileRequest request;
    request.id = config_.device_id;
    request.sender = config_.device_name;
    request.sender_type = config_.device_type;
    request.session_id = session->id();
    request.public_key = crypto::KeyManager::public_key_to_string(ephemeral.public_key);
    for (const auto& file : files) {
        request.files.push_back({file.id, file.name, file.file_type, file.size, file.metadata});
    }
    
    auto offered = client_->request(device, request);
    if (!offered.ok()) {
        session->fail(failure_cause(offered), "request rejected: " + describe_failure(offered));
        crypto::CryptoProvider::clear_key(std::span(ephemeral.secret_key));
        return session;
    }
    
    auto response = network::parse_message<network::FileResponse>(offered.body);
    if (!response) {
        session->fail(ErrorCause::PROTOCOL_VIOLATION, "malformed response to request");
        crypto::CryptoProvider::clear_key(std::span(ephemeral.secret_key));
        return session;
    }
    if (!response->accepted) {
        LOG_INFO("{} declined session {}", device.name, session->id());
        session->cancel();
        crypto::CryptoProvider::clear_key(std::span(ephemeral.secret_key));
        return session;
    }
    
    session->set_remote_session_id(response->session_id);
    session->set_token(response->token);
    
    // Key agreement
    auto peer_key = crypto::KeyManager::public_key_from_string(response->public_key);
    crypto::SymmetricKey session_key{};
    crypto::CryptoResult derived(crypto::CryptoError::KEY_EXCHANGE_FAILED, "peer sent no public key");
    if (peer_key) {
        derived = key_manager_.derive_session_key(ephemeral.secret_key, *peer_key,
                                                  response->session_id, session_key);
    }
    crypto::CryptoProvider::clear_key(std::span(ephemeral.secret_key));
    if (!derived) {
        session->fail(ErrorCause::CRYPTO_FAILURE, derived.message);
        return session;
    }
    session->set_session_key(session_key);
    crypto::CryptoProvider::clear_key(std::span(session_key));
    
    // Propose destinations
    network::PrepareRequest prepare;
    prepare.id = config_.device_id;
    prepare.session_id = response->session_id;
    prepare.token = response->token;
    for (const auto& file : files) {
        prepare.files.push_back({file.id, file.name, file.file_type, file.size, std::nullopt});
    }
    
    auto prepared = client_->prepare_upload(device, prepare);
    if (!prepared.ok()) {
        session->fail(failure_cause(prepared), "prepare-upload rejected: " + describe_failure(prepared));
        session->clear_session_key();
        return session;
    }
    
    auto sender = create_sender(*session);
    if (upload_files(device, *session, *sender)) {
        if (session->total_bytes() == 0 || session->status() == SessionStatus::TRANSFERRING) {
            session->finish();
        }
        LOG_INFO("Session {} finished: {} sent to {}", session->id(),
                 StringUtils::format_bytes(session->total_bytes()), device.name);
    }
    
    remove_engines(session->id());
    session->clear_session_key();
    return session;
}

bool TransferManager::upload_files(const network::DeviceInfo& device, FileSession& session,
                                   FileSender& sender) {
    auto key = session.session_key();
    if (!key) {
        session.fail(ErrorCause::CRYPTO_FAILURE, "no session key");
        return false;
    }
    
    const auto& provider = key_manager_.provider();
    const auto remote_id = session.remote_session_id();
    const auto token = session.token();
    
    while (!sender.is_complete()) {
        auto file = sender.current_file_info();
        
        do {
            if (session.cancel_requested()) {
                session.cancel();
                notify_cancel(device, session);
                crypto::CryptoProvider::clear_key(std::span(*key));
                return false;
            }
            
            std::optional<std::vector<std::uint8_t>> chunk;
            auto read = sender.read_chunk(chunk);
            if (!read) {
                session.fail(to_error_cause(read.error), read.message);
                notify_cancel(device, session);
                crypto::CryptoProvider::clear_key(std::span(*key));
                return false;
            }
            if (!chunk) {
                break;
            }
            
            std::vector<std::uint8_t> encrypted;
            auto sealed = provider.encrypt(std::span(*chunk), std::span(*key), encrypted);
            if (!sealed) {
                session.fail(ErrorCause::CRYPTO_FAILURE, sealed.message);
                notify_cancel(device, session);
                crypto::CryptoProvider::clear_key(std::span(*key));
                return false;
            }
            
            network::BlockRequest block;
            block.id = config_.device_id;
            block.session_id = remote_id;
            block.file_id = file->id;
            block.size = chunk->size();
            block.token = token;
            
            if (session.status() == SessionStatus::WAITING) {
                session.start_transfer();
            }
            
            auto uploaded = client_->upload(device, block, std::span(encrypted));
            if (!uploaded.ok()) {
                session.fail(failure_cause(uploaded), "upload rejected: " + describe_failure(uploaded));
                crypto::CryptoProvider::clear_key(std::span(*key));
                return false;
            }
            
            session.add_bytes(chunk->size());
            LOG_TRACE("Session {}: {}/{} bytes", session.id(),
                      session.progress().bytes_transferred, session.total_bytes());
        } while (!sender.current_file_done());
        
        sender.next_file();
    }
    
    crypto::CryptoProvider::clear_key(std::span(*key));
    return true;
}

void TransferManager::notify_cancel(const network::DeviceInfo& device, const FileSession& session) {
    network::CancelRequest cancel;
    cancel.id = config_.device_id;
    cancel.session_id = session.remote_session_id();
    
    auto state = session.state();
    cancel.reason = state.status == SessionStatus::CANCELLED ? "cancelled by sender" : state.detail;
    
    auto response = client_->cancel(device, cancel);
    if (!response.ok()) {
        LOG_DEBUG("Peer did not acknowledge cancel of {}: {}", session.id(), describe_failure(response));
    }
}

}
