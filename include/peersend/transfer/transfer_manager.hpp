#pragma once

#include "peersend/transfer/file_receiver.hpp"
#include "peersend/transfer/file_sender.hpp"
#include "peersend/transfer/session_manager.hpp"
#include "peersend/core/config.hpp"
#include "peersend/network/peer_client.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace peersend::crypto {
    class KeyManager;
}

namespace peersend::network {
    struct DeviceInfo;
}

namespace peersend::transfer {

// Owns the per-session sender/receiver engines and drives outgoing transfers.
class TransferManager {
public:
    TransferManager(const core::LocalSendConfig& config,
                    SessionManager& sessions,
                    crypto::KeyManager& key_manager,
                    std::unique_ptr<network::PeerClient> client = nullptr);
    ~TransferManager();
    
    std::shared_ptr<FileReceiver> create_receiver(const FileSession& session,
                                                  const std::filesystem::path& output_dir);
    std::shared_ptr<FileSender> create_sender(const FileSession& session);
    
    std::shared_ptr<FileReceiver> get_receiver(const std::string& session_id) const;
    std::shared_ptr<FileSender> get_sender(const std::string& session_id) const;
    void remove_engines(const std::string& session_id);
    
    // Drops engines whose session is gone or terminal
    std::size_t cleanup_engines();
    
    // Blocks until the transfer reaches a terminal state. Returns nullptr only
    // when a source file cannot be described.
    std::shared_ptr<FileSession> send_files(const network::DeviceInfo& device,
                                            const std::vector<std::filesystem::path>& paths);
    
    // An active sending loop resolves the cancel at its next chunk checkpoint;
    // any other session becomes CANCELLED immediately
    bool cancel_session(const std::string& session_id);
    
    static TransferResult describe_files(const std::vector<std::filesystem::path>& paths,
                                         std::vector<FileInfo>& out_files);

private:
    bool upload_files(const network::DeviceInfo& device, FileSession& session, FileSender& sender);
    void notify_cancel(const network::DeviceInfo& device, const FileSession& session);
    
    core::LocalSendConfig config_;
    SessionManager& sessions_;
    crypto::KeyManager& key_manager_;
    std::unique_ptr<network::PeerClient> client_;
    
    mutable std::mutex engines_mutex_;
    std::unordered_map<std::string, std::shared_ptr<FileReceiver>> receivers_;
    std::unordered_map<std::string, std::shared_ptr<FileSender>> senders_;
};

}
