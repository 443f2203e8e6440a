#pragma once

#include "peersend/network/device_registry.hpp"
#include "peersend/network/protocol.hpp"
#include "peersend/core/config.hpp"
#include "peersend/transfer/transfer_types.hpp"
#include <string>
#include <string_view>

namespace peersend::crypto {
    class KeyManager;
}

namespace peersend::transfer {
    class SessionManager;
    class TransferManager;
    class FileSession;
}

namespace peersend::network {

struct ApiResponse {
    unsigned status = 200;
    std::string body = "{}";
    std::string content_type = "application/json";
};

// Transport-independent dispatch of the LocalSend endpoints.
class ApiHandler {
public:
    ApiHandler(const core::LocalSendConfig& config,
               DeviceRegistry& registry,
               transfer::SessionManager& sessions,
               transfer::TransferManager& transfers,
               crypto::KeyManager& key_manager);
    
    ApiResponse handle(RequestType type, std::string_view body, std::string_view query,
                       const std::string& remote_ip);
    
    RegisterMessage self_info() const;

private:
    ApiResponse handle_register(std::string_view body, const std::string& remote_ip);
    ApiResponse handle_request(std::string_view body);
    ApiResponse handle_prepare(std::string_view body);
    ApiResponse handle_upload(std::string_view body, std::string_view query);
    ApiResponse handle_cancel(std::string_view body);
    
    ApiResponse fail_session(transfer::FileSession& session, transfer::ErrorCause cause,
                             const std::string& detail, unsigned status);
    
    core::LocalSendConfig config_;
    DeviceRegistry& registry_;
    transfer::SessionManager& sessions_;
    transfer::TransferManager& transfers_;
    crypto::KeyManager& key_manager_;
};

ApiResponse make_error(unsigned status, const std::string& message);

}
