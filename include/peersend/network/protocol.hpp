#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace peersend::network {

constexpr const char* PROTOCOL_VERSION = "2.0";
constexpr const char* PEERSEND_VERSION = "0.1.0-peersend";
constexpr const char* ANNOUNCE_TYPE = "announce";

constexpr const char* API_REGISTER = "/api/v1/localsend/register";
constexpr const char* API_REQUEST = "/api/v1/localsend/request";
constexpr const char* API_PREPARE_UPLOAD = "/api/v1/localsend/prepare-upload";
constexpr const char* API_UPLOAD = "/api/v1/localsend/upload";
constexpr const char* API_CANCEL = "/api/v1/localsend/cancel";

enum class RequestType {
    REGISTER,
    REQUEST,
    PREPARE,
    BLOCK,
    CANCEL,
    UNKNOWN
};

// Maps a request target to its endpoint; the query string is ignored.
RequestType parse_request_type(std::string_view target);
const char* to_string(RequestType type);

// A peer as seen by discovery. Identity is the id alone.
struct DeviceInfo {
    std::string id;
    std::string name;
    std::string device_type;
    std::string ip;
    std::uint16_t port = 0;
    std::string version;
    std::string protocol_version;
    std::optional<std::string> announcement_id;
    bool uses_password = false;
    bool download = false;
    std::optional<std::string> fingerprint;
};

// Multicast announcement payload
struct Announcement {
    std::string type = ANNOUNCE_TYPE;
    std::string id;
    std::string device_type;
    std::string name;
    std::string version;
    std::string protocol_version;
    bool download = false;
    std::optional<std::uint16_t> port;
    std::optional<std::string> announcement_id;
    bool uses_password = false;
    std::optional<std::string> fingerprint;
    
    DeviceInfo to_device_info(const std::string& sender_ip, std::uint16_t default_port) const;
};

// Body of /register, identical in both directions
struct RegisterMessage {
    std::string id;
    std::string device_type;
    std::string name;
    std::string version;
    std::string protocol_version;
    bool download = false;
    std::optional<std::uint16_t> port;
    std::optional<std::string> announcement_id;
    bool uses_password = false;
    std::optional<std::string> fingerprint;
    
    DeviceInfo to_device_info(const std::string& sender_ip, std::uint16_t default_port) const;
};

struct FileMetadata {
    std::string id;
    std::string name;
    std::string file_type;
    std::uint64_t size = 0;
    std::optional<nlohmann::json> metadata;
};

struct FileRequest {
    std::string id;
    std::string sender;
    std::string sender_type;
    std::vector<FileMetadata> files;
    std::string session_id;
    std::string token;
    std::string message;
    std::string public_key;
};

struct FileResponse {
    std::string id;
    std::string session_id;
    bool accepted = false;
    std::string token;
    std::string public_key;
};

struct IncomingFileMetadata {
    std::string id;
    std::string name;
    std::string file_type;
    std::uint64_t size = 0;
    std::optional<std::string> save_as;
};

struct PrepareRequest {
    std::string id;
    std::string session_id;
    std::vector<IncomingFileMetadata> files;
    std::string token;
};

struct PrepareResponse {
    std::string id;
    std::string session_id;
    std::vector<IncomingFileMetadata> files;
};

// Carried in the /upload query string; the chunk itself is the body.
struct BlockRequest {
    std::string id;
    std::string session_id;
    std::string file_id;
    std::uint64_t size = 0;
    std::string token;
    
    std::string to_query() const;
    static std::optional<BlockRequest> from_query(std::string_view query);
};

struct CancelRequest {
    std::string id;
    std::string session_id;
    std::string reason;
};

void to_json(nlohmann::json& j, const Announcement& msg);
void from_json(const nlohmann::json& j, Announcement& msg);
void to_json(nlohmann::json& j, const RegisterMessage& msg);
void from_json(const nlohmann::json& j, RegisterMessage& msg);
void to_json(nlohmann::json& j, const FileMetadata& msg);
void from_json(const nlohmann::json& j, FileMetadata& msg);
void to_json(nlohmann::json& j, const FileRequest& msg);
void from_json(const nlohmann::json& j, FileRequest& msg);
void to_json(nlohmann::json& j, const FileResponse& msg);
void from_json(const nlohmann::json& j, FileResponse& msg);
void to_json(nlohmann::json& j, const IncomingFileMetadata& msg);
void from_json(const nlohmann::json& j, IncomingFileMetadata& msg);
void to_json(nlohmann::json& j, const PrepareRequest& msg);
void from_json(const nlohmann::json& j, PrepareRequest& msg);
void to_json(nlohmann::json& j, const PrepareResponse& msg);
void from_json(const nlohmann::json& j, PrepareResponse& msg);
void to_json(nlohmann::json& j, const CancelRequest& msg);
void from_json(const nlohmann::json& j, CancelRequest& msg);

std::string make_error_body(const std::string& message);

// Returns nullopt for malformed JSON or missing required fields
template<typename T>
std::optional<T> parse_message(std::string_view body) {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }
    try {
        return j.get<T>();
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

template<typename T>
std::string serialize_message(const T& msg) {
    nlohmann::json j = msg;
    return j.dump();
}

}
