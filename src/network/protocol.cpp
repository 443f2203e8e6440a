#include "peersend/network/protocol.hpp"
#include "peersend/core/utils.hpp"
#include <charconv>

namespace peersend::network {

using nlohmann::json;
using core::utils::StringUtils;

namespace {
    template<typename T>
    void put_optional(json& j, const char* key, const std::optional<T>& value) {
        if (value) {
            j[key] = *value;
        }
    }
    
    template<typename T>
    void get_optional(const json& j, const char* key, std::optional<T>& value) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) {
            value = it->get<T>();
        } else {
            value.reset();
        }
    }
    
    template<typename T>
    T get_or(const json& j, const char* key, T fallback) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) {
            return fallback;
        }
        return it->get<T>();
    }
    
    DeviceInfo make_device(const std::string& id, const std::string& name,
                           const std::string& device_type, const std::string& version,
                           const std::string& protocol_version, bool download,
                           std::optional<std::uint16_t> port,
                           const std::optional<std::string>& announcement_id,
                           bool uses_password, const std::optional<std::string>& fingerprint,
                           const std::string& sender_ip, std::uint16_t default_port) {
        DeviceInfo device;
        device.id = id;
        device.name = name;
        device.device_type = device_type;
        device.ip = sender_ip;
        device.port = port.value_or(default_port);
        device.version = version;
        device.protocol_version = protocol_version;
        device.announcement_id = announcement_id;
        device.uses_password = uses_password;
        device.download = download;
        device.fingerprint = fingerprint;
        return device;
    }
}

RequestType parse_request_type(std::string_view target) {
    auto query_pos = target.find('?');
    auto path = target.substr(0, query_pos);
    
    if (path == API_REGISTER) return RequestType::REGISTER;
    if (path == API_REQUEST) return RequestType::REQUEST;
    if (path == API_PREPARE_UPLOAD) return RequestType::PREPARE;
    if (path == API_UPLOAD) return RequestType::BLOCK;
    if (path == API_CANCEL) return RequestType::CANCEL;
    return RequestType::UNKNOWN;
}

const char* to_string(RequestType type) {
    switch (type) {
        case RequestType::REGISTER: return "register";
        case RequestType::REQUEST: return "request";
        case RequestType::PREPARE: return "prepare-upload";
        case RequestType::BLOCK: return "upload";
        case RequestType::CANCEL: return "cancel";
        case RequestType::UNKNOWN: return "unknown";
    }
    return "unknown";
}

DeviceInfo Announcement::to_device_info(const std::string& sender_ip, std::uint16_t default_port) const {
    return make_device(id, name, device_type, version, protocol_version, download, port,
                       announcement_id, uses_password, fingerprint, sender_ip, default_port);
}

DeviceInfo RegisterMessage::to_device_info(const std::string& sender_ip, std::uint16_t default_port) const {
    return make_device(id, name, device_type, version, protocol_version, download, port,
                       announcement_id, uses_password, fingerprint, sender_ip, default_port);
}

void to_json(json& j, const Announcement& msg) {
    j = json{
        {"type", msg.type},
        {"id", msg.id},
        {"deviceType", msg.device_type},
        {"name", msg.name},
        {"version", msg.version},
        {"protocolVersion", msg.protocol_version},
        {"download", msg.download},
        {"usesPassword", msg.uses_password}
    };
    put_optional(j, "port", msg.port);
    put_optional(j, "announcementId", msg.announcement_id);
    put_optional(j, "fingerprint", msg.fingerprint);
}

void from_json(const json& j, Announcement& msg) {
    j.at("type").get_to(msg.type);
    j.at("id").get_to(msg.id);
    j.at("deviceType").get_to(msg.device_type);
    j.at("name").get_to(msg.name);
    j.at("version").get_to(msg.version);
    j.at("protocolVersion").get_to(msg.protocol_version);
    msg.download = get_or(j, "download", false);
    msg.uses_password = get_or(j, "usesPassword", false);
    get_optional(j, "port", msg.port);
    get_optional(j, "announcementId", msg.announcement_id);
    get_optional(j, "fingerprint", msg.fingerprint);
}

void to_json(json& j, const RegisterMessage& msg) {
    j = json{
        {"id", msg.id},
        {"type", msg.device_type},
        {"name", msg.name},
        {"version", msg.version},
        {"protocolVersion", msg.protocol_version},
        {"download", msg.download},
        {"usesPassword", msg.uses_password}
    };
    put_optional(j, "port", msg.port);
    put_optional(j, "announcementId", msg.announcement_id);
    put_optional(j, "fingerprint", msg.fingerprint);
}

void from_json(const json& j, RegisterMessage& msg) {
    j.at("id").get_to(msg.id);
    j.at("type").get_to(msg.device_type);
    j.at("name").get_to(msg.name);
    j.at("version").get_to(msg.version);
    j.at("protocolVersion").get_to(msg.protocol_version);
    msg.download = get_or(j, "download", false);
    msg.uses_password = get_or(j, "usesPassword", false);
    get_optional(j, "port", msg.port);
    get_optional(j, "announcementId", msg.announcement_id);
    get_optional(j, "fingerprint", msg.fingerprint);
}

void to_json(json& j, const FileMetadata& msg) {
    j = json{
        {"id", msg.id},
        {"name", msg.name},
        {"fileType", msg.file_type},
        {"size", msg.size}
    };
    put_optional(j, "metadata", msg.metadata);
}

void from_json(const json& j, FileMetadata& msg) {
    j.at("id").get_to(msg.id);
    j.at("name").get_to(msg.name);
    j.at("fileType").get_to(msg.file_type);
    j.at("size").get_to(msg.size);
    get_optional(j, "metadata", msg.metadata);
}

void to_json(json& j, const FileRequest& msg) {
    j = json{
        {"id", msg.id},
        {"sender", msg.sender},
        {"senderType", msg.sender_type},
        {"files", msg.files},
        {"sessionId", msg.session_id},
        {"token", msg.token},
        {"message", msg.message},
        {"publicKey", msg.public_key}
    };
}

void from_json(const json& j, FileRequest& msg) {
    j.at("id").get_to(msg.id);
    j.at("sender").get_to(msg.sender);
    j.at("senderType").get_to(msg.sender_type);
    j.at("files").get_to(msg.files);
    j.at("sessionId").get_to(msg.session_id);
    msg.token = get_or<std::string>(j, "token", "");
    msg.message = get_or<std::string>(j, "message", "");
    msg.public_key = get_or<std::string>(j, "publicKey", "");
}

void to_json(json& j, const FileResponse& msg) {
    j = json{
        {"id", msg.id},
        {"sessionId", msg.session_id},
        {"accepted", msg.accepted},
        {"token", msg.token},
        {"publicKey", msg.public_key}
    };
}

void from_json(const json& j, FileResponse& msg) {
    j.at("id").get_to(msg.id);
    j.at("sessionId").get_to(msg.session_id);
    j.at("accepted").get_to(msg.accepted);
    msg.token = get_or<std::string>(j, "token", "");
    msg.public_key = get_or<std::string>(j, "publicKey", "");
}

void to_json(json& j, const IncomingFileMetadata& msg) {
    j = json{
        {"id", msg.id},
        {"name", msg.name},
        {"fileType", msg.file_type},
        {"size", msg.size}
    };
    put_optional(j, "saveAs", msg.save_as);
}

void from_json(const json& j, IncomingFileMetadata& msg) {
    j.at("id").get_to(msg.id);
    j.at("name").get_to(msg.name);
    j.at("fileType").get_to(msg.file_type);
    j.at("size").get_to(msg.size);
    get_optional(j, "saveAs", msg.save_as);
}

void to_json(json& j, const PrepareRequest& msg) {
    j = json{
        {"id", msg.id},
        {"sessionId", msg.session_id},
        {"files", msg.files},
        {"token", msg.token}
    };
}

void from_json(const json& j, PrepareRequest& msg) {
    j.at("id").get_to(msg.id);
    j.at("sessionId").get_to(msg.session_id);
    j.at("files").get_to(msg.files);
    msg.token = get_or<std::string>(j, "token", "");
}

void to_json(json& j, const PrepareResponse& msg) {
    j = json{
        {"id", msg.id},
        {"sessionId", msg.session_id},
        {"files", msg.files}
    };
}

void from_json(const json& j, PrepareResponse& msg) {
    j.at("id").get_to(msg.id);
    j.at("sessionId").get_to(msg.session_id);
    msg.files = get_or(j, "files", std::vector<IncomingFileMetadata>{});
}

void to_json(json& j, const CancelRequest& msg) {
    j = json{
        {"id", msg.id},
        {"sessionId", msg.session_id},
        {"reason", msg.reason}
    };
}

void from_json(const json& j, CancelRequest& msg) {
    j.at("id").get_to(msg.id);
    j.at("sessionId").get_to(msg.session_id);
    msg.reason = get_or<std::string>(j, "reason", "");
}

std::string BlockRequest::to_query() const {
    std::string query;
    query += "id=" + StringUtils::url_encode(id);
    query += "&sessionId=" + StringUtils::url_encode(session_id);
    query += "&fileId=" + StringUtils::url_encode(file_id);
    query += "&size=" + std::to_string(size);
    if (!token.empty()) {
        query += "&token=" + StringUtils::url_encode(token);
    }
    return query;
}

std::optional<BlockRequest> BlockRequest::from_query(std::string_view query) {
    if (auto pos = query.find('?'); pos != std::string_view::npos) {
        query = query.substr(pos + 1);
    }
    
    BlockRequest request;
    bool has_session = false;
    bool has_file = false;
    bool has_size = false;
    
    for (const auto& pair : StringUtils::split(std::string(query), '&')) {
        auto eq = pair.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        auto key = pair.substr(0, eq);
        auto value = StringUtils::url_decode(pair.substr(eq + 1));
        
        if (key == "id") {
            request.id = value;
        } else if (key == "sessionId") {
            request.session_id = value;
            has_session = !value.empty();
        } else if (key == "fileId") {
            request.file_id = value;
            has_file = !value.empty();
        } else if (key == "size") {
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), request.size);
            has_size = ec == std::errc() && ptr == value.data() + value.size();
        } else if (key == "token") {
            request.token = value;
        }
    }
    
    if (!has_session || !has_file || !has_size) {
        return std::nullopt;
    }
    return request;
}

std::string make_error_body(const std::string& message) {
    return json{{"error", message}}.dump();
}

}
