#include "peersend/core/config.hpp"
#include "peersend/core/utils.hpp"
#include <boost/asio/ip/host_name.hpp>
#include <algorithm>
#include <cctype>

namespace peersend::core {

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        
        if (line.empty() || line[0] == '#') {
            continue;
        }
        
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        
        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        
        if (!key.empty()) {
            values_[key] = value;
        }
    }
    
    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    file << "# PeerSend Configuration\n\n";
    
    for (const auto& [key, value] : values_) {
        file << key << "=" << value << "\n";
    }
    
    return true;
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;
    
    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower == "true" || lower == "1" || lower == "yes";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

void Config::set_defaults() {
    values_["device.type"] = "desktop";
    values_["server.port"] = std::to_string(DEFAULT_PORT);
    values_["server.use_tls"] = "false";
    values_["transfer.chunk_size"] = std::to_string(BLOCK_SIZE);
    values_["session.timeout_secs"] = std::to_string(SESSION_TIMEOUT_SECS);
    values_["discovery.enabled"] = "true";
    values_["discovery.multicast_group"] = DEFAULT_MULTICAST_GROUP;
    values_["discovery.multicast_port"] = std::to_string(DEFAULT_PORT);
    values_["discovery.announce_interval_ms"] = std::to_string(ANNOUNCEMENT_INTERVAL_MS);
    values_["discovery.max_concurrent_probes"] = "64";
    values_["discovery.probe_timeout_ms"] = "2000";
    values_["log.level"] = "info";
    values_["log.file"] = "peersend.log";
}

std::string Config::trim(const std::string& str) const {
    return utils::StringUtils::trim(str);
}

LocalSendConfig LocalSendConfig::make_default() {
    LocalSendConfig config;
    config.device_id = utils::UuidUtils::generate();
    config.api_key = utils::UuidUtils::generate();
    
    boost::system::error_code ec;
    config.device_name = boost::asio::ip::host_name(ec);
    if (ec || config.device_name.empty()) {
        config.device_name = "peersend";
    }
    
    config.download_dir = utils::FileUtils::get_temp_dir();
    return config;
}

LocalSendConfig LocalSendConfig::from_config(const Config& config) {
    auto result = make_default();
    
    result.device_id = config.get_string("device.id", result.device_id);
    result.device_name = config.get_string("device.name", result.device_name);
    result.device_type = config.get_string("device.type", result.device_type);
    result.port = static_cast<std::uint16_t>(config.get_int("server.port", result.port));
    result.use_tls = config.get_bool("server.use_tls", result.use_tls);
    result.api_key = config.get_string("server.api_key", result.api_key);
    result.download_dir = config.get_string("transfer.download_dir", result.download_dir.string());
    
    result.chunk_size = static_cast<std::size_t>(
        config.get_int("transfer.chunk_size", static_cast<int>(result.chunk_size)));
    result.session_timeout = std::chrono::seconds(
        config.get_int("session.timeout_secs", static_cast<int>(result.session_timeout.count())));
    
    result.multicast_group = config.get_string("discovery.multicast_group", result.multicast_group);
    result.multicast_port = static_cast<std::uint16_t>(
        config.get_int("discovery.multicast_port", result.multicast_port));
    result.announce_interval = std::chrono::milliseconds(
        config.get_int("discovery.announce_interval_ms", static_cast<int>(result.announce_interval.count())));
    result.max_concurrent_probes = static_cast<std::size_t>(
        config.get_int("discovery.max_concurrent_probes", static_cast<int>(result.max_concurrent_probes)));
    result.probe_timeout = std::chrono::milliseconds(
        config.get_int("discovery.probe_timeout_ms", static_cast<int>(result.probe_timeout.count())));
    
    result.worker_threads = static_cast<std::size_t>(config.get_int("runtime.worker_threads", 0));
    
    return result;
}

bool LocalSendConfig::validate() const {
    if (device_id.empty() || device_name.empty()) {
        return false;
    }
    
    if (port == 0 || multicast_port == 0) {
        return false;
    }
    
    // 1KB to 16MB chunks
    if (chunk_size < 1024 || chunk_size > 16 * 1024 * 1024) {
        return false;
    }
    
    if (max_concurrent_probes == 0 || session_timeout.count() <= 0 || announce_interval.count() <= 0) {
        return false;
    }
    
    return !download_dir.empty();
}

}
