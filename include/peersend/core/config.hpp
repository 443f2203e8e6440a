#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>

namespace peersend::core {

constexpr std::uint16_t DEFAULT_PORT = 53317;
constexpr const char* DEFAULT_MULTICAST_GROUP = "224.0.0.115";
constexpr std::uint32_t ANNOUNCEMENT_INTERVAL_MS = 5000;
constexpr std::uint32_t SESSION_TIMEOUT_SECS = 300;
constexpr std::size_t BLOCK_SIZE = 1024 * 1024;

class Config {
public:
    Config() = default;
    
    bool load_from_file(const std::string& filename);
    bool save_to_file(const std::string& filename) const;
    
    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    
    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        auto value = get(key);
        if (!value) return std::nullopt;
        
        std::istringstream iss(*value);
        T result;
        iss >> result;
        if (iss.fail() || !iss.eof()) return std::nullopt;
        return result;
    }
    
    bool get_bool(const std::string& key, bool default_value = false) const;
    int get_int(const std::string& key, int default_value = 0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    
    bool contains(const std::string& key) const { return values_.count(key) > 0; }
    void clear() { values_.clear(); }
    void set_defaults();

private:
    std::string trim(const std::string& str) const;
    
    std::map<std::string, std::string> values_;
};

// Settings every core component needs before it is constructed.
struct LocalSendConfig {
    std::string device_id;
    std::string device_name;
    std::string device_type = "desktop";
    std::uint16_t port = DEFAULT_PORT;
    bool use_tls = false;
    std::filesystem::path download_dir;
    std::string api_key;
    
    std::size_t chunk_size = BLOCK_SIZE;
    std::chrono::seconds session_timeout{SESSION_TIMEOUT_SECS};
    
    std::string multicast_group = DEFAULT_MULTICAST_GROUP;
    std::uint16_t multicast_port = DEFAULT_PORT;
    std::chrono::milliseconds announce_interval{ANNOUNCEMENT_INTERVAL_MS};
    std::size_t max_concurrent_probes = 64;
    std::chrono::milliseconds probe_timeout{2000};
    
    std::size_t worker_threads = 0; // 0 picks hardware concurrency
    
    // Random device id and api key, host name, system temp directory.
    static LocalSendConfig make_default();
    static LocalSendConfig from_config(const Config& config);
    
    bool validate() const;
};

}
