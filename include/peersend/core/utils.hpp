#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace peersend::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
    static std::string format_bytes(std::size_t bytes);
    static std::string url_decode(const std::string& str);
    static std::string url_encode(const std::string& str);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static std::optional<std::uint64_t> file_size(const std::filesystem::path& path);
    static std::filesystem::path get_temp_dir();
    static std::filesystem::path get_home_dir();
};

class UuidUtils {
public:
    // Random (version 4) UUID in canonical text form.
    static std::string generate();
};

}
