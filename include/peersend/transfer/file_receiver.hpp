#pragma once

#include "peersend/transfer/transfer_types.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace peersend::transfer {

// Writes incoming chunks into the output directory, one file at a time.
class FileReceiver {
public:
    FileReceiver(std::vector<FileInfo> files, std::filesystem::path output_dir);
    ~FileReceiver();
    
    FileReceiver(const FileReceiver&) = delete;
    FileReceiver& operator=(const FileReceiver&) = delete;
    
    // Rejects absolute paths, root names, ".." and anything resolving outside the output directory
    TransferResult get_save_path(const std::string& name, std::filesystem::path& out_path) const;
    
    // Overrides the destination name of one file before its first chunk
    TransferResult set_save_as(const std::string& file_id, const std::string& name);
    
    TransferResult start_file(const std::string& name);
    // A non-empty expected_file_id must name the current file or the chunk is refused
    TransferResult write_chunk(std::span<const std::uint8_t> data,
                               std::string_view expected_file_id = {});
    void finish_current_file();
    
    bool is_complete() const;
    TransferProgress get_progress() const;
    std::size_t current_index() const;
    std::optional<FileInfo> current_file_info() const;
    std::uint64_t current_file_received() const;
    
    const std::filesystem::path& output_dir() const { return output_dir_; }

private:
    TransferResult start_file_locked(const std::string& name);
    void finish_current_file_locked();
    std::string save_name_locked(const FileInfo& file) const;
    
    const std::vector<FileInfo> files_;
    const std::uint64_t total_bytes_;
    const std::filesystem::path output_dir_;
    
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> save_names_;
    std::size_t file_index_;
    std::ofstream output_;
    std::filesystem::path current_path_;
    std::uint64_t current_written_;
    std::uint64_t bytes_received_;
    std::optional<std::chrono::steady_clock::time_point> started_at_;
};

}
