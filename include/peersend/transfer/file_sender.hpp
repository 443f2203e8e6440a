#pragma once

#include "peersend/transfer/transfer_types.hpp"
#include "peersend/core/config.hpp"
#include <chrono>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <optional>
#include <vector>

namespace peersend::transfer {

// Reads the session's files in order as a sequence of chunks.
class FileSender {
public:
    explicit FileSender(std::vector<FileInfo> files, std::size_t chunk_size = core::BLOCK_SIZE);
    ~FileSender();
    
    FileSender(const FileSender&) = delete;
    FileSender& operator=(const FileSender&) = delete;
    
    // Leaves out_chunk empty once the file list is exhausted. A current file
    // with nothing left to read yields an empty vector.
    TransferResult read_chunk(std::optional<std::vector<std::uint8_t>>& out_chunk);
    
    bool current_file_done() const;
    bool next_file();
    bool is_complete() const;
    
    TransferProgress get_progress() const;
    std::size_t current_index() const;
    std::optional<FileInfo> current_file_info() const;
    std::size_t total_files() const { return files_.size(); }
    
    void set_chunk_size(std::size_t chunk_size);
    std::size_t chunk_size() const;

private:
    TransferResult open_current_locked();
    
    const std::vector<FileInfo> files_;
    const std::uint64_t total_bytes_;
    
    mutable std::mutex mutex_;
    std::size_t chunk_size_;
    std::size_t file_index_;
    std::ifstream input_;
    std::uint64_t current_read_;
    std::uint64_t bytes_sent_;
    std::optional<std::chrono::steady_clock::time_point> started_at_;
};

}
