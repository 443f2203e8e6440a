#include "peersend/transfer/file_receiver.hpp"
#include "peersend/core/logger.hpp"
#include <algorithm>
#include <numeric>

namespace peersend::transfer {

namespace fs = std::filesystem;

namespace {
    std::uint64_t sum_sizes(const std::vector<FileInfo>& files) {
        return std::accumulate(files.begin(), files.end(), std::uint64_t{0},
            [](std::uint64_t total, const FileInfo& file) { return total + file.size; });
    }
    
    bool is_within(const fs::path& base, const fs::path& candidate) {
        auto [base_end, candidate_it] = std::mismatch(base.begin(), base.end(),
                                                      candidate.begin(), candidate.end());
        return base_end == base.end() && candidate_it != candidate.end();
    }
}

FileReceiver::FileReceiver(std::vector<FileInfo> files, fs::path output_dir)
    : files_(std::move(files))
    , total_bytes_(sum_sizes(files_))
    , output_dir_(std::move(output_dir))
    , file_index_(0)
    , current_written_(0)
    , bytes_received_(0) {
}

FileReceiver::~FileReceiver() {
    if (output_.is_open()) {
        output_.close();
    }
}

TransferResult FileReceiver::get_save_path(const std::string& name, fs::path& out_path) const {
    if (name.empty()) {
        return TransferResult(TransferError::PATH_REJECTED, "Empty file name");
    }
    
    fs::path relative(name);
    if (relative.is_absolute() || relative.has_root_name() || relative.has_root_directory()) {
        return TransferResult(TransferError::PATH_REJECTED, "Absolute path rejected: " + name);
    }
    
    for (const auto& part : relative) {
        if (part == "..") {
            return TransferResult(TransferError::PATH_REJECTED, "Parent traversal rejected: " + name);
        }
    }
    
    if (!relative.has_filename()) {
        return TransferResult(TransferError::PATH_REJECTED, "No file name in: " + name);
    }
    
    std::error_code ec;
    auto base = fs::weakly_canonical(output_dir_, ec);
    if (ec) {
        return TransferResult(TransferError::IO_FAILURE, "Cannot resolve output directory: " + ec.message());
    }
    if (!base.has_filename()) {
        base = base.parent_path();
    }
    auto resolved = fs::weakly_canonical(base / relative, ec);
    if (ec) {
        return TransferResult(TransferError::IO_FAILURE, "Cannot resolve " + name + ": " + ec.message());
    }
    
    // Catches symlinks inside the output directory that point elsewhere
    if (!is_within(base, resolved)) {
        return TransferResult(TransferError::PATH_REJECTED, name + " resolves outside the output directory");
    }
    
    out_path = resolved;
    return TransferResult();
}

TransferResult FileReceiver::set_save_as(const std::string& file_id, const std::string& name) {
    fs::path unused;
    auto result = get_save_path(name, unused);
    if (!result) {
        return result;
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    for (std::size_t i = 0; i < files_.size(); ++i) {
        if (files_[i].id != file_id) {
            continue;
        }
        if (i < file_index_ || (i == file_index_ && output_.is_open())) {
            return TransferResult(TransferError::INVALID_STATE, "File " + file_id + " already started");
        }
        save_names_[file_id] = name;
        return TransferResult();
    }
    return TransferResult(TransferError::INVALID_STATE, "Unknown file " + file_id);
}

std::string FileReceiver::save_name_locked(const FileInfo& file) const {
    auto it = save_names_.find(file.id);
    return it != save_names_.end() ? it->second : file.name;
}

TransferResult FileReceiver::start_file(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return start_file_locked(name);
}

TransferResult FileReceiver::start_file_locked(const std::string& name) {
    if (file_index_ >= files_.size()) {
        return TransferResult(TransferError::INVALID_STATE, "All files already received");
    }
    
    fs::path path;
    auto result = get_save_path(name, path);
    if (!result) {
        return result;
    }
    
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return TransferResult(TransferError::IO_FAILURE,
                              "Cannot create " + path.parent_path().string() + ": " + ec.message());
    }
    
    if (output_.is_open()) {
        output_.close();
    }
    output_.clear();
    output_.open(path, std::ios::binary | std::ios::trunc);
    if (!output_.is_open()) {
        return TransferResult(TransferError::IO_FAILURE, "Cannot create " + path.string());
    }
    
    current_path_ = path;
    current_written_ = 0;
    LOG_DEBUG("Receiving {} into {}", files_[file_index_].name, path.string());
    return TransferResult();
}

TransferResult FileReceiver::write_chunk(std::span<const std::uint8_t> data,
                                         std::string_view expected_file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (file_index_ >= files_.size()) {
        return TransferResult(TransferError::INVALID_STATE, "All files already received");
    }
    
    const auto& file = files_[file_index_];
    if (!expected_file_id.empty() && file.id != expected_file_id) {
        return TransferResult(TransferError::INVALID_STATE,
                              "Chunk for " + std::string(expected_file_id) + " but receiving " + file.id);
    }
    if (!output_.is_open()) {
        auto result = start_file_locked(save_name_locked(file));
        if (!result) {
            return result;
        }
    }
    
    if (data.size() > file.size - current_written_) {
        return TransferResult(TransferError::SIZE_MISMATCH,
                              "Chunk exceeds declared size of " + file.name);
    }
    
    if (!data.empty()) {
        output_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!output_) {
            return TransferResult(TransferError::IO_FAILURE, "Write failed for " + current_path_.string());
        }
    }
    
    if (!started_at_) {
        started_at_ = std::chrono::steady_clock::now();
    }
    current_written_ += data.size();
    bytes_received_ += data.size();
    
    if (current_written_ == file.size) {
        output_.flush();
        if (!output_) {
            return TransferResult(TransferError::IO_FAILURE, "Flush failed for " + current_path_.string());
        }
        finish_current_file_locked();
    }
    return TransferResult();
}

void FileReceiver::finish_current_file() {
    std::lock_guard<std::mutex> lock(mutex_);
    finish_current_file_locked();
}

void FileReceiver::finish_current_file_locked() {
    if (output_.is_open()) {
        output_.close();
        LOG_INFO("Received {} ({} bytes)", current_path_.string(), current_written_);
    }
    current_path_.clear();
    current_written_ = 0;
    if (file_index_ < files_.size()) {
        ++file_index_;
    }
}

bool FileReceiver::is_complete() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_index_ >= files_.size();
}

TransferProgress FileReceiver::get_progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    TransferProgress progress;
    progress.bytes_transferred = bytes_received_;
    progress.total_bytes = total_bytes_;
    
    if (started_at_) {
        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - *started_at_).count();
        if (elapsed > 0.0) {
            progress.speed_bytes_per_sec = static_cast<double>(bytes_received_) / elapsed;
        }
    }
    return progress;
}

std::size_t FileReceiver::current_index() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_index_;
}

std::optional<FileInfo> FileReceiver::current_file_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_index_ >= files_.size()) {
        return std::nullopt;
    }
    return files_[file_index_];
}

std::uint64_t FileReceiver::current_file_received() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_written_;
}

}
