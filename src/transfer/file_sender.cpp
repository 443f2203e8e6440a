#include "peersend/transfer/file_sender.hpp"
#include "peersend/core/logger.hpp"
#include <algorithm>
#include <numeric>

namespace peersend::transfer {

namespace {
    std::uint64_t sum_sizes(const std::vector<FileInfo>& files) {
        return std::accumulate(files.begin(), files.end(), std::uint64_t{0},
            [](std::uint64_t total, const FileInfo& file) { return total + file.size; });
    }
}

FileSender::FileSender(std::vector<FileInfo> files, std::size_t chunk_size)
    : files_(std::move(files))
    , total_bytes_(sum_sizes(files_))
    , chunk_size_(std::max<std::size_t>(1, chunk_size))
    , file_index_(0)
    , current_read_(0)
    , bytes_sent_(0) {
}

FileSender::~FileSender() = default;

TransferResult FileSender::open_current_locked() {
    const auto& file = files_[file_index_];
    input_.open(file.source_path, std::ios::binary);
    if (!input_.is_open()) {
        return TransferResult(TransferError::IO_FAILURE,
                              "Cannot open " + file.source_path.string());
    }
    current_read_ = 0;
    LOG_DEBUG("Sending {} ({} bytes)", file.name, file.size);
    return TransferResult();
}

TransferResult FileSender::read_chunk(std::optional<std::vector<std::uint8_t>>& out_chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_chunk.reset();
    
    if (file_index_ >= files_.size()) {
        return TransferResult();
    }
    
    if (!input_.is_open()) {
        auto result = open_current_locked();
        if (!result) {
            return result;
        }
    }
    
    const auto& file = files_[file_index_];
    auto remaining = file.size - current_read_;
    auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, chunk_size_));
    
    std::vector<std::uint8_t> buffer(wanted);
    if (wanted > 0) {
        input_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(wanted));
        auto got = static_cast<std::size_t>(input_.gcount());
        if (got < wanted) {
            input_.close();
            return TransferResult(TransferError::IO_FAILURE,
                                  file.source_path.string() + " is shorter than its declared size");
        }
    }
    
    if (!started_at_) {
        started_at_ = std::chrono::steady_clock::now();
    }
    current_read_ += wanted;
    bytes_sent_ += wanted;
    out_chunk = std::move(buffer);
    return TransferResult();
}

bool FileSender::current_file_done() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_index_ >= files_.size()) {
        return true;
    }
    return current_read_ >= files_[file_index_].size;
}

bool FileSender::next_file() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (input_.is_open()) {
        input_.close();
    }
    input_.clear();
    current_read_ = 0;
    
    if (file_index_ < files_.size()) {
        ++file_index_;
    }
    return file_index_ < files_.size();
}

bool FileSender::is_complete() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_index_ >= files_.size();
}

TransferProgress FileSender::get_progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    TransferProgress progress;
    progress.bytes_transferred = bytes_sent_;
    progress.total_bytes = total_bytes_;
    
    if (started_at_) {
        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - *started_at_).count();
        if (elapsed > 0.0) {
            progress.speed_bytes_per_sec = static_cast<double>(bytes_sent_) / elapsed;
        }
    }
    return progress;
}

std::size_t FileSender::current_index() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_index_;
}

std::optional<FileInfo> FileSender::current_file_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_index_ >= files_.size()) {
        return std::nullopt;
    }
    return files_[file_index_];
}

void FileSender::set_chunk_size(std::size_t chunk_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    chunk_size_ = std::max<std::size_t>(1, chunk_size);
}

std::size_t FileSender::chunk_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunk_size_;
}

}
