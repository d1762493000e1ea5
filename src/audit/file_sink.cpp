#include "audit/file_sink.hpp"

#include <filesystem>
#include <format>
#include <stdexcept>

namespace nl2sql {

FileSink::FileSink(const Config& config)
    : config_(config),
      last_rotation_time_(std::chrono::system_clock::now()) {
    const auto parent = std::filesystem::path(config_.output_file).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    file_stream_.open(config_.output_file, std::ios::app);
    if (!file_stream_.is_open()) {
        throw std::runtime_error("Failed to open turn log file: " + config_.output_file);
    }

    // Appending to an existing file counts towards the size limit
    std::error_code ec;
    const auto file_size = std::filesystem::file_size(config_.output_file, ec);
    if (!ec) {
        current_file_size_ = static_cast<size_t>(file_size);
    }
}

FileSink::~FileSink() {
    shutdown();
}

bool FileSink::write(std::string_view json_line) {
    std::lock_guard lock(mutex_);
    if (!file_stream_.is_open()) return false;
    check_rotation_locked();
    file_stream_.write(json_line.data(), static_cast<std::streamsize>(json_line.size()));
    current_file_size_ += json_line.size();
    return file_stream_.good();
}

void FileSink::flush() {
    std::lock_guard lock(mutex_);
    file_stream_.flush();
}

void FileSink::shutdown() {
    std::lock_guard lock(mutex_);
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
}

std::string FileSink::name() const {
    return "file:" + config_.output_file;
}

size_t FileSink::rotation_count() const {
    std::lock_guard lock(mutex_);
    return rotation_count_;
}

size_t FileSink::current_file_size() const {
    std::lock_guard lock(mutex_);
    return current_file_size_;
}

void FileSink::check_rotation_locked() {
    bool need_rotate = config_.size_based_rotation &&
                       current_file_size_ >= config_.max_file_size_bytes;

    if (config_.time_based_rotation &&
        std::chrono::system_clock::now() - last_rotation_time_ >= config_.rotation_interval) {
        need_rotate = true;
    }

    if (need_rotate) {
        rotate_file_locked();
    }
}

void FileSink::rotate_file_locked() {
    file_stream_.flush();
    file_stream_.close();

    std::error_code ec;

    // Oldest file falls off the end
    std::filesystem::remove(std::format("{}.{}", config_.output_file, config_.max_files), ec);

    // .N -> .N+1; missing files are skipped
    for (int i = config_.max_files - 1; i >= 1; --i) {
        std::filesystem::rename(std::format("{}.{}", config_.output_file, i),
                                std::format("{}.{}", config_.output_file, i + 1), ec);
    }

    std::filesystem::rename(config_.output_file, config_.output_file + ".1", ec);

    file_stream_.open(config_.output_file, std::ios::app);
    current_file_size_ = 0;
    last_rotation_time_ = std::chrono::system_clock::now();
    ++rotation_count_;
}

} // namespace nl2sql
