/* @file FileLogger.cpp
 * @brief buffered fwrite-based CSV sink
 *
 * © 2026 Stocktake Engine — MIT-licensed.
 */

#include <utility>

#include "io/FileLogger.hpp"

using namespace stocktake::io;

FileLogger::~FileLogger() { close(); }

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), wasEmpty_(other.wasEmpty_),
      buffer_(std::move(other.buffer_)) {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    wasEmpty_ = other.wasEmpty_;
    buffer_ = std::move(other.buffer_);
  }
  return *this;
}

bool FileLogger::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "a");
  if (!fp_)
    return false;
  std::fseek(fp_, 0, SEEK_END);
  wasEmpty_ = std::ftell(fp_) == 0;
  buffer_.reserve(kChunk);
  return true;
}

bool FileLogger::write(const std::string& csv) {
  if (!fp_)
    return false;
  buffer_.insert(buffer_.end(), csv.begin(), csv.end());
  return buffer_.size() < kChunk || flush();
}

bool FileLogger::flush() {
  if (!fp_)
    return false;
  if (!buffer_.empty()) {
    const std::size_t n = std::fwrite(buffer_.data(), 1, buffer_.size(), fp_);
    if (n != buffer_.size()) {
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(n));
      return false;
    }
    buffer_.clear();
  }
  return std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (fp_) {
    flush();
    std::fclose(fp_);
    fp_ = nullptr;
  }
  buffer_.clear();
}
