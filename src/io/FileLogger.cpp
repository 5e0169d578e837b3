/* @file FileLogger.cpp
 * @brief stdio-backed buffered writer
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <algorithm>
#include <cstring>
#include <iostream>

// AmpPoll headers
#include "io/FileLogger.hpp"

using namespace amppoll::io;

FileLogger::~FileLogger() { close(); }

bool FileLogger::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "a");
  if (!fp_) {
    std::cerr << "[FileLogger] cannot open " << path << ": " << std::strerror(errno) << "\n";
    return false;
  }
  path_ = path;
  written_ = 0;
  buffer_.reserve(kChunk);
  return true;
}

void FileLogger::write(const std::string& line) {
  if (!fp_)
    return;
  buffer_.insert(buffer_.end(), line.begin(), line.end());
  if (buffer_.size() >= kChunk && !flush())
    buffer_.clear(); // already reported on stderr
}

bool FileLogger::flush() {
  if (!fp_)
    return false;

  std::size_t total = 0;
  while (total < buffer_.size()) {
    const std::size_t n = std::min(kChunk, buffer_.size() - total);
    if (std::fwrite(buffer_.data() + total, 1, n, fp_) != n) {
      std::cerr << "[FileLogger] write failed: " << std::strerror(errno) << "\n";
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(total));
      return false;
    }
    total += n;
    written_ += n;
  }
  buffer_.clear();
  return std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (!fp_)
    return;
  flush();
  if (std::fclose(fp_) != 0)
    std::cerr << "[FileLogger] close " << path_ << ": " << std::strerror(errno) << "\n";
  fp_ = nullptr;
}
