/* @file Logger.cpp
 * @brief queue + worker thread feeding io::FileLogger
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

// AmpPoll headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"

using namespace amppoll::core;

namespace {

  std::string stamp(std::chrono::system_clock::time_point when, const char* fmt, bool millis) {
    const std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    ::localtime_r(&t, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, fmt);
    if (millis) {
      const auto ms =
          std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count() % 1000;
      os << '.' << std::setw(3) << std::setfill('0') << ms;
    }
    return os.str();
  }

  std::string quoted(const std::string& field) {
    std::string out = "\"";
    for (char c : field) {
      if (c == '"')
        out += "\"\"";
      else if (c == '\n' || c == '\r')
        out += ' ';
      else
        out += c;
    }
    out += '"';
    return out;
  }

} // namespace

namespace amppoll::core {

  const char* toString(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warning:
      return "WARNING";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Critical:
      return "CRITICAL";
    default:
      return "UNKNOWN";
    }
  }

} // namespace amppoll::core

Logger::Logger(std::size_t capacity) : buffer_{ std::make_unique<RingBuffer<LogEvent>>(capacity) } {}

Logger::~Logger() { finishRun(); }

std::filesystem::path Logger::startNewRun(const std::filesystem::path& dir) {
  finishRun();

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  const auto path =
      dir / ("workflow_log_" + stamp(std::chrono::system_clock::now(), "%Y-%m-%d_%H-%M-%S", false) + ".csv");
  if (!file_.open(path.string()))
    throw std::runtime_error("[Logger] cannot open run log " + path.string());

  {
    std::lock_guard<std::mutex> lock(mtx_);
    running_ = true;
  }
  worker_ = std::thread([this] { drain(); });
  return path;
}

void Logger::log(const LogEvent& event) {
  bool queued = false;
  {
    // finishRun() flips running_ under the same lock, so nothing lands after the last drain
    std::lock_guard<std::mutex> lock(mtx_);
    if (running_) {
      if (buffer_->push(event))
        ++dropped_;
      queued = true;
    }
  }
  if (!queued) {
    echo(event);
    return;
  }
  cv_.notify_one();
}

void Logger::log(LogLevel level, std::string source, std::string message) {
  LogEvent event;
  event.level = level;
  event.source = std::move(source);
  event.message = std::move(message);
  log(event);
}

void Logger::finishRun() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!running_)
      return;
    running_ = false;
  }
  cv_.notify_one();
  if (worker_.joinable())
    worker_.join();
  file_.close();
}

std::string Logger::toCsv(const LogEvent& event) {
  std::string line = stamp(event.when, "%Y-%m-%dT%H:%M:%S", true);
  line += ',';
  line += toString(event.level);
  line += ',';
  line += quoted(event.source);
  line += ',';
  line += quoted(event.message);
  line += '\n';
  return line;
}

void Logger::drain() {
  std::vector<LogEvent> batch;
  for (;;) {
    {
      std::unique_lock<std::mutex> lock(mtx_);
      cv_.wait(lock, [this] { return !buffer_->empty() || !running_; });
      while (auto ev = buffer_->pop())
        batch.push_back(std::move(*ev));
    }

    for (const auto& ev : batch) {
      file_.write(toCsv(ev));
      echo(ev);
    }
    batch.clear();

    if (!running_) {
      std::lock_guard<std::mutex> lock(mtx_);
      if (buffer_->empty())
        break;
    }
  }
  if (!file_.flush())
    std::cerr << "[Logger] run log flush failed\n";
}

void Logger::echo(const LogEvent& event) const {
  if (event.level < echoLevel_.load())
    return;
  std::lock_guard<std::mutex> lock(echoMtx_);
  std::clog << toString(event.level) << " [" << event.source << "] " << event.message << '\n';
}
