#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV run logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "io/FileLogger.hpp"

namespace amppoll {
  namespace core {

    enum class LogLevel { Debug, Info, Warning, Error, Critical };

    const char* toString(LogLevel level);

    struct LogEvent {
      LogLevel level{ LogLevel::Info };
      std::string source;  ///< device key or component name
      std::string message;
      std::chrono::system_clock::time_point when{ std::chrono::system_clock::now() };
    };

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    /**
 * @class Logger
 * @brief Producers enqueue, one worker thread formats and writes.
 *
 *  * `log()` never blocks on disk; when the queue is full the oldest event
 *    is dropped and counted.
 *  * Events at or above the echo level are mirrored to stderr.
 *  * Outside a run, events go to stderr synchronously (echo level applies).
 */
    class Logger {

    public:
      explicit Logger(std::size_t capacity = 4096);
      ~Logger(); ///< finishRun()

      // --- public API ---
      /// open `workflow_log_<stamp>.csv` in \p dir + launch worker thread
      std::filesystem::path startNewRun(const std::filesystem::path& dir);
      void log(const LogEvent& event); ///< enqueue event (non-blocking)
      void log(LogLevel level, std::string source, std::string message);
      void finishRun(); ///< flush + join worker thread

      void setEchoLevel(LogLevel level) { echoLevel_ = level; }
      std::size_t dropped() const { return dropped_; }

      /// One CSV line, newline-terminated.
      static std::string toCsv(const LogEvent& event);

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void drain();
      void echo(const LogEvent& event) const;

      io::FileLogger file_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::atomic<LogLevel> echoLevel_{ LogLevel::Warning };
      std::atomic<std::size_t> dropped_{ 0 };
      std::mutex mtx_; ///< guards buffer_ and every change of running_
      std::condition_variable cv_;
      mutable std::mutex echoMtx_;
    };

  } // namespace core
} // namespace amppoll
