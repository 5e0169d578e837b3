#pragma once
/** @file  FileLogger.hpp
 *  @brief Append-only buffered file sink used by core::Logger for the run CSV.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace amppoll {
  namespace io {

    /**
 * @class FileLogger
 * @brief Owns one `FILE*`; lines collect in memory and go out in `kChunk`
 *        pieces once a chunk is full or on `flush()`.
 *
 *  * Only the Logger worker thread touches an instance; no locking inside.
 *  * Failures are reported on stderr and through the bool results.
 */
    class FileLogger {
    public:
      static constexpr std::size_t kChunk = 4096;

      FileLogger() = default;
      ~FileLogger(); ///< close()

      //---public API------------------------------------------------------
      /** Closes any previous file first. @returns false if \p path cannot be appended to. */
      bool open(const std::string& path);

      /** Buffers \p line; the caller supplies the trailing '\n'. */
      void write(const std::string& line);

      bool flush();
      void close(); ///< flush + fclose, idempotent

      bool isOpen() const { return fp_ != nullptr; }
      const std::string& path() const { return path_; }
      std::size_t bytesWritten() const { return written_; } ///< bytes handed to fwrite

      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;

    private:
      FILE* fp_{ nullptr };
      std::string path_;
      std::vector<char> buffer_;
      std::size_t written_{ 0 };
    };

  } // namespace io
} // namespace amppoll
