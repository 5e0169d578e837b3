#pragma once
/** @file  ShellChannel.hpp
 *  @brief Byte-stream view of an interactive device shell.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>

namespace amppoll {
  namespace io {

    /**
 * @class ShellChannel
 * @brief Interface the prompt engine drives; SshConnection is the real one,
 *        tests script a fake.
 *
 *  * No framing: writes go out verbatim, reads return whatever arrived.
 *  * *Non-copyable*; owners hold it through a smart pointer.
 */
    class ShellChannel {

    public:
      ShellChannel() = default;
      virtual ~ShellChannel() = default;

      //---public API-------------------------------------------
      virtual bool write(const std::string& data) = 0; // returns false on a dead channel

      /// Waits at most \p maxWait for data. Empty string on timeout,
      /// std::nullopt once the channel is closed or broken.
      virtual std::optional<std::string> read(std::chrono::milliseconds maxWait) = 0;

      virtual void close() = 0;

      //---non-copyable-----------------------------------------
      ShellChannel(const ShellChannel&) = delete;
      ShellChannel& operator=(const ShellChannel&) = delete;
    };

  } // namespace io
} // namespace amppoll
