#pragma once
/** @file  RemoteFileAccess.hpp
 *  @brief Probe and fetch files that live on the device.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace amppoll {
  namespace io {

    /// Communication fault while probing or copying a remote file.
    class TransferError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    class RemoteFileAccess {
    public:
      virtual ~RemoteFileAccess() = default;

      /// Size in bytes, or std::nullopt when the path does not exist.
      /// Throws TransferError when the device cannot be asked.
      virtual std::optional<std::uintmax_t> remoteSize(const std::string& path) = 0;

      /// Copies \p remotePath to \p localPath. Throws TransferError.
      virtual void fetch(const std::string& remotePath, const std::filesystem::path& localPath) = 0;
    };

  } // namespace io
} // namespace amppoll
