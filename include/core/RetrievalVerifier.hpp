#pragma once
/** @file  RetrievalVerifier.hpp
 *  @brief Confirms remote artifacts exist and are non-empty before any
 *         transfer is attempted.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <string>
#include <vector>

// AmpPoll headers
#include "io/RemoteFileAccess.hpp"
#include "protocols/CommandStep.hpp"

namespace amppoll::core {

  enum class VerifyStatus { Ok, MissingArtifact, EmptyArtifact };

  const char* toString(VerifyStatus s);

  struct VerifyOutcome {
    VerifyStatus status{ VerifyStatus::Ok };
    std::string path{};       ///< first offending artifact, empty when Ok
    std::uintmax_t size{ 0 }; ///< its size, when it exists

    bool ok() const { return status == VerifyStatus::Ok; }
  };

  /**
 * @class RetrievalVerifier
 * @brief Stops at the first missing or undersized artifact.
 *
 * Missing / Empty are expected outcomes and returned; a probe that cannot
 * reach the device throws io::TransferError.
 */
  class RetrievalVerifier {
  public:
    VerifyOutcome verify(io::RemoteFileAccess& files, const std::vector<protocols::RetrievalSpec>& specs) const;
  };

} // namespace amppoll::core
