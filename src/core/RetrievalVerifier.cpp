/* @file RetrievalVerifier.cpp
 * @brief size probe per RetrievalSpec
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// AmpPoll headers
#include "core/RetrievalVerifier.hpp"

using namespace amppoll::core;

const char* amppoll::core::toString(VerifyStatus s) {
  switch (s) {
  case VerifyStatus::Ok:
    return "Ok";
  case VerifyStatus::MissingArtifact:
    return "MissingArtifact";
  case VerifyStatus::EmptyArtifact:
    return "EmptyArtifact";
  default:
    return "Unknown";
  }
}

VerifyOutcome RetrievalVerifier::verify(io::RemoteFileAccess& files,
                                        const std::vector<protocols::RetrievalSpec>& specs) const {
  for (const auto& spec : specs) {
    const auto size = files.remoteSize(spec.remotePath);
    if (!size)
      return VerifyOutcome{ VerifyStatus::MissingArtifact, spec.remotePath, 0 };

    const std::uintmax_t minimum = spec.minSize > 0 ? spec.minSize : 1;
    if (*size < minimum)
      return VerifyOutcome{ VerifyStatus::EmptyArtifact, spec.remotePath, *size };
  }
  return VerifyOutcome{};
}
