#pragma once
/** @file  ScriptIdentityResolver.hpp
 *  @brief IdentityResolver backed by an external lookup command.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>

// AmpPoll headers
#include "core/IdentityResolver.hpp"

namespace amppoll {
  namespace io {

    /**
 * @class ScriptIdentityResolver
 * @brief Runs `command` through the shell and parses what it prints.
 *
 *  * `{hwid}` in the command is replaced by the identifier; without it the
 *    identifier is appended as the last argument.
 *  * Output is a JSON object or array of objects carrying an address field
 *    (`address`, `ipv6`, `ip` or `cpeIpv6Addr`), or one bare address line.
 *  * Identifiers are restricted to hex digits and `:.-` before they ever
 *    reach the shell.
 */
    class ScriptIdentityResolver : public core::IdentityResolver {
    public:
      explicit ScriptIdentityResolver(std::string command);

      core::DeviceIdentity resolve(const std::string& hardwareId) override;

      /// Exposed for tests; throws core::IdentityError.
      static core::DeviceIdentity parseResolverOutput(const std::string& hardwareId, const std::string& output);

    private:
      std::string command_;
    };

  } // namespace io
} // namespace amppoll
