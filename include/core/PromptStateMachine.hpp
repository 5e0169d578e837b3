#pragma once
/** @file  PromptStateMachine.hpp
 *  @brief Sends one command and decides, from the incoming byte stream,
 *         when the device has finished answering it.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

// AmpPoll headers
#include "core/SessionTransport.hpp"
#include "protocols/CommandStep.hpp"
#include "protocols/ExecutionResult.hpp"

namespace amppoll::core {

  enum class EngineState { Idle, Sent, AwaitValidation, AwaitPrompt, Complete, Timeout, Error, Cancelled };

  const char* toString(EngineState s);

  struct EngineOptions {
    std::chrono::milliseconds pollInterval{ 100 }; ///< max wait per ShellChannel::read
    std::size_t outputLimit{ 4u << 20 };            ///< normalized characters kept per step, 0 = unbounded
  };

  /**
   * @brief Strips ANSI/VT100 sequences and control characters (tab and
   *        newline survive), folds CR/CRLF to LF, trims every line and drops
   *        the empty ones.
   */
  std::string normalizeShellOutput(const std::string& raw);

  /**
 * @class ShellTranscript
 * @brief normalizeShellOutput() fed one chunk at a time.
 *
 *  * An escape sequence split across chunks is held back until complete.
 *  * With a non-zero limit, lines longer than min(limit / 2, 64 KiB) are
 *    broken, and whole lines are dropped from the front once the text
 *    outgrows the limit. `discarded()` counts the characters dropped.
 */
  class ShellTranscript {
  public:
    explicit ShellTranscript(std::size_t limit = 0);

    void append(const std::string& raw);

    /// Normalized text so far; the last line may still grow.
    const std::string& text() const { return text_; }
    /// Length of the prefix of text() that no later chunk can change.
    std::size_t settledSize() const { return settled_; }
    std::size_t discarded() const { return discarded_; }

  private:
    void endLine();
    void dropFront();

    std::size_t limit_;
    std::size_t lineLimit_;
    std::string carry_; ///< incomplete escape sequence
    std::string line_;  ///< current line, leading blanks already dropped
    std::string text_;
    std::size_t settled_{ 0 };
    std::size_t discarded_{ 0 };
  };

  /// Earliest start offset, at or after \p from, of any of \p patterns in \p text.
  std::optional<std::size_t> findValidation(const std::string& text, const std::vector<std::string>& patterns,
                                            std::size_t from = 0);

  /// True when \p text (right-trimmed) ends with \p marker starting at or after \p notBefore.
  bool promptAtTail(const std::string& text, const std::string& marker, std::size_t notBefore);

  /**
 * @class PromptStateMachine
 * @brief Idle -> Sent -> AwaitValidation -> AwaitPrompt -> Complete, with
 *        Timeout / Error / Cancelled as the other terminal states.
 *
 *  * A prompt only counts at the tail of the buffer, after the validation
 *    match, and once the line has been quiet for the profile's quiet period.
 *  * Leading lines that echo the command back are skipped before validation
 *    text is searched for.
 *  * `delayBeforePrompt` postpones prompt scanning, not reading.
 *  * The timeout is an inactivity timeout measured from the last byte.
 *  * Never retries; that is the orchestrator's call.
 *  * One instance per worker; not thread-safe.
 */
  class PromptStateMachine {
  public:
    explicit PromptStateMachine(EngineOptions options = {});

    //---public APIs------------------------------------------------------
    protocols::ExecutionResult execute(Session& session, const protocols::CommandStep& step,
                                       std::stop_token stop = {});

    /// Waits for the login banner to settle on a prompt. Sends nothing.
    protocols::ExecutionResult awaitReady(Session& session, std::chrono::milliseconds timeout,
                                          std::stop_token stop = {});

    EngineState state() const { return state_; }

  private:
    protocols::ExecutionResult drive(Session& session, const protocols::CommandStep& step, bool send,
                                     std::stop_token stop);
    void transitionTo(EngineState next) { state_ = next; }

    EngineOptions options_;
    EngineState state_{ EngineState::Idle };
  };

} // namespace amppoll::core
