/* @file PromptStateMachine.cpp
 * @brief normalization, validation/prompt matching, step driver loop
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <sstream>

// AmpPoll headers
#include "core/PromptStateMachine.hpp"

using namespace amppoll::core;
using amppoll::protocols::CommandStep;
using amppoll::protocols::ExecutionResult;
using amppoll::protocols::ExecutionStatus;

namespace {

  constexpr std::size_t kMaxEscape = 4096; ///< longer unterminated sequences are dropped
  constexpr std::size_t kMaxLine = 64 * 1024;

  bool isBlank(char c) { return c == ' ' || c == '\t'; }

  std::string rtrimmed(const std::string& s) {
    std::size_t e = s.size();
    while (e > 0 && isBlank(s[e - 1]))
      --e;
    return s.substr(0, e);
  }

  // Position just past the escape sequence at raw[i] == ESC; npos while it is incomplete.
  std::size_t skipEscape(const std::string& raw, std::size_t i) {
    if (i + 1 >= raw.size())
      return std::string::npos;
    const char kind = raw[i + 1];
    if (kind == '[') { // CSI: params/intermediates then a final byte in 0x40..0x7E
      for (std::size_t j = i + 2; j < raw.size(); ++j) {
        const auto b = static_cast<unsigned char>(raw[j]);
        if (b >= 0x40 && b <= 0x7E)
          return j + 1;
      }
      return std::string::npos;
    }
    if (kind == ']') { // OSC: terminated by BEL or ESC '\'
      for (std::size_t j = i + 2; j < raw.size(); ++j) {
        if (raw[j] == '\a')
          return j + 1;
        if (raw[j] == '\x1b' && j + 1 < raw.size() && raw[j + 1] == '\\')
          return j + 2;
      }
      return std::string::npos;
    }
    return i + 2; // two-byte sequence, e.g. ESC '=' or ESC '('
  }

  // The command as a PTY echoes it back, one entry per non-empty line.
  std::vector<std::string> echoLines(const std::string& command) {
    std::vector<std::string> out;
    std::istringstream lines(normalizeShellOutput(command));
    std::string line;
    while (std::getline(lines, line))
      out.push_back(line);
    return out;
  }

  // True if text[from..) could still grow into a line ending with `echo`.
  bool mayBecomeEcho(const std::string& text, std::size_t from, const std::string& echo) {
    const std::size_t have = text.size() - from;
    for (std::size_t k = std::min(have, echo.size()); k > 0; --k)
      if (text.compare(text.size() - k, k, echo, 0, k) == 0)
        return true;
    return false;
  }

} // namespace

const char* amppoll::core::toString(EngineState s) {
  switch (s) {
  case EngineState::Idle:
    return "Idle";
  case EngineState::Sent:
    return "Sent";
  case EngineState::AwaitValidation:
    return "AwaitValidation";
  case EngineState::AwaitPrompt:
    return "AwaitPrompt";
  case EngineState::Complete:
    return "Complete";
  case EngineState::Timeout:
    return "Timeout";
  case EngineState::Error:
    return "Error";
  case EngineState::Cancelled:
    return "Cancelled";
  default:
    return "Unknown";
  }
}

std::string amppoll::core::normalizeShellOutput(const std::string& raw) {
  ShellTranscript transcript;
  transcript.append(raw);
  return transcript.text();
}

ShellTranscript::ShellTranscript(std::size_t limit)
    : limit_(limit),
      lineLimit_(limit == 0 ? std::string::npos : std::max<std::size_t>(1, std::min(limit / 2, kMaxLine))) {}

void ShellTranscript::append(const std::string& raw) {
  std::string joined;
  const std::string* src = &raw;
  if (!carry_.empty()) {
    joined = carry_ + raw;
    carry_.clear();
    src = &joined;
  }
  const std::string& in = *src;

  text_.resize(settled_); // the unfinished line is rendered again below
  for (std::size_t i = 0; i < in.size();) {
    const char c = in[i];
    if (c == '\x1b') {
      const std::size_t next = skipEscape(in, i);
      if (next == std::string::npos) {
        if (in.size() - i <= kMaxEscape)
          carry_ = in.substr(i);
        break;
      }
      i = next;
      continue;
    }
    ++i;
    if (c == '\r' || c == '\n') {
      endLine();
      continue;
    }
    const auto b = static_cast<unsigned char>(c);
    if ((c != '\t' && b < 0x20) || b == 0x7F)
      continue;
    if (line_.empty() && isBlank(c))
      continue;
    line_ += c;
    if (line_.size() >= lineLimit_)
      endLine();
  }
  dropFront();

  const std::string tail = rtrimmed(line_);
  if (!tail.empty()) {
    if (!text_.empty())
      text_ += '\n';
    text_ += tail;
  }
}

void ShellTranscript::endLine() {
  const std::string done = rtrimmed(line_);
  line_.clear();
  if (done.empty())
    return;
  if (!text_.empty())
    text_ += '\n';
  text_ += done;
  settled_ = text_.size();
}

void ShellTranscript::dropFront() {
  if (limit_ == 0 || settled_ <= limit_)
    return;
  const std::size_t nl = text_.find('\n', settled_ - limit_);
  const std::size_t cut = nl == std::string::npos ? settled_ : nl + 1;
  text_.erase(0, cut);
  settled_ -= cut;
  discarded_ += cut;
}

std::optional<std::size_t> amppoll::core::findValidation(const std::string& text,
                                                         const std::vector<std::string>& patterns, std::size_t from) {
  std::optional<std::size_t> best;
  if (from > text.size())
    return best;
  for (const auto& p : patterns) {
    if (p.empty())
      continue;
    const auto pos = text.find(p, from);
    if (pos != std::string::npos && (!best || pos < *best))
      best = pos;
  }
  return best;
}

bool amppoll::core::promptAtTail(const std::string& text, const std::string& marker, std::size_t notBefore) {
  if (marker.empty())
    return false;
  std::size_t end = text.size();
  while (end > 0 && (isBlank(text[end - 1]) || text[end - 1] == '\n'))
    --end;
  if (end < marker.size())
    return false;
  const std::size_t at = end - marker.size();
  return at >= notBefore && text.compare(at, marker.size(), marker) == 0;
}

PromptStateMachine::PromptStateMachine(EngineOptions options) : options_(options) {}

ExecutionResult PromptStateMachine::execute(Session& session, const CommandStep& step, std::stop_token stop) {
  return drive(session, step, true, std::move(stop));
}

ExecutionResult PromptStateMachine::awaitReady(Session& session, std::chrono::milliseconds timeout,
                                               std::stop_token stop) {
  CommandStep ready;
  ready.timeout = timeout;
  return drive(session, ready, false, std::move(stop));
}

ExecutionResult PromptStateMachine::drive(Session& session, const CommandStep& step, bool send,
                                          std::stop_token stop) {
  using namespace std::chrono;

  ExecutionResult result;
  result.command = step.command;
  transitionTo(EngineState::Idle);

  if (!session.isOpen() || !session.profile || !session.clock) {
    result.error = "[PromptStateMachine] session is not open";
    transitionTo(EngineState::Error);
    return result;
  }

  const Clock& clock = *session.clock;
  const DeviceProfile& profile = *session.profile;
  const std::string& marker = step.promptMarker.empty() ? profile.promptMarker : step.promptMarker;
  const milliseconds timeout = step.timeout.value_or(profile.defaultTimeout);
  const auto start = clock.now();
  const auto scanFrom = start + step.delayBeforePrompt.value_or(milliseconds{ 0 });

  ShellTranscript transcript(options_.outputLimit);
  auto finish = [&](ExecutionStatus status, EngineState terminal, std::optional<std::string> why) {
    result.status = status;
    result.output = transcript.text();
    result.elapsed = duration_cast<milliseconds>(clock.now() - start);
    result.error = std::move(why);
    transitionTo(terminal);
    return result;
  };

  if (stop.stop_requested())
    return finish(ExecutionStatus::Cancelled, EngineState::Cancelled, "cancelled");
  if (send && !session.shell->write(step.toWire(profile.lineTerminator)))
    return finish(ExecutionStatus::Error, EngineState::Error, "[PromptStateMachine] write failed");
  transitionTo(EngineState::Sent);

  auto lastByte = start;
  session.lastActivity = start;
  transitionTo(step.validation.empty() ? EngineState::AwaitPrompt : EngineState::AwaitValidation);

  // offsets below are absolute: they survive the transcript dropping its front
  const std::vector<std::string> echo = send ? echoLines(step.command) : std::vector<std::string>{};
  std::size_t echoed = 0;
  bool echoSettled = echo.empty();
  std::size_t replyFrom = 0;   ///< first offset that may hold device output
  std::size_t scanned = 0; ///< settled text already searched for validation
  std::optional<std::size_t> validatedAt;
  std::size_t longest = 1;
  for (const auto& p : step.validation)
    longest = std::max(longest, p.size());

  for (;;) {
    if (stop.stop_requested())
      return finish(ExecutionStatus::Cancelled, EngineState::Cancelled, "cancelled");

    auto chunk = session.shell->read(options_.pollInterval);
    const auto now = clock.now();
    if (!chunk)
      return finish(ExecutionStatus::Error, EngineState::Error, "[PromptStateMachine] channel closed by peer");

    if (!chunk->empty()) {
      transcript.append(*chunk);
      lastByte = now;
      session.lastActivity = now;
    }

    const std::string& text = transcript.text();
    const std::size_t base = transcript.discarded();
    const std::size_t settled = transcript.settledSize();
    auto rel = [&](std::size_t abs) { return std::min(abs > base ? abs - base : 0, text.size()); };

    while (!echoSettled) {
      const std::size_t from = rel(replyFrom);
      const std::size_t nl = text.find('\n', from);
      const std::size_t end = nl == std::string::npos ? text.size() : nl;
      const std::string& expected = echo[echoed];
      if (end <= from)
        break; // nothing past the echo yet
      if (end > settled) {
        // line still arriving: hold validation while it may turn out to be the echo
        echoSettled = !mayBecomeEcho(text, from, expected) || now - lastByte >= profile.quietPeriod;
        break;
      }
      if (end - from < expected.size() || text.compare(end - expected.size(), expected.size(), expected) != 0) {
        echoSettled = true;
        break;
      }
      replyFrom = base + end + 1;
      echoSettled = ++echoed == echo.size();
    }

    if (echoSettled && !validatedAt && !step.validation.empty()) {
      const std::size_t resume = scanned + 1 > longest ? scanned + 1 - longest : 0;
      if (auto at = findValidation(text, step.validation, rel(std::max(replyFrom, resume)))) {
        validatedAt = base + *at;
        transitionTo(EngineState::AwaitPrompt);
      } else {
        scanned = base + settled;
      }
    }

    if (state_ == EngineState::AwaitPrompt && now >= scanFrom && now - lastByte >= profile.quietPeriod) {
      const std::size_t notBefore = rel(std::max(replyFrom, validatedAt.value_or(0)));
      if (!step.waitForPrompt || promptAtTail(text, marker, notBefore))
        return finish(ExecutionStatus::Complete, EngineState::Complete, std::nullopt);
    }

    if (now - lastByte >= timeout) {
      const char* waitingFor = state_ == EngineState::AwaitValidation ? "validation text" : "prompt";
      return finish(ExecutionStatus::Timeout, EngineState::Timeout,
                    std::string("no ") + waitingFor + " within " + std::to_string(timeout.count()) + " ms");
    }
  }
}
