#pragma once
/** @file  FakeShellChannel.hpp
 *  @brief Scripted ShellChannel: replies are scheduled in simulated time
 *         relative to the write that triggers them.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "FakeClock.hpp"
#include "io/ShellChannel.hpp"

namespace amppoll {
  namespace test {

    struct Chunk {
      std::chrono::milliseconds at; ///< offset from the triggering write (or from creation for the banner)
      std::string data;
    };

    /**
 * @class FakeShellChannel
 * @brief read(maxWait) jumps the FakeClock to the next due chunk, or by
 *        maxWait when nothing is due, so a 20 s timeout costs no real time.
 */
    class FakeShellChannel : public amppoll::io::ShellChannel {
    public:
      explicit FakeShellChannel(std::shared_ptr<FakeClock> clock) : clock_(std::move(clock)) {}

      //---knobs--------------------------------------------------------------
      bool stall = false;       ///< read() burns 1 ms of real time and returns "" without moving the clock
      bool failWrites = false;
      bool eofWhenDrained = false; ///< read() reports a closed channel once nothing is pending
      bool echo = false;        ///< written text is echoed back immediately, like a PTY

      std::vector<std::string> written;
      int closeCalls = 0;

      /// Output that appears without any command, e.g. the login banner + prompt.
      void banner(std::vector<Chunk> chunks) { schedule(chunks); }

      /// Next write of \p command (terminator stripped) triggers \p reply.
      /// Several replies for one command are consumed in order.
      void onCommand(const std::string& command, std::vector<Chunk> reply) {
        replies_[command].push_back(std::move(reply));
      }

      /// Reply used for commands without a scripted one.
      void defaultReply(std::vector<Chunk> reply) { default_ = std::move(reply); }

      //---ShellChannel-------------------------------------------------------
      bool write(const std::string& data) override {
        if (closed_ || failWrites)
          return false;
        written.push_back(data);

        std::string cmd = data;
        while (!cmd.empty() && (cmd.back() == '\n' || cmd.back() == '\r'))
          cmd.pop_back();

        if (echo)
          schedule({ { std::chrono::milliseconds{ 0 }, data } });

        auto it = replies_.find(cmd);
        if (it != replies_.end() && !it->second.empty()) {
          schedule(it->second.front());
          it->second.pop_front();
        } else if (default_) {
          schedule(*default_);
        }
        return true;
      }

      std::optional<std::string> read(std::chrono::milliseconds maxWait) override {
        if (closed_)
          return std::nullopt;
        if (stall) {
          std::this_thread::sleep_for(std::chrono::milliseconds{ 1 });
          return std::string{};
        }

        const auto now = clock_->now();
        if (!pending_.empty() && pending_.begin()->first <= now + maxWait) {
          clock_->advanceTo(pending_.begin()->first);
          std::string out;
          const auto due = clock_->now();
          while (!pending_.empty() && pending_.begin()->first <= due) {
            out += pending_.begin()->second;
            pending_.erase(pending_.begin());
          }
          return out;
        }

        clock_->advance(maxWait);
        if (eofWhenDrained && pending_.empty())
          return std::nullopt;
        return std::string{};
      }

      void close() override {
        ++closeCalls;
        closed_ = true;
      }

      bool isClosed() const { return closed_; }

    private:
      void schedule(const std::vector<Chunk>& chunks) {
        const auto base = clock_->now();
        for (const auto& c : chunks)
          pending_.emplace(base + c.at, c.data);
      }

      std::shared_ptr<FakeClock> clock_;
      std::multimap<amppoll::core::Clock::time_point, std::string> pending_;
      std::map<std::string, std::deque<std::vector<Chunk>>> replies_;
      std::optional<std::vector<Chunk>> default_;
      bool closed_ = false;
    };

  } // namespace test
} // namespace amppoll
