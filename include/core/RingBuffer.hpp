#pragma once
/** @file  RingBuffer.hpp
 *  @brief Fixed-capacity FIFO that overwrites its oldest entry when full.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace amppoll::core {

  /// Not synchronised; the owner guards it.
  template <typename T> class RingBuffer {
  public:
    explicit RingBuffer(std::size_t capacity) : slots_(capacity) {
      if (capacity == 0)
        throw std::invalid_argument("[RingBuffer] capacity must be > 0");
    }

    /// @returns true if the oldest element was overwritten.
    bool push(T value) {
      const bool full = size_ == slots_.size();
      slots_[(head_ + size_) % slots_.size()] = std::move(value);
      if (full)
        head_ = (head_ + 1) % slots_.size();
      else
        ++size_;
      return full;
    }

    std::optional<T> pop() {
      if (size_ == 0)
        return std::nullopt;
      T out = std::move(slots_[head_]);
      head_ = (head_ + 1) % slots_.size();
      --size_;
      return out;
    }

    bool empty() const { return size_ == 0; }
    std::size_t size() const { return size_; }
    std::size_t capacity() const { return slots_.size(); }

  private:
    std::vector<T> slots_;
    std::size_t head_{ 0 };
    std::size_t size_{ 0 };
  };

} // namespace amppoll::core
