#pragma once

#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace boiler_twin::core {

// Fixed-capacity FIFO; once full, each push overwrites the oldest entry.
template <typename T, std::size_t Capacity>
class RingBuffer {
  static_assert(Capacity > 0, "RingBuffer capacity must be non-zero");

 public:
  RingBuffer() { items_.reserve(Capacity); }

  void push(T item) {
    if (items_.size() < Capacity) {
      items_.push_back(std::move(item));
      return;
    }
    items_[next_] = std::move(item);
    next_ = (next_ + 1) % Capacity;
  }

  void clear() noexcept {
    items_.clear();
    next_ = 0;
  }

  [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }
  [[nodiscard]] bool empty() const noexcept { return items_.empty(); }
  [[nodiscard]] static constexpr std::size_t capacity() noexcept { return Capacity; }

  // Index 0 is the oldest retained entry.
  [[nodiscard]] const T& at(const std::size_t index) const {
    if (index >= items_.size()) {
      throw std::out_of_range("ring buffer index out of range");
    }
    return items_[(next_ + index) % items_.size()];
  }

  [[nodiscard]] std::vector<T> to_vector() const {
    std::vector<T> out;
    out.reserve(items_.size());
    for (std::size_t i = 0; i < items_.size(); ++i) {
      out.push_back(at(i));
    }
    return out;
  }

 private:
  std::vector<T> items_{};
  std::size_t next_{0};
};

}  // namespace boiler_twin::core
