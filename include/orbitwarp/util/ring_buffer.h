#pragma once

#include <cstddef>
#include <deque>
#include <utility>

namespace orbitwarp::util {

// Bounded FIFO: pushing into a full buffer drops the oldest element.
template <typename T>
class RingBuffer {
 public:
  explicit RingBuffer(std::size_t capacity = 0) : capacity_(capacity) {}

  std::size_t capacity() const { return capacity_; }
  std::size_t size() const { return items_.size(); }
  bool empty() const { return items_.empty(); }

  void set_capacity(std::size_t capacity) {
    capacity_ = capacity;
    keep_recent(capacity_);
  }

  void push_back(T v) {
    if (capacity_ == 0) return;
    if (items_.size() == capacity_) items_.pop_front();
    items_.push_back(std::move(v));
  }

  // Drops the oldest elements until at most n remain. Returns how many were dropped.
  std::size_t keep_recent(std::size_t n) {
    const std::size_t drop = items_.size() > n ? items_.size() - n : 0;
    items_.erase(items_.begin(), items_.begin() + static_cast<std::ptrdiff_t>(drop));
    return drop;
  }

  void clear() { items_.clear(); }

  const T& operator[](std::size_t i) const { return items_[i]; }
  const T& back() const { return items_.back(); }

  typename std::deque<T>::const_iterator begin() const { return items_.begin(); }
  typename std::deque<T>::const_iterator end() const { return items_.end(); }

 private:
  std::size_t capacity_{0};
  std::deque<T> items_;
};

} // namespace orbitwarp::util
