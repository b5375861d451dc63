#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace cadence {

struct HeapNode {
  std::uint64_t id{0};
  double sortIndex{0.0};
};

// Earlier sortIndex first; equal sort indexes fall back to id, which gives
// FIFO order for nodes created in sequence.
struct HeapNodeOrder {
  template<typename T>
  bool operator()(const T* a, const T* b) const {
    if (a->sortIndex != b->sortIndex) {
      return a->sortIndex < b->sortIndex;
    }
    return a->id < b->id;
  }
};

/**
 * Array-backed binary heap of borrowed node pointers. The heap never owns
 * its nodes; the scheduler keeps them alive until they leave every queue.
 * Only the top node can be taken out, so cancellation is lazy.
 */
template<typename T, typename Order = HeapNodeOrder>
class SchedulerMinHeap {
public:
  SchedulerMinHeap() = default;

  SchedulerMinHeap(const SchedulerMinHeap&) = delete;
  SchedulerMinHeap& operator=(const SchedulerMinHeap&) = delete;
  SchedulerMinHeap(SchedulerMinHeap&&) = default;
  SchedulerMinHeap& operator=(SchedulerMinHeap&&) = default;

  void push(T* node) {
    if (!node) {
      return;
    }
    nodes_.push_back(node);
    siftUp(nodes_.size() - 1);
  }

  T* peek() const {
    return nodes_.empty() ? nullptr : nodes_.front();
  }

  T* pop() {
    if (nodes_.empty()) {
      return nullptr;
    }
    T* top = nodes_.front();
    nodes_.front() = nodes_.back();
    nodes_.pop_back();
    if (!nodes_.empty()) {
      siftDown(0);
    }
    return top;
  }

  bool empty() const {
    return nodes_.empty();
  }

  std::size_t size() const {
    return nodes_.size();
  }

  void clear() {
    nodes_.clear();
  }

  // True when `a` would be popped before `b`.
  bool precedes(const T* a, const T* b) const {
    return order_(a, b);
  }

  // Heap-ordered storage, exposed for invariant checks.
  const std::vector<T*>& nodes() const {
    return nodes_;
  }

private:
  void siftUp(std::size_t index) {
    while (index > 0) {
      const std::size_t parent = (index - 1) / 2;
      if (!order_(nodes_[index], nodes_[parent])) {
        break;
      }
      std::swap(nodes_[index], nodes_[parent]);
      index = parent;
    }
  }

  void siftDown(std::size_t index) {
    const std::size_t count = nodes_.size();
    for (;;) {
      std::size_t smallest = index;
      const std::size_t left = index * 2 + 1;
      const std::size_t right = left + 1;
      if (left < count && order_(nodes_[left], nodes_[smallest])) {
        smallest = left;
      }
      if (right < count && order_(nodes_[right], nodes_[smallest])) {
        smallest = right;
      }
      if (smallest == index) {
        return;
      }
      std::swap(nodes_[index], nodes_[smallest]);
      index = smallest;
    }
  }

  std::vector<T*> nodes_;
  Order order_{};
};

} // namespace cadence
