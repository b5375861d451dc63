#include "CadenceScheduler/SchedulerMinHeap.h"

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace cadence::test {

namespace {

struct Node : HeapNode {
  Node(std::uint64_t nodeId, double index) {
    id = nodeId;
    sortIndex = index;
  }
};

// Pops the most recently created node first among equal sort indexes.
struct NewestFirstOrder {
  bool operator()(const Node* a, const Node* b) const {
    if (a->sortIndex != b->sortIndex) {
      return a->sortIndex < b->sortIndex;
    }
    return a->id > b->id;
  }
};

template<typename Heap>
bool isHeapOrdered(const Heap& heap) {
  const auto& nodes = heap.nodes();
  for (std::size_t index = 1; index < nodes.size(); ++index) {
    const std::size_t parentIndex = (index - 1) / 2;
    if (heap.precedes(nodes[index], nodes[parentIndex])) {
      return false;
    }
  }
  return true;
}

void testEmptyHeap() {
  SchedulerMinHeap<Node> heap;
  assert(heap.empty());
  assert(heap.peek() == nullptr);
  assert(heap.pop() == nullptr);

  heap.push(nullptr);
  assert(heap.empty());
}

void testTiesBreakById() {
  Node late(7, 10.0);
  Node early(3, 10.0);
  Node urgent(9, 1.0);

  SchedulerMinHeap<Node> heap;
  heap.push(&late);
  heap.push(&early);
  heap.push(&urgent);

  assert(heap.pop() == &urgent);
  assert(heap.pop() == &early);
  assert(heap.pop() == &late);
  assert(heap.empty());
}

void testCustomOrder() {
  Node first(1, 5.0);
  Node second(2, 5.0);
  Node sooner(3, 2.0);

  SchedulerMinHeap<Node, NewestFirstOrder> heap;
  heap.push(&first);
  heap.push(&second);
  heap.push(&sooner);
  assert(isHeapOrdered(heap));

  assert(heap.pop() == &sooner);
  assert(heap.pop() == &second);
  assert(heap.pop() == &first);
  assert(heap.pop() == nullptr);
}

void testRandomizedOrdering() {
  std::mt19937 generator(1234);
  std::uniform_int_distribution<int> sortIndexes(0, 40);

  std::vector<Node> nodes;
  nodes.reserve(300);
  for (std::uint64_t id = 1; id <= 300; ++id) {
    nodes.emplace_back(id, static_cast<double>(sortIndexes(generator)));
  }

  SchedulerMinHeap<Node> heap;
  for (Node& node : nodes) {
    heap.push(&node);
    assert(isHeapOrdered(heap));
  }
  assert(heap.size() == nodes.size());

  // Interleave a few pops with pushes, then drain.
  for (int round = 0; round < 50; ++round) {
    Node* top = heap.pop();
    assert(top != nullptr);
    assert(isHeapOrdered(heap));
    heap.push(top);
    assert(isHeapOrdered(heap));
  }

  const Node* previous = nullptr;
  while (!heap.empty()) {
    const Node* peeked = heap.peek();
    const Node* next = heap.pop();
    assert(peeked == next);
    if (previous != nullptr) {
      assert(heap.precedes(previous, next));
    }
    assert(isHeapOrdered(heap));
    previous = next;
  }
}

} // namespace

bool runSchedulerMinHeapTests() {
  testEmptyHeap();
  testTiesBreakById();
  testCustomOrder();
  testRandomizedOrdering();
  return true;
}

} // namespace cadence::test
