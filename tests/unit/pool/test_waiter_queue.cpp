//===----------------------------------------------------------------------===//
//                         PgMux Server - Unit Tests
//
// tests/unit/pool/test_waiter_queue.cpp
//
// Unit tests for the intrusive waiter FIFO
//===----------------------------------------------------------------------===//

#include "pool/waiter_queue.hpp"
#include <cassert>
#include <iostream>
#include <vector>

using namespace pgmux;

struct Node {
    int value = 0;
    Node* queue_prev = nullptr;
    Node* queue_next = nullptr;
    bool queued = false;

    explicit Node(int v) : value(v) {}
};

std::vector<int> Drain(WaiterQueue<Node>& queue) {
    std::vector<int> values;
    while (Node* node = queue.PopFront()) {
        values.push_back(node->value);
    }
    return values;
}

void TestFifoOrder() {
    std::cout << "  Testing FIFO order..." << std::endl;

    Node a(1), b(2), c(3);
    WaiterQueue<Node> queue;
    assert(queue.Empty());
    assert(queue.PopFront() == nullptr);

    queue.PushBack(&a);
    queue.PushBack(&b);
    queue.PushBack(&c);
    assert(queue.Size() == 3);
    assert(queue.Front() == &a);
    assert(a.queued && b.queued && c.queued);

    std::vector<int> values = Drain(queue);
    assert((values == std::vector<int>{1, 2, 3}));
    assert(queue.Empty());
    assert(!a.queued && !b.queued && !c.queued);

    std::cout << "    PASSED" << std::endl;
}

void TestUnlinkAnywhere() {
    std::cout << "  Testing unlink from head, middle and tail..." << std::endl;

    Node a(1), b(2), c(3), d(4);
    WaiterQueue<Node> queue;
    queue.PushBack(&a);
    queue.PushBack(&b);
    queue.PushBack(&c);
    queue.PushBack(&d);

    assert(queue.Unlink(&b));
    assert(queue.Size() == 3);
    assert(queue.Unlink(&a));
    assert(queue.Front() == &c);
    assert(queue.Unlink(&d));
    assert(queue.Size() == 1);

    std::vector<int> values = Drain(queue);
    assert((values == std::vector<int>{3}));

    std::cout << "    PASSED" << std::endl;
}

void TestUnlinkTwice() {
    std::cout << "  Testing unlink of a node not in the queue..." << std::endl;

    Node a(1), b(2);
    WaiterQueue<Node> queue;
    queue.PushBack(&a);

    assert(!queue.Unlink(&b));
    assert(queue.Unlink(&a));
    assert(!queue.Unlink(&a));
    assert(queue.Size() == 0);
    assert(queue.Empty());

    std::cout << "    PASSED" << std::endl;
}

void TestRequeue() {
    std::cout << "  Testing requeue after unlink..." << std::endl;

    Node a(1), b(2);
    WaiterQueue<Node> queue;
    queue.PushBack(&a);
    queue.PushBack(&b);
    queue.Unlink(&a);
    queue.PushBack(&a);

    std::vector<int> values = Drain(queue);
    assert((values == std::vector<int>{2, 1}));

    std::cout << "    PASSED" << std::endl;
}

int main() {
    std::cout << "=== Waiter Queue Unit Tests ===" << std::endl;

    std::cout << "\n1. Ordering:" << std::endl;
    TestFifoOrder();
    TestRequeue();

    std::cout << "\n2. Removal:" << std::endl;
    TestUnlinkAnywhere();
    TestUnlinkTwice();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
