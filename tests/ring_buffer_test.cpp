#include "RingBuffer.hpp"
#include "AsyncQueue.hpp"

#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace livegate;

static int fails = 0;

static void assert_true(bool cond, const char* msg) {
    if (!cond) {
        std::cerr << "[FAIL] " << msg << std::endl;
        ++fails;
    } else {
        std::cout << "[PASS] " << msg << std::endl;
    }
}

int main() {
    std::cout << "=== HistoryRing / AsyncQueue Test ===" << std::endl;

    // Test 1: Ring keeps entries in order below capacity
    {
        HistoryRing<int> ring(4);
        assert_true(ring.empty() && ring.latest() == nullptr, "new ring is empty");
        ring.push(1);
        ring.push(2);
        ring.push(3);
        auto all = ring.snapshot();
        assert_true(all == std::vector<int>({1, 2, 3}), "snapshot is oldest first");
        assert_true(ring.latest() && *ring.latest() == 3, "latest is the last push");
        assert_true(ring.get_total_dropped() == 0, "no drops below capacity");
    }

    // Test 2: Ring drops the oldest entries when full
    {
        size_t capacity = 4;
        HistoryRing<int> ring(capacity);
        size_t writes = capacity + 3; // 7 writes, expect 3 drops
        for (size_t i = 0; i < writes; ++i) {
            ring.push(static_cast<int>(i));
        }
        assert_true(ring.size() == capacity, "size capped at capacity");
        assert_true(ring.get_total_dropped() == writes - capacity, "drops equal writes beyond capacity");
        assert_true(ring.get_total_written() == writes, "all writes counted");
        assert_true(ring.snapshot() == std::vector<int>({3, 4, 5, 6}), "newest entries retained");
        assert_true(ring.snapshot(2) == std::vector<int>({5, 6}), "bounded snapshot takes the newest");
    }

    // Test 3: Clear empties the ring and its counters
    {
        HistoryRing<int> ring(8);
        for (int i = 0; i < 10; ++i) ring.push(i);
        ring.clear();
        assert_true(ring.empty(), "ring empty after clear");
        assert_true(ring.get_total_written() == 0, "counters reset after clear");
        assert_true(ring.capacity() == 8, "capacity kept after clear");
        ring.push(42);
        assert_true(ring.snapshot() == std::vector<int>({42}), "ring usable after clear");
    }

    // Test 4: Zero capacity is rejected
    {
        bool threw = false;
        try {
            HistoryRing<int> ring(0);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert_true(threw, "zero capacity throws");
    }

    // Test 5: Queue delivers in FIFO order across threads and drains after close
    {
        AsyncQueue<int> queue(4);
        std::thread producer([&queue] {
            for (int i = 0; i < 50; ++i) {
                queue.push(i);
            }
            queue.close();
        });

        std::vector<int> received;
        while (true) {
            auto item = queue.pop(100);
            if (item) {
                received.push_back(*item);
            } else if (queue.is_drained()) {
                break;
            }
        }
        producer.join();

        bool ordered = received.size() == 50;
        for (size_t i = 0; ordered && i < received.size(); ++i) {
            ordered = received[i] == static_cast<int>(i);
        }
        assert_true(ordered, "all items delivered in order");
    }

    // Test 6: Push after close is rejected
    {
        AsyncQueue<int> queue(2);
        queue.push(1);
        queue.close();
        assert_true(!queue.push(2), "push after close fails");
        assert_true(queue.rejected_count() == 1, "rejected push counted");
        auto item = queue.pop(0);
        assert_true(item && *item == 1, "queued item still drains after close");
        assert_true(!queue.pop(0) && queue.is_drained(), "queue drained");
    }

    if (fails == 0) {
        std::cout << "\nAll tests passed." << std::endl;
        return 0;
    } else {
        std::cerr << "\nTests failed: " << fails << std::endl;
        return 1;
    }
}
