// D5.3 — bounded work queue

#include "sa/server/WorkQueue.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <thread>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  // ---- Test 1: FIFO order and capacity ----
  {
    sa::WorkQueue<int> q(2);
    requireTrue(q.push(1) && q.push(2), "fills to capacity");
    requireTrue(!q.push(3), "refuses when full");
    requireTrue(q.size() == 2, "size 2");

    int v = 0;
    requireTrue(q.pop(v) && v == 1, "first in, first out");
    requireTrue(q.push(3), "room again after pop");
    requireTrue(q.tryPop(v) && v == 2, "tryPop 2");
    requireTrue(q.tryPop(v) && v == 3, "tryPop 3");
    requireTrue(!q.tryPop(v), "tryPop on empty");
    std::printf("  Test 1 (capacity): PASS\n");
  }

  // ---- Test 2: a refused item stays with the caller ----
  {
    sa::WorkQueue<std::unique_ptr<int>> q(1);
    auto first = std::make_unique<int>(7);
    auto second = std::make_unique<int>(8);
    requireTrue(q.push(std::move(first)), "first accepted");
    requireTrue(!first, "accepted item moved in");
    requireTrue(!q.push(std::move(second)), "second refused");
    requireTrue(second && *second == 8, "refused item untouched");
    std::printf("  Test 2 (refused ownership): PASS\n");
  }

  // ---- Test 3: close drains, then pop reports closed ----
  {
    sa::WorkQueue<int> q(4);
    requireTrue(q.push(10) && q.push(11), "queued");
    q.close();
    requireTrue(!q.push(12), "push refused after close");

    int v = 0;
    requireTrue(q.pop(v) && v == 10, "drains 10");
    requireTrue(q.pop(v) && v == 11, "drains 11");
    requireTrue(!q.pop(v), "pop false once closed and empty");

    q.reopen();
    requireTrue(q.push(13), "push after reopen");
    requireTrue(q.pop(v) && v == 13, "pop after reopen");
    std::printf("  Test 3 (close/reopen): PASS\n");
  }

  // ---- Test 4: close wakes a blocked consumer ----
  {
    sa::WorkQueue<int> q(4);
    std::atomic<int> result{-1};
    std::thread consumer([&]() {
      int v = 0;
      result.store(q.pop(v) ? 1 : 0);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    requireTrue(result.load() == -1, "consumer blocked");
    q.close();
    consumer.join();
    requireTrue(result.load() == 0, "woken with false");
    std::printf("  Test 4 (wake on close): PASS\n");
  }

  std::printf("D5.3 work queue: ALL PASS\n");
  return 0;
}
