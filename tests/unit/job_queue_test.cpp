#include "internal/scheduler/job_queue.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

namespace {

using fwbuild::scheduler::JobQueue;

void TestFifoOrder() {
  JobQueue queue;
  queue.Enqueue("a");
  queue.Enqueue("b");
  queue.Enqueue("c");
  assert(queue.Size() == 3);

  assert(*queue.Dequeue() == "a");
  assert(*queue.Dequeue() == "b");
  assert(*queue.Dequeue() == "c");
  assert(queue.Size() == 0);
}

void TestRemoveInPlace() {
  JobQueue queue;
  queue.Enqueue("a");
  queue.Enqueue("b");
  queue.Enqueue("c");

  assert(queue.Remove("b"));
  assert(!queue.Remove("b"));
  assert(!queue.Remove("never"));

  assert(*queue.Dequeue() == "a");
  assert(*queue.Dequeue() == "c");
}

void TestShutdownWakesBlockedConsumers() {
  JobQueue         queue;
  std::atomic<int> woken{0};

  std::vector<std::thread> consumers;
  for (int i = 0; i < 3; ++i) {
    consumers.emplace_back([&] {
      if (!queue.Dequeue().has_value()) woken++;
    });
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  queue.Shutdown();
  for (auto& t : consumers) t.join();

  assert(woken == 3);
}

void TestShutdownLeavesQueuedItems() {
  JobQueue queue;
  queue.Enqueue("a");
  queue.Shutdown();

  assert(!queue.Dequeue().has_value());
  assert(queue.Size() == 1);
}

void TestConcurrentConsumersSeeEachItemOnce() {
  JobQueue         queue;
  std::atomic<int> consumed{0};

  std::vector<std::thread> consumers;
  for (int i = 0; i < 4; ++i) {
    consumers.emplace_back([&] {
      while (auto id = queue.Dequeue()) consumed++;
    });
  }

  for (int i = 0; i < 200; ++i) queue.Enqueue("build-" + std::to_string(i));
  while (queue.Size() > 0) std::this_thread::sleep_for(std::chrono::milliseconds(5));

  queue.Shutdown();
  for (auto& t : consumers) t.join();

  assert(consumed == 200);
}

} // namespace

int main() {
  TestFifoOrder();
  TestRemoveInPlace();
  TestShutdownWakesBlockedConsumers();
  TestShutdownLeavesQueuedItems();
  TestConcurrentConsumersSeeEachItemOnce();

  std::cout << "fwbuild_unit_job_queue: pass\n";
  return 0;
}
