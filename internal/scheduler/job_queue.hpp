#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace fwbuild::scheduler {

/*
  Thread-safe blocking FIFO of admitted build ids.

  Workers pull from the head in admission order. A PENDING build cancelled
  before it is pulled is removed in place.
*/
class JobQueue {
 public:
  void Enqueue(const std::string& build_id);

  // blocking wait; nullopt once shut down
  std::optional<std::string> Dequeue();

  // false if the id was not queued (already dequeued or never admitted)
  bool Remove(const std::string& build_id);

  std::size_t Size() const;

  void Shutdown();

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<std::string> queue_;
  bool                    shutdown_ = false;
};

} // namespace fwbuild::scheduler
