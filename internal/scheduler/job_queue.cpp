#include "job_queue.hpp"

#include <algorithm>

namespace fwbuild::scheduler {

void JobQueue::Enqueue(const std::string& build_id) {
  {
    std::lock_guard lock(mutex_);
    queue_.push_back(build_id);
  }
  cv_.notify_one();
}

std::optional<std::string> JobQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  // queued builds stay PENDING in the store and are re-enqueued on restart
  if (shutdown_) return std::nullopt;

  std::string build_id = std::move(queue_.front());
  queue_.pop_front();
  return build_id;
}

bool JobQueue::Remove(const std::string& build_id) {
  std::lock_guard lock(mutex_);
  auto            it = std::find(queue_.begin(), queue_.end(), build_id);
  if (it == queue_.end()) return false;
  queue_.erase(it);
  return true;
}

std::size_t JobQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

void JobQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace fwbuild::scheduler
