#include "job_scheduler.hpp"

#include "internal/util/errors.hpp"

namespace jobmeter::worker {

void JobScheduler::Enqueue(const JobTask& task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) throw util::InvalidState("job scheduler is shut down");
    queue_.push(task);
  }
  cv_.notify_one();
}

std::optional<JobTask> JobScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  JobTask task = queue_.front();
  queue_.pop();
  return task;
}

void JobScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

bool JobScheduler::Accepting() const {
  std::lock_guard lock(mutex_);
  return !shutdown_;
}

std::size_t JobScheduler::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace jobmeter::worker
