#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "job_task.hpp"

namespace jobmeter::worker {

/*
  Thread-safe blocking queue feeding job workers.
*/
class JobScheduler {
 public:
  void Enqueue(const JobTask& task);

  // blocking wait; nullopt once shut down and drained
  std::optional<JobTask> Dequeue();

  void Shutdown();

  // false once Shutdown has been called
  bool Accepting() const;

  std::size_t Pending() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<JobTask>     queue_;
  bool                    shutdown_ = false;
};

} // namespace jobmeter::worker
