#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "job_scheduler.hpp"

namespace jobmeter::worker {

class JobRunner;

/*
  Background worker that drives admitted jobs to a terminal state.

  Executes:
      Pending job -> JobRunner::Run
*/
class JobWorker {
 public:
  JobWorker(std::shared_ptr<JobScheduler> scheduler, std::shared_ptr<JobRunner> runner);
  ~JobWorker();

  void Start();

  // Shuts the scheduler down; queued jobs are drained first.
  void Stop();

 private:
  void Run();

  std::shared_ptr<JobScheduler> scheduler_;
  std::shared_ptr<JobRunner>    runner_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace jobmeter::worker
