#include "job_worker.hpp"

#include "internal/observability/logging.hpp"
#include "job_runner.hpp"

namespace jobmeter::worker {

JobWorker::JobWorker(std::shared_ptr<JobScheduler> scheduler, std::shared_ptr<JobRunner> runner)
    : scheduler_(std::move(scheduler)), runner_(std::move(runner)) {
}

JobWorker::~JobWorker() {
  Stop();
}

void JobWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&JobWorker::Run, this);
}

void JobWorker::Stop() {
  scheduler_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void JobWorker::Run() {
  while (true) {
    auto task = scheduler_->Dequeue();
    if (!task) break;

    try {
      runner_->Run(*task);
    } catch (const std::exception& e) {
      JOBMETER_LOG_ERROR("job run failed", {observability::StringField("module", task->module), observability::StringField("job_id", task->job_id),
                                            observability::StringField("error", e.what())});
    }
  }
}

} // namespace jobmeter::worker
