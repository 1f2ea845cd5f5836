#pragma once

#include <string>

namespace jobmeter::worker {

/*
  An admitted job waiting for a worker.
*/
struct JobTask {
  std::string module;
  std::string job_id;
};

} // namespace jobmeter::worker
