#include <cassert>
#include <iostream>
#include <vector>

#include "internal/model/state_machine.hpp"

namespace {

using jobmeter::model::CanTransition;
using jobmeter::model::FromInt;
using jobmeter::model::IsTerminal;
using jobmeter::model::JobStatus;

const std::vector<JobStatus> kAll = {JobStatus::kPending, JobStatus::kProcessing, JobStatus::kCompleted, JobStatus::kFailed};

void TestForwardEdges() {
  assert(CanTransition(JobStatus::kPending, JobStatus::kProcessing));
  assert(CanTransition(JobStatus::kPending, JobStatus::kFailed));
  assert(CanTransition(JobStatus::kProcessing, JobStatus::kCompleted));
  assert(CanTransition(JobStatus::kProcessing, JobStatus::kFailed));

  assert(!CanTransition(JobStatus::kPending, JobStatus::kCompleted));
  assert(!CanTransition(JobStatus::kProcessing, JobStatus::kPending));
  assert(!CanTransition(JobStatus::kPending, JobStatus::kPending));
}

void TestTerminalStatesAreAbsorbing() {
  for (auto from : kAll) {
    if (!IsTerminal(from)) continue;
    for (auto to : kAll) {
      assert(!CanTransition(from, to));
    }
  }
}

void TestEveryPathEndsTerminal() {
  // Follow every legal edge from Pending; whatever has no way out must be
  // Completed or Failed.
  std::vector<JobStatus> frontier = {JobStatus::kPending};
  while (!frontier.empty()) {
    const auto state = frontier.back();
    frontier.pop_back();

    bool has_exit = false;
    for (auto next : kAll) {
      if (CanTransition(state, next)) {
        has_exit = true;
        frontier.push_back(next);
      }
    }
    if (!has_exit) assert(IsTerminal(state));
  }
}

void TestFromIntMatchesProtoValues() {
  assert(FromInt(1) == JobStatus::kPending);
  assert(FromInt(4) == JobStatus::kFailed);
  assert(!FromInt(0).has_value());
  assert(!FromInt(5).has_value());
}

} // namespace

int main() {
  TestForwardEdges();
  TestTerminalStatesAreAbsorbing();
  TestEveryPathEndsTerminal();
  TestFromIntMatchesProtoValues();

  std::cout << "jobmeter_unit_state_machine: pass\n";
  return 0;
}
