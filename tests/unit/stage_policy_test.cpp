#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/worker/stage_policy.hpp"

namespace {

using jobmeter::db::model::JobItemRecord;
using jobmeter::model::JobStatus;
using jobmeter::worker::DelayMode;
using jobmeter::worker::EvaluateJob;
using jobmeter::worker::ModulePolicy;
using jobmeter::worker::ParseThreshold;
using jobmeter::worker::StagePolicy;
using jobmeter::worker::SuccessThreshold;

JobItemRecord Item(uint32_t round, uint32_t index, JobStatus status) {
  JobItemRecord item;
  item.job_id = "job";
  item.round  = round;
  item.index  = index;
  item.status = status;
  return item;
}

// reviewer shape: 8 slots needing 4, then two single-item rounds
ModulePolicy ThreeRoundPolicy() {
  ModulePolicy policy;
  StagePolicy  reviews;
  reviews.name      = "reviews";
  reviews.round     = 1;
  reviews.threshold = SuccessThreshold::RequireAtLeast(4);
  StagePolicy meta;
  meta.name  = "meta_review";
  meta.round = 2;
  StagePolicy check;
  check.name  = "fact_check";
  check.round = 3;
  policy.stages = {reviews, meta, check};
  return policy;
}

bool ParseThrows(const std::string& text) {
  try {
    (void)ParseThreshold(text);
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

void TestThresholdRequired() {
  assert(SuccessThreshold::RequireAll().Required(5) == 5);
  assert(SuccessThreshold::RequireAny().Required(5) == 1);
  assert(SuccessThreshold::RequireAtLeast(4).Required(8) == 4);
  assert(SuccessThreshold::RequireAtLeast(4).Required(2) == 2);
  assert(SuccessThreshold::RequireAtLeast(4).IsMet(2, 2));
  assert(!SuccessThreshold::RequireAtLeast(4).IsMet(1, 2));
  assert(SuccessThreshold::RequireFraction(0.8).Required(5) == 4);
  assert(SuccessThreshold::RequireFraction(0.5).Required(3) == 2);

  assert(SuccessThreshold::RequireAll().IsMet(5, 5));
  assert(!SuccessThreshold::RequireAll().IsMet(4, 5));
  assert(!SuccessThreshold::RequireAny().IsMet(0, 5));
  assert(SuccessThreshold::RequireNone().IsMet(0, 5));
  assert(SuccessThreshold::RequireNone().IsMet(0, 0));
}

void TestParseThreshold() {
  assert(ParseThreshold("all").kind == SuccessThreshold::Kind::kAll);
  assert(ParseThreshold("any").kind == SuccessThreshold::Kind::kAny);
  assert(ParseThreshold("none").kind == SuccessThreshold::Kind::kNone);
  assert(ParseThreshold("none").Describe() == "none");

  const auto at_least = ParseThreshold("at_least:4");
  assert(at_least.kind == SuccessThreshold::Kind::kAtLeast && at_least.count == 4);

  const auto fraction = ParseThreshold("fraction:0.75");
  assert(fraction.kind == SuccessThreshold::Kind::kFraction && fraction.fraction == 0.75);

  assert(ParseThrows("most"));
  assert(ParseThrows("at_least:0"));
  assert(ParseThrows("at_least:x"));
  assert(ParseThrows("fraction:1.5"));
  assert(ParseThrows("fraction:0"));
}

void TestDelayModes() {
  StagePolicy stage;
  stage.retry_delay = jobmeter::util::Duration(1500);

  stage.delay_mode = DelayMode::kFixed;
  assert(stage.DelayFor(1) == jobmeter::util::Duration(1500));
  assert(stage.DelayFor(3) == jobmeter::util::Duration(1500));

  stage.delay_mode = DelayMode::kLinear;
  assert(stage.DelayFor(1) == jobmeter::util::Duration(1500));
  assert(stage.DelayFor(2) == jobmeter::util::Duration(3000));
  assert(stage.DelayFor(3) == jobmeter::util::Duration(4500));
}

void TestOverridesMatchByStageName() {
  auto policy = ThreeRoundPolicy();

  jobmeter::runtime::config::ModuleConfig config;
  config.set_key("reviewer");
  auto* stage = config.add_stages();
  stage->set_name("reviews");
  stage->set_attempt_cap(5);
  stage->set_concurrency_cap(2);
  stage->set_retry_delay("250ms");
  stage->set_delay_mode("linear");
  stage->set_success_threshold("fraction:0.5");

  jobmeter::worker::ApplyOverrides(policy, config);
  assert(policy.stages[0].attempt_cap == 5);
  assert(policy.stages[0].concurrency_cap == 2);
  assert(policy.stages[0].retry_delay == jobmeter::util::Duration(250));
  assert(policy.stages[0].delay_mode == DelayMode::kLinear);
  assert(policy.stages[0].threshold.kind == SuccessThreshold::Kind::kFraction);
  assert(policy.stages[1].attempt_cap == 3);

  jobmeter::runtime::config::ModuleConfig unknown;
  unknown.set_key("reviewer");
  unknown.add_stages()->set_name("chunks");
  bool threw = false;
  try {
    jobmeter::worker::ApplyOverrides(policy, unknown);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestEvaluateIsDeterministic() {
  const auto             policy = ThreeRoundPolicy();
  std::vector<JobItemRecord> items;
  for (uint32_t i = 0; i < 8; ++i) {
    items.push_back(Item(1, i, i < 5 ? JobStatus::kCompleted : JobStatus::kFailed));
  }
  items.push_back(Item(2, 0, JobStatus::kCompleted));
  items.push_back(Item(3, 0, JobStatus::kCompleted));

  const auto first  = EvaluateJob(policy, items);
  const auto second = EvaluateJob(policy, items);
  assert(first.status == JobStatus::kCompleted);
  assert(first.status == second.status);
  assert(first.detail == second.detail);
  assert(first.detail == "7/10 items completed, 3 failed");
}

void TestMissedStageFailsJob() {
  const auto             policy = ThreeRoundPolicy();
  std::vector<JobItemRecord> items;
  for (uint32_t i = 0; i < 8; ++i) {
    items.push_back(Item(1, i, i < 3 ? JobStatus::kCompleted : JobStatus::kFailed));
  }
  items.push_back(Item(2, 0, JobStatus::kFailed));
  items.push_back(Item(3, 0, JobStatus::kFailed));

  const auto verdict = EvaluateJob(policy, items);
  assert(verdict.status == JobStatus::kFailed);
  assert(verdict.error_message.find("reviews: 3/8") == 0);
}

void TestNonTerminalItemsCountAsFailed() {
  ModulePolicy policy;
  StagePolicy  stage;
  stage.name    = "documents";
  policy.stages = {stage};

  const auto verdict = EvaluateJob(policy, {Item(1, 0, JobStatus::kCompleted), Item(1, 1, JobStatus::kProcessing)});
  assert(verdict.status == JobStatus::kFailed);
}

void TestBestEffortStageNeverFailsJob() {
  ModulePolicy policy;
  StagePolicy  documents;
  documents.name = "documents";
  StagePolicy translations;
  translations.name      = "translations";
  translations.round     = 2;
  translations.threshold = SuccessThreshold::RequireNone();
  policy.stages          = {documents, translations};

  const auto verdict = EvaluateJob(policy, {Item(1, 0, JobStatus::kCompleted), Item(2, 0, JobStatus::kFailed)});
  assert(verdict.status == JobStatus::kCompleted);
  assert(verdict.detail == "1/2 items completed, 1 failed");

  // no round-2 items at all
  assert(EvaluateJob(policy, {Item(1, 0, JobStatus::kCompleted)}).status == JobStatus::kCompleted);
}

} // namespace

int main() {
  TestThresholdRequired();
  TestParseThreshold();
  TestDelayModes();
  TestOverridesMatchByStageName();
  TestEvaluateIsDeterministic();
  TestMissedStageFailsJob();
  TestNonTerminalItemsCountAsFailed();
  TestBestEffortStageNeverFailsJob();

  std::cout << "jobmeter_unit_stage_policy: pass\n";
  return 0;
}
