#include <atomic>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/modules/glossary.hpp"
#include "internal/modules/grader/grader_module.hpp"
#include "internal/modules/module_settings.hpp"
#include "internal/modules/registry.hpp"
#include "internal/storage/disk/disk_artifact_store.hpp"
#include "internal/store/job_store.hpp"
#include "internal/usage/usage_ledger.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/uuid.hpp"
#include "internal/worker/job_runner.hpp"

namespace {

using jobmeter::model::JobStatus;
using jobmeter::modules::BuildGraderReport;
using jobmeter::modules::InterquartileMean;
using jobmeter::modules::ParseGraderReply;
using jobmeter::modules::WeightedMean;

const std::string kValidReply =
    R"({"Level 1": 10, "Level 2": 20, "Level 3": 30, "Level 4": 40, "Level 5": 50, "Level 6": 60, "justification": "solid methods"})";
const std::string kDecreasingReply = R"({"Level 1": 90, "Level 2": 20, "Level 3": 30, "Level 4": 40, "Level 5": 50, "Level 6": 60})";

bool Close(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

bool ParseFails(const std::string& text) {
  try {
    (void)ParseGraderReply(text);
  } catch (const jobmeter::util::ParseError&) {
    return true;
  }
  return false;
}

// Replies valid JSON on the calls selected by `valid_every`, prose otherwise.
class ScriptedGrader final : public jobmeter::llm::Provider {
 public:
  explicit ScriptedGrader(int valid_every) : valid_every_(valid_every) {
  }

  jobmeter::llm::Response Execute(const jobmeter::llm::Request&) override {
    const int call = ++calls_;
    jobmeter::llm::Response response;
    response.token_usage.total = 10;
    response.text              = call % valid_every_ == 0 ? kValidReply : "I would rather not grade this.";
    return response;
  }

  int Calls() const {
    return calls_;
  }

 private:
  int              valid_every_;
  std::atomic<int> calls_{0};
};

struct SamplingRun {
  jobmeter::db::model::JobRecord     job;
  std::shared_ptr<ScriptedGrader>    provider;
  std::shared_ptr<jobmeter::storage::DiskArtifactStore> artifacts;
};

SamplingRun RunGraderJob(const std::string& name, int valid_every) {
  jobmeter::runtime::config::RuntimeConfig config;
  auto*                                    grader = config.add_modules();
  grader->set_key("grader");
  grader->set_model("grading-model");

  auto repository = std::make_shared<jobmeter::db::memory::MemoryRepository>();
  auto registry   = jobmeter::modules::BuiltinModules(config);
  auto store      = std::make_shared<jobmeter::store::JobStore>(repository);
  auto ledger     = std::make_shared<jobmeter::usage::UsageLedger>(repository);
  auto settings   = std::make_shared<jobmeter::modules::ModuleSettingsStore>(repository, registry);
  auto glossary   = std::make_shared<jobmeter::modules::GlossaryStore>(repository);

  SamplingRun run;
  run.provider  = std::make_shared<ScriptedGrader>(valid_every);
  run.artifacts = std::make_shared<jobmeter::storage::DiskArtifactStore>(std::filesystem::temp_directory_path() / "jobmeter_grader_tests" / name);

  const auto module = registry->Require("grader");

  jobmeter::v1::GraderJob payload;
  payload.mutable_manuscript()->set_text("A study of things.");

  jobmeter::db::model::JobRecord job;
  job.id            = jobmeter::util::NewJobId();
  job.module        = "grader";
  job.user_id       = "alice";
  job.payload_json  = module->Validate(jobmeter::util::ToJson(payload));
  job.created_at_ms = jobmeter::util::ToUnixMillis(jobmeter::util::Now());
  job.updated_at_ms = job.created_at_ms;
  {
    auto tx = repository->Begin();
    store->Create(*tx, job, module->Plan(job));
    tx->Commit();
  }

  jobmeter::worker::JobRunnerOptions options;
  options.sleeper = [](jobmeter::util::Duration) {};
  jobmeter::worker::JobRunner runner(repository, registry, store, ledger, settings, glossary, run.artifacts, run.provider, options);

  auto finished = runner.Run(jobmeter::worker::JobTask{"grader", job.id});
  assert(finished.has_value());
  run.job = *finished;
  return run;
}

void TestParseValidReply() {
  const auto sample = ParseGraderReply(kValidReply);
  assert(sample.levels_size() == 6);
  assert(Close(sample.levels(0), 10.0));
  assert(Close(sample.levels(5), 60.0));
  assert(sample.justification() == "solid methods");
}

void TestParseRejectsBadReplies() {
  assert(ParseFails("not json"));
  assert(ParseFails(R"({"Level 1": 10})"));
  assert(ParseFails(R"({"Level 1": "ten", "Level 2": 20, "Level 3": 30, "Level 4": 40, "Level 5": 50, "Level 6": 60})"));
  assert(ParseFails(kDecreasingReply));
}

void TestParseClampsScores() {
  const auto sample = ParseGraderReply(R"({"Level 1": -5, "Level 2": 0, "Level 3": 30, "Level 4": 40, "Level 5": 150, "Level 6": 200})");
  assert(Close(sample.levels(0), 0.0));
  assert(Close(sample.levels(4), 100.0));
  assert(Close(sample.levels(5), 100.0));
}

void TestWeightedMean() {
  const auto sample = ParseGraderReply(kValidReply);
  // (10*4 + 20*2 + 30 + 40 + 50 + 60) / 10
  assert(Close(WeightedMean(sample), 26.0));
}

void TestInterquartileMean() {
  const auto eight = InterquartileMean({8, 1, 7, 2, 6, 3, 5, 4});
  assert(eight.kept.size() == 4);
  assert(Close(eight.mean, 4.5));

  const auto two = InterquartileMean({10, 20});
  assert(two.kept.size() == 2);
  assert(Close(two.mean, 15.0));

  const auto none = InterquartileMean({});
  assert(none.kept.empty());
  assert(Close(none.mean, 0.0));
}

void TestReportAggregates() {
  std::vector<jobmeter::v1::GraderSample> samples(12, ParseGraderReply(kValidReply));
  const auto                              report = BuildGraderReport(samples);
  assert(report.valid_runs() == 12);
  assert(report.kept_runs() == 6);
  assert(Close(report.iqm_score(), 26.0));
  assert(report.per_level_size() == 6);
  assert(Close(report.per_level(2), 30.0));
  assert(report.justification() == "solid methods");
}

void TestSamplingStopsAtTarget() {
  const auto run = RunGraderJob("every_reply_valid", 1);
  assert(run.job.status == JobStatus::kCompleted);
  assert(run.provider->Calls() == 12);
  assert(run.job.usage_delta == 1);

  jobmeter::v1::GraderReport report;
  jobmeter::util::FromJson(run.artifacts->Read(run.job.output_path), &report);
  assert(report.valid_runs() == 12);
}

void TestSamplingToleratesInvalidReplies() {
  // every second reply is valid: the 12th valid reply arrives on call 24
  const auto run = RunGraderJob("half_valid", 2);
  assert(run.job.status == JobStatus::kCompleted);
  assert(run.provider->Calls() == 24);
}

void TestTooFewValidRepliesFails() {
  // 30 attempts give 7 valid replies, one short of the minimum
  const auto run = RunGraderJob("mostly_invalid", 4);
  assert(run.job.status == JobStatus::kFailed);
  assert(run.provider->Calls() == 30);
  assert(run.job.usage_delta == 0);
  assert(run.job.output_path.empty());
}

} // namespace

int main() {
  TestParseValidReply();
  TestParseRejectsBadReplies();
  TestParseClampsScores();
  TestWeightedMean();
  TestInterquartileMean();
  TestReportAggregates();
  TestSamplingStopsAtTarget();
  TestSamplingToleratesInvalidReplies();
  TestTooFewValidRepliesFails();

  std::cout << "jobmeter_unit_grader: pass\n";
  return 0;
}
