#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "config/config.pb.h"
#include "internal/core/job_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/history/history_index.hpp"
#include "internal/modules/registry.hpp"
#include "internal/store/job_store.hpp"
#include "internal/usage/quota_policy.hpp"
#include "internal/usage/usage_ledger.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/worker/job_scheduler.hpp"

namespace {

using jobmeter::core::Requester;

const auto kNow = jobmeter::util::FromUnixMillis(1700000000000);

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

struct Fixture {
  std::shared_ptr<jobmeter::db::memory::MemoryRepository> repository = std::make_shared<jobmeter::db::memory::MemoryRepository>();
  std::shared_ptr<jobmeter::modules::ModuleRegistry>      registry   = jobmeter::modules::BuiltinModules({});
  std::shared_ptr<jobmeter::store::JobStore>              store      = std::make_shared<jobmeter::store::JobStore>(repository);
  std::shared_ptr<jobmeter::usage::UsageLedger>           ledger     = std::make_shared<jobmeter::usage::UsageLedger>(repository);
  std::shared_ptr<jobmeter::worker::JobScheduler>         scheduler  = std::make_shared<jobmeter::worker::JobScheduler>();
  std::shared_ptr<jobmeter::usage::QuotaPolicy>           quota;
  std::shared_ptr<jobmeter::history::HistoryIndex>        history;
  std::shared_ptr<jobmeter::core::JobEngine>              engine;

  Fixture() {
    jobmeter::usage::QuotaSettings settings;
    settings.default_group = "free";
    quota   = std::make_shared<jobmeter::usage::QuotaPolicy>(repository, ledger, settings);
    history = std::make_shared<jobmeter::history::HistoryIndex>(repository, registry, jobmeter::history::HistorySettings{});
    engine  = std::make_shared<jobmeter::core::JobEngine>(repository, registry, store, ledger, quota, history, scheduler, [] { return kNow; });

    engine->UpsertGroup("free", "Free", std::nullopt, std::nullopt);
  }

  static std::string Documents(int count) {
    jobmeter::v1::SummarizerJob job;
    for (int i = 1; i <= count; ++i) {
      auto* doc = job.add_documents();
      doc->set_text("text of document " + std::to_string(i));
    }
    return jobmeter::util::ToJson(job);
  }

  std::size_t HistoryRows(const std::string& user) {
    auto tx   = repository->Begin();
    auto rows = repository->ListHistory(*tx, user, "", 0, 100);
    tx->Commit();
    return rows.size();
  }
};

void TestSubmitCreatesPendingJobAndQueuesIt() {
  Fixture f;
  const auto response = f.engine->SubmitJob("alice", "summarizer", Fixture::Documents(3));
  assert(response.module() == "summarizer");
  assert(!response.job_id().empty());
  assert(f.scheduler->Pending() == 1);

  const auto view = f.engine->GetStatus("summarizer", response.job_id(), Requester{"alice", false});
  assert(view.status() == jobmeter::v1::JOB_STATUS_PENDING);
  assert(view.status_detail() == "queued");
  assert(view.items_size() == 3);
  assert(view.downloads_size() == 0);
  assert(!view.files_purged());

  const auto entries = f.engine->ListHistory("alice", "", 10);
  assert(entries.size() == 1 && entries[0].job_key() == response.job_id());

  // filenames are filled in when missing
  auto tx  = f.repository->Begin();
  auto job = f.store->Require(*tx, "summarizer", response.job_id());
  tx->Commit();
  jobmeter::v1::SummarizerJob stored;
  jobmeter::util::FromJson(job.payload_json, &stored);
  assert(stored.documents(0).filename() == "document_1");
}

void TestInvalidSubmissionLeavesNoRows() {
  Fixture f;
  assert(Throws<jobmeter::util::ValidationFailed>([&] { f.engine->SubmitJob("alice", "summarizer", Fixture::Documents(0)); }));
  assert(Throws<jobmeter::util::ValidationFailed>([&] { f.engine->SubmitJob("alice", "summarizer", "{not json"); }));
  assert(Throws<jobmeter::util::ValidationFailed>([&] { f.engine->SubmitJob("", "summarizer", Fixture::Documents(1)); }));
  assert(Throws<jobmeter::util::NotFound>([&] { f.engine->SubmitJob("alice", "poetry", "{}"); }));

  assert(f.scheduler->Pending() == 0);
  assert(f.HistoryRows("alice") == 0);
}

void TestQuotaRejectionLeavesNoRows() {
  Fixture f;
  // summarizer projects 6000 tokens per document
  f.engine->UpsertGroup("tight", "Tight", 10000, 3600);
  f.engine->AssignUser("bob", "tight");

  assert(Throws<jobmeter::util::QuotaExceeded>([&] { f.engine->SubmitJob("bob", "summarizer", Fixture::Documents(2)); }));
  assert(f.scheduler->Pending() == 0);
  assert(f.HistoryRows("bob") == 0);

  f.engine->SubmitJob("bob", "summarizer", Fixture::Documents(1));
  assert(f.scheduler->Pending() == 1);
}

void TestUnitCapRejectsSubmission() {
  Fixture f;
  f.engine->SetModuleLimit("free", "summarizer", 2);
  f.ledger->Record("carol", "summarizer", 0, 2, kNow);

  assert(Throws<jobmeter::util::QuotaExceeded>([&] { f.engine->SubmitJob("carol", "summarizer", Fixture::Documents(1)); }));
  f.engine->SubmitJob("dave", "summarizer", Fixture::Documents(2));
}

void TestSubmitWithoutSchedulerIsInvalidState() {
  Fixture f;
  jobmeter::core::JobEngine engine(f.repository, f.registry, f.store, f.ledger, f.quota, f.history, nullptr);
  assert(Throws<jobmeter::util::InvalidState>([&] { engine.SubmitJob("alice", "summarizer", Fixture::Documents(1)); }));
}

void TestSubmitAfterShutdownLeavesNoRows() {
  Fixture f;
  assert(f.scheduler->Accepting());
  f.scheduler->Shutdown();
  assert(!f.scheduler->Accepting());

  assert(Throws<jobmeter::util::InvalidState>([&] { f.engine->SubmitJob("alice", "summarizer", Fixture::Documents(1)); }));
  assert(f.HistoryRows("alice") == 0);
  assert(f.scheduler->Pending() == 0);
  assert(f.engine->ListHistory("alice", "summarizer", 10).empty());
}

void TestStatusIsVisibleToOwnerAndAdmin() {
  Fixture f;
  const auto id = f.engine->SubmitJob("alice", "summarizer", Fixture::Documents(1)).job_id();

  assert(Throws<jobmeter::util::Forbidden>([&] { f.engine->GetStatus("summarizer", id, Requester{"mallory", false}); }));
  assert(f.engine->GetStatus("summarizer", id, Requester{"root", true}).user_id() == "alice");

  assert(Throws<jobmeter::util::NotFound>([&] { f.engine->GetStatus("summarizer", "no-such-job", Requester{"alice", false}); }));
  assert(Throws<jobmeter::util::NotFound>([&] { f.engine->GetStatus("grader", id, Requester{"alice", false}); }));
  assert(Throws<jobmeter::util::NotFound>([&] { f.engine->GetStatus("poetry", id, Requester{"alice", false}); }));
}

void TestDownloadChecksOwnerBeforeArtifact() {
  Fixture f;
  const auto id = f.engine->SubmitJob("alice", "summarizer", Fixture::Documents(1)).job_id();

  assert(Throws<jobmeter::util::Forbidden>([&] { f.engine->ResolveDownload("summarizer", id, Requester{"mallory", false}, "result"); }));
  assert(Throws<jobmeter::util::NotFound>([&] { f.engine->ResolveDownload("summarizer", id, Requester{"alice", false}, "result"); }));
  assert(Throws<jobmeter::util::NotFound>([&] { f.engine->ResolveDownload("summarizer", id, Requester{"alice", false}, "item/1/0"); }));
  assert(Throws<jobmeter::util::NotFound>([&] { f.engine->ResolveDownload("summarizer", id, Requester{"alice", false}, "item/x"); }));
}

void TestUsageSnapshotReportsGroupAndModules() {
  Fixture f;
  f.engine->UpsertGroup("pro", "Pro", 50000, 86400);
  f.engine->SetModuleLimit("pro", "grader", 10);
  f.engine->AssignUser("alice", "pro");

  f.ledger->Record("alice", "grader", 1200, 1, kNow - std::chrono::hours(1));
  f.ledger->Record("alice", "summarizer", 800, 2, kNow - std::chrono::hours(2));
  f.ledger->Record("alice", "summarizer", 5000, 0, kNow - std::chrono::hours(30));

  const auto snapshot = f.engine->UsageSnapshot("alice");
  assert(snapshot.group_id() == "pro");
  assert(snapshot.group_name() == "Pro");
  assert(snapshot.token_budget().value() == 50000);
  assert(snapshot.token_window_seconds() == 86400);
  assert(snapshot.tokens_used() == 2000);
  assert(snapshot.modules_size() == static_cast<int>(f.registry->All().size()));

  bool saw_grader = false;
  for (const auto& usage : snapshot.modules()) {
    if (usage.module() == "grader") {
      saw_grader = true;
      assert(usage.units_used() == 1);
      assert(usage.has_unit_limit() && usage.unit_limit().value() == 10);
    }
    if (usage.module() == "summarizer") {
      assert(usage.units_used() == 2);
      assert(!usage.has_unit_limit());
    }
  }
  assert(saw_grader);

  const auto unassigned = f.engine->UsageSnapshot("zed");
  assert(unassigned.group_id() == "free");
  assert(!unassigned.has_token_budget());
}

void TestUpsertGroupMergesFields() {
  Fixture f;
  auto group = f.engine->UpsertGroup("team", "Team", 1000, 60);
  assert(group.token_budget().value() == 1000);
  assert(group.token_window_seconds() == 60);

  f.engine->SetModuleLimit("team", "reviewer", 3);
  group = f.engine->UpsertGroup("team", "", std::nullopt, 120);
  assert(group.name() == "Team");
  assert(group.token_budget().value() == 1000);
  assert(group.token_window_seconds() == 120);
  assert(group.limits_size() == 1 && group.limits(0).module() == "reviewer");

  // clearing returns the group to an unlimited budget
  group = f.engine->UpsertGroup("team", "", jobmeter::core::kClearLimit, std::nullopt);
  assert(!group.has_token_budget());
  assert(group.token_window_seconds() == 120);
  assert(!f.engine->UpsertGroup("team", "", std::nullopt, std::nullopt).has_token_budget());

  group = f.engine->UpsertGroup("team", "", 500, std::nullopt);
  assert(group.token_budget().value() == 500);

  assert(Throws<jobmeter::util::ValidationFailed>([&] { f.engine->UpsertGroup("", "x", std::nullopt, std::nullopt); }));
  assert(Throws<jobmeter::util::ValidationFailed>([&] { f.engine->UpsertGroup("team", "", -1, std::nullopt); }));
  assert(Throws<jobmeter::util::ValidationFailed>([&] { f.engine->UpsertGroup("team", "", std::nullopt, 0); }));
}

void TestAdminOperationsRejectUnknownTargets() {
  Fixture f;
  assert(Throws<jobmeter::util::NotFound>([&] { f.engine->SetModuleLimit("ghost", "grader", 1); }));
  assert(Throws<jobmeter::util::NotFound>([&] { f.engine->SetModuleLimit("free", "poetry", 1); }));
  assert(Throws<jobmeter::util::ValidationFailed>([&] { f.engine->SetModuleLimit("free", "grader", -5); }));
  assert(Throws<jobmeter::util::NotFound>([&] { f.engine->AssignUser("alice", "ghost"); }));

  f.engine->SetModuleLimit("free", "grader", std::nullopt);
}

} // namespace

int main() {
  TestSubmitCreatesPendingJobAndQueuesIt();
  TestInvalidSubmissionLeavesNoRows();
  TestQuotaRejectionLeavesNoRows();
  TestUnitCapRejectsSubmission();
  TestSubmitWithoutSchedulerIsInvalidState();
  TestSubmitAfterShutdownLeavesNoRows();
  TestStatusIsVisibleToOwnerAndAdmin();
  TestDownloadChecksOwnerBeforeArtifact();
  TestUsageSnapshotReportsGroupAndModules();
  TestUpsertGroupMergesFields();
  TestAdminOperationsRejectUnknownTargets();

  std::cout << "jobmeter_unit_engine: pass\n";
  return 0;
}
