#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "api/jobmeter/v1.hpp"
#include "internal/db/model/glossary_record.hpp"
#include "internal/db/model/job_item_record.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/llm/provider.hpp"
#include "internal/storage/artifact_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/worker/stage_policy.hpp"

namespace jobmeter::runtime::config {
class ModuleConfig;
}

namespace jobmeter::modules {

struct ModuleDescriptor {
  std::string key;        // table prefix, [a-z][a-z0-9_]*
  std::string label;      // human name
  std::string unit_label; // what one billed unit is
  std::string item_noun;  // used in progress notes, "3/5 documents processed"
};

// Everything BuildRequest may look at for one attempt.
struct ItemCall {
  const db::model::JobRecord&                  job;
  const db::model::JobItemRecord&              item;
  const std::vector<db::model::JobItemRecord>& prior; // items of earlier rounds, terminal
  const v1::ModuleSettings&                    settings;
  const db::model::Glossary&                   glossary;
};

/*
  Type-erased module contract driven by the job runner.

  A module describes its work as JobItems planned at submission, one
  provider request per attempt, and a final Assemble() that writes the
  job-level artifact. Status, retries, concurrency and billing all live in
  the runner; modules never touch the repository.

  Errors:
    Validate()  -> util::ValidationFailed
    Interpret() -> util::ParseError (retried like a provider failure)
    Assemble()  -> util::StorageError
*/
class ModuleRuntime {
 public:
  ModuleRuntime(ModuleDescriptor descriptor, worker::ModulePolicy policy, int64_t estimated_tokens_per_unit);
  virtual ~ModuleRuntime() = default;

  ModuleRuntime(const ModuleRuntime&)            = delete;
  ModuleRuntime& operator=(const ModuleRuntime&) = delete;

  const ModuleDescriptor& Descriptor() const {
    return descriptor_;
  }

  const worker::ModulePolicy& Policy() const {
    return policy_;
  }

  // Stage overrides, token estimate and default model/prompt from config.
  // Throws std::invalid_argument for a stage the module does not have.
  void Configure(const jobmeter::runtime::config::ModuleConfig& config);

  // Settings row written the first time the module starts.
  v1::ModuleSettings DefaultSettings() const;

  // Returns the payload re-encoded in canonical protobuf JSON.
  virtual std::string Validate(const std::string& payload_json) const = 0;

  // Billable units a submission is expected to consume.
  virtual int64_t ProjectedUnits(const std::string& payload_json) const = 0;

  int64_t ProjectedTokens(int64_t projected_units) const {
    return projected_units * estimated_tokens_per_unit_;
  }

  // Every item the job will ever have, Pending, addressed by (round, index).
  virtual std::vector<db::model::JobItemRecord> Plan(const db::model::JobRecord& job) const = 0;

  // Non-empty when an input the item depends on is missing; the runner
  // then fails the item without calling the provider.
  virtual std::string BlockedBy(const ItemCall& call) const = 0;

  virtual llm::Request BuildRequest(const ItemCall& call) const = 0;

  // One valid sample out of a provider reply.
  virtual std::string Interpret(const db::model::JobItemRecord& item, const llm::Response& response) const = 0;

  // Folds the valid samples of an item into its result_text.
  virtual std::string FinishItem(const db::model::JobItemRecord& item, const std::vector<std::string>& samples) const;

  // Per-item artifact file; empty means the item has none.
  virtual std::string ItemArtifactName(const db::model::JobItemRecord& item) const;

  // Writes the job-level artifact and returns its path.
  virtual std::string Assemble(const db::model::JobRecord& job, const std::vector<db::model::JobItemRecord>& items,
                               storage::ArtifactStore& store) const = 0;

 protected:
  // prompt keys and their built-in text
  virtual std::map<std::string, std::string> DefaultPrompts() const = 0;

  // key that a config `prompt` replaces
  virtual std::string PrimaryPromptKey() const {
    return "system";
  }

  // payload model, else first configured model, else config default.
  // Throws util::InvalidState when none is set.
  std::string ResolveModel(const std::string& requested, const v1::ModuleSettings& settings) const;

  // configured prompt, else built-in. Throws util::InvalidState.
  std::string ResolvePrompt(const v1::ModuleSettings& settings, const std::string& key) const;

 private:
  ModuleDescriptor     descriptor_;
  worker::ModulePolicy policy_;
  int64_t              estimated_tokens_per_unit_;
  std::string          default_model_;
  std::string          default_prompt_;
};

// ---------------------------------------------------------------------------
// Typed payload views
// ---------------------------------------------------------------------------

template <typename Payload>
struct Job {
  const db::model::JobRecord& record;
  Payload                     payload;
};

template <typename Payload>
struct JobItem {
  const db::model::JobItemRecord& record;
  Payload                         payload;
};

template <typename Payload>
struct PlannedItem {
  uint32_t round = 1;
  uint32_t index = 0;
  Payload  payload;
};

// Decodes a stored payload. Throws util::InvalidState: stored rows were
// validated on submission, so a decode failure means a corrupt row.
void DecodeStored(const std::string& json, google::protobuf::Message* message, const std::string& what);

/*
  Adapts a module written against protobuf payload types to the
  type-erased contract. Payloads travel as protobuf JSON.
*/
template <typename JobPayload, typename ItemPayload>
class TypedModule : public ModuleRuntime {
 public:
  using ModuleRuntime::ModuleRuntime;

  using JobView  = Job<JobPayload>;
  using ItemView = JobItem<ItemPayload>;
  using Planned  = PlannedItem<ItemPayload>;

  std::string Validate(const std::string& payload_json) const final {
    JobPayload payload;
    try {
      util::FromJson(payload_json, &payload);
    } catch (const std::invalid_argument& e) {
      throw util::ValidationFailed(e.what());
    }
    Check(payload);
    return util::ToJson(payload);
  }

  int64_t ProjectedUnits(const std::string& payload_json) const final {
    return Units(DecodeJob(payload_json));
  }

  std::vector<db::model::JobItemRecord> Plan(const db::model::JobRecord& job) const final {
    std::vector<db::model::JobItemRecord> items;
    for (auto& planned : PlanItems(DecodeJob(job.payload_json))) {
      db::model::JobItemRecord item;
      item.job_id        = job.id;
      item.round         = planned.round;
      item.index         = planned.index;
      item.status        = jobmeter::model::JobStatus::kPending;
      item.payload_json  = util::ToJson(planned.payload);
      item.updated_at_ms = job.created_at_ms;
      items.push_back(std::move(item));
    }
    return items;
  }

  std::string BlockedBy(const ItemCall& call) const final {
    JobView  job{call.job, DecodeJob(call.job.payload_json)};
    ItemView item{call.item, DecodeItem(call.item.payload_json)};
    return Blocked(job, item, View(call.prior));
  }

  llm::Request BuildRequest(const ItemCall& call) const final {
    JobView  job{call.job, DecodeJob(call.job.payload_json)};
    ItemView item{call.item, DecodeItem(call.item.payload_json)};
    return Build(job, item, View(call.prior), call.settings, call.glossary);
  }

  std::string Interpret(const db::model::JobItemRecord& item, const llm::Response& response) const final {
    return Parse(ItemView{item, DecodeItem(item.payload_json)}, response);
  }

  std::string Assemble(const db::model::JobRecord& job, const std::vector<db::model::JobItemRecord>& items,
                       storage::ArtifactStore& store) const final {
    return Combine(JobView{job, DecodeJob(job.payload_json)}, View(items), store);
  }

 protected:
  // Normalizes in place; throws util::ValidationFailed.
  virtual void Check(JobPayload& payload) const = 0;

  virtual int64_t Units(const JobPayload& payload) const = 0;

  virtual std::vector<Planned> PlanItems(const JobPayload& payload) const = 0;

  virtual std::string Blocked(const JobView&, const ItemView&, const std::vector<ItemView>&) const {
    return {};
  }

  virtual llm::Request Build(const JobView& job, const ItemView& item, const std::vector<ItemView>& prior,
                             const v1::ModuleSettings& settings, const db::model::Glossary& glossary) const = 0;

  virtual std::string Parse(const ItemView& item, const llm::Response& response) const = 0;

  virtual std::string Combine(const JobView& job, const std::vector<ItemView>& items, storage::ArtifactStore& store) const = 0;

  JobPayload DecodeJob(const std::string& json) const {
    JobPayload payload;
    DecodeStored(json, &payload, Descriptor().key + " job payload");
    return payload;
  }

  ItemPayload DecodeItem(const std::string& json) const {
    ItemPayload payload;
    DecodeStored(json, &payload, Descriptor().key + " item payload");
    return payload;
  }

  std::vector<ItemView> View(const std::vector<db::model::JobItemRecord>& records) const {
    std::vector<ItemView> views;
    views.reserve(records.size());
    for (const auto& record : records) {
      views.push_back(ItemView{record, DecodeItem(record.payload_json)});
    }
    return views;
  }
};

} // namespace jobmeter::modules
