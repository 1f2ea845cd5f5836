#include <cassert>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/modules/info_extract/info_extract_module.hpp"
#include "internal/modules/registry.hpp"
#include "internal/modules/translatedocx/translate_module.hpp"
#include "internal/storage/disk/disk_artifact_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/text.hpp"

namespace {

using jobmeter::db::model::JobItemRecord;
using jobmeter::db::model::JobRecord;
using jobmeter::model::JobStatus;
namespace modules = jobmeter::modules;
namespace v1      = jobmeter::v1;

const std::string kSeparator(modules::kParagraphSeparator);
const jobmeter::db::model::Glossary kNoTerms;

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

JobRecord Admit(const modules::ModuleRuntime& runtime, const std::string& payload_json) {
  JobRecord job;
  job.id            = "6a1e3c52-1f7d-4c55-9a51-b7a0f0d2c001";
  job.module        = runtime.Descriptor().key;
  job.user_id       = "alice";
  job.payload_json  = runtime.Validate(payload_json);
  job.created_at_ms = 1000;
  return job;
}

v1::ModuleSettings WithModel(const std::string& model) {
  v1::ModuleSettings settings;
  settings.add_models(model);
  return settings;
}

jobmeter::llm::Response Reply(const std::string& text) {
  jobmeter::llm::Response response;
  response.text              = text;
  response.token_usage.total = 10;
  return response;
}

std::shared_ptr<jobmeter::storage::DiskArtifactStore> TempStore(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "jobmeter_modules_tests" / name;
  std::filesystem::remove_all(root);
  return std::make_shared<jobmeter::storage::DiskArtifactStore>(root);
}

void TestEquivalentWords() {
  assert(Near(modules::EquivalentWords("hello  world"), 2.0));
  assert(Near(modules::EquivalentWords("中文"), 1.4));
  assert(Near(modules::EquivalentWords("model 中"), 1.7));
  assert(Near(modules::EquivalentWords("   "), 0.0));
}

void TestChunksCloseOnBlankParagraphs() {
  const auto chunks = modules::PlanChunks({"first", "second", "   ", "third"});
  assert(chunks.size() == 2);
  assert(chunks[0].paragraph_indices_size() == 2);
  assert(chunks[0].paragraph_indices(1) == 1);
  assert(chunks[1].paragraph_indices_size() == 1);
  assert(chunks[1].paragraph_indices(0) == 3);
}

void TestChunksRespectParagraphAndWordLimits() {
  std::vector<std::string> short_paragraphs(25, "word");
  auto                     chunks = modules::PlanChunks(short_paragraphs);
  assert(chunks.size() == 2);
  assert(chunks[0].paragraphs_size() == 20);
  assert(chunks[1].paragraphs_size() == 5);

  std::string long_paragraph;
  for (int i = 0; i < 300; ++i) long_paragraph += "w ";
  chunks = modules::PlanChunks({long_paragraph, long_paragraph, long_paragraph});
  assert(chunks.size() == 2);
  assert(chunks[0].paragraphs_size() == 2);
  assert(chunks[1].paragraph_indices(0) == 2);
}

void TestTranslateRoundTrip() {
  auto registry = modules::BuiltinModules({});
  auto runtime  = registry->Require("translatedocx");

  v1::TranslateJob payload;
  payload.set_source_language("English");
  payload.set_target_language("French");
  payload.add_paragraphs("Hello.");
  payload.add_paragraphs("");
  payload.add_paragraphs("Good night.");
  payload.add_paragraphs("See you.");

  const auto job   = Admit(*runtime, jobmeter::util::ToJson(payload));
  auto       items = runtime->Plan(job);
  assert(items.size() == 2);

  const auto settings = WithModel("translator-1");
  const std::vector<JobItemRecord> none;
  const auto request = runtime->BuildRequest(modules::ItemCall{job, items[1], none, settings, kNoTerms});
  assert(request.model == "translator-1");
  assert(request.messages.size() == 2);
  assert(request.messages[0].text.find(kSeparator) != std::string::npos);
  assert(request.messages[1].text.find("EXACTLY 1 occurrences") != std::string::npos);
  assert(request.messages[1].text.find("Good night." + kSeparator + "See you.") != std::string::npos);

  bool rejected = false;
  try {
    runtime->Interpret(items[1], Reply("Bonne nuit. À bientôt."));
  } catch (const jobmeter::util::ParseError&) {
    rejected = true;
  }
  assert(rejected);

  items[0].status      = JobStatus::kCompleted;
  items[0].result_text = runtime->Interpret(items[0], Reply(" Bonjour. "));
  items[1].status      = JobStatus::kCompleted;
  items[1].result_text = runtime->Interpret(items[1], Reply("Bonne nuit." + kSeparator + "À bientôt."));

  auto       store = TempStore("translate");
  const auto path  = runtime->Assemble(job, items, *store);
  assert(store->Read(path) == "Bonjour.\n\n\n\nBonne nuit.\n\nÀ bientôt.");
}

void TestTranslateRejectsBadPayloads() {
  auto registry = modules::BuiltinModules({});
  auto runtime  = registry->Require("translatedocx");

  auto rejects = [&](const v1::TranslateJob& payload) {
    try {
      runtime->Validate(jobmeter::util::ToJson(payload));
    } catch (const jobmeter::util::ValidationFailed&) {
      return true;
    }
    return false;
  };

  v1::TranslateJob same;
  same.set_source_language("German");
  same.set_target_language(" German ");
  same.add_paragraphs("Hallo");
  assert(rejects(same));

  v1::TranslateJob reserved;
  reserved.set_source_language("German");
  reserved.set_target_language("English");
  reserved.add_paragraphs("a" + kSeparator + "b");
  assert(rejects(reserved));

  v1::TranslateJob blank;
  blank.set_source_language("German");
  blank.set_target_language("English");
  blank.add_paragraphs("  ");
  assert(rejects(blank));
}

void TestExtractObjectFindsEmbeddedJson() {
  auto object = modules::ExtractObject("Sure, here it is:\n```json\n{\"title\": \"Deep Nets\", \"year\": 2021}\n```");
  assert(object.fields().at("title").string_value() == "Deep Nets");
  assert(object.fields().at("year").number_value() == 2021);

  bool rejected = false;
  try {
    modules::ExtractObject("no structured data here");
  } catch (const jobmeter::util::ParseError&) {
    rejected = true;
  }
  assert(rejected);
}

void TestCellsAndCsvQuoting() {
  google::protobuf::Value list;
  list.mutable_list_value()->add_values()->set_string_value("Smith");
  list.mutable_list_value()->add_values()->set_string_value("");
  list.mutable_list_value()->add_values()->set_number_value(3);
  assert(modules::ValueToCell(list) == "Smith；3");

  google::protobuf::Value number;
  number.set_number_value(2.5);
  assert(modules::ValueToCell(number) == "2.5");

  google::protobuf::Value missing;
  missing.set_null_value(google::protobuf::NULL_VALUE);
  assert(modules::ValueToCell(missing).empty());

  assert(modules::CsvField("plain") == "plain");
  assert(modules::CsvField("a,b") == "\"a,b\"");
  assert(modules::CsvField("say \"hi\"") == "\"say \"\"hi\"\"\"");
}

void TestInfoExtractCsvHasOneRowPerSuccess() {
  auto registry = modules::BuiltinModules({});
  auto runtime  = registry->Require("info_extract");

  v1::InfoExtractJob payload;
  payload.add_fields()->set_name("title");
  payload.add_fields()->set_name("authors");
  for (const auto* name : {"a.pdf", "b.pdf"}) {
    auto* doc = payload.add_documents();
    doc->set_filename(name);
    doc->set_text(std::string("text of ") + name);
  }

  const auto job   = Admit(*runtime, jobmeter::util::ToJson(payload));
  auto       items = runtime->Plan(job);
  assert(items.size() == 2);

  items[0].status      = JobStatus::kCompleted;
  items[0].result_text = runtime->Interpret(items[0], Reply(R"({"title":"On, Commas","authors":["Li","Ng"]})"));
  items[1].status      = JobStatus::kFailed;

  auto       store = TempStore("info_extract");
  const auto csv   = store->Read(runtime->Assemble(job, items, *store));
  assert(csv.find("filename,title,authors\r\n") == 0);
  assert(csv.find("a.pdf,\"On, Commas\",Li；Ng\r\n") != std::string::npos);
  assert(csv.find("b.pdf") == std::string::npos);
}

void TestReviewerRoundsFeedForward() {
  auto registry = modules::BuiltinModules({});
  auto runtime  = registry->Require("reviewer");

  v1::ReviewerJob payload;
  payload.mutable_manuscript()->set_text("We propose a method.");
  const auto job   = Admit(*runtime, jobmeter::util::ToJson(payload));
  auto       items = runtime->Plan(job);
  assert(items.size() == 10);
  assert(items[7].round == 1 && items[8].round == 2 && items[9].round == 3);
  assert(runtime->ItemArtifactName(items[0]) == "review_1.txt");
  assert(runtime->ItemArtifactName(items[8]) == "meta_review.txt");

  std::vector<JobItemRecord> reviews(items.begin(), items.begin() + 8);
  for (std::size_t i = 0; i < reviews.size(); ++i) {
    reviews[i].status      = i < 5 ? JobStatus::kCompleted : JobStatus::kFailed;
    reviews[i].result_text = "review body " + std::to_string(i);
  }

  const auto settings = WithModel("reviewer-1");
  const auto meta     = runtime->BuildRequest(modules::ItemCall{job, items[8], reviews, settings, kNoTerms});
  assert(meta.attachments.size() == 1);
  assert(meta.attachments[0].filename == "manuscript.txt");
  assert(meta.messages[0].text.find("=== Review 5 ===") != std::string::npos);
  assert(meta.messages[0].text.find("=== Review 6 ===") == std::string::npos);
  assert(meta.messages[0].text.find("review body 6") == std::string::npos);

  bool no_meta = false;
  try {
    runtime->BuildRequest(modules::ItemCall{job, items[9], reviews, settings, kNoTerms});
  } catch (const jobmeter::util::InvalidState&) {
    no_meta = true;
  }
  assert(no_meta);

  auto prior               = reviews;
  auto meta_item           = items[8];
  meta_item.status         = JobStatus::kCompleted;
  meta_item.result_text    = "consolidated report";
  prior.push_back(meta_item);
  const auto check = runtime->BuildRequest(modules::ItemCall{job, items[9], prior, settings, kNoTerms});
  assert(check.messages[0].text.find("=== Review Report ===\n\nconsolidated report") != std::string::npos);
}

void TestConfiguredPromptReplacesPrimaryPrompt() {
  jobmeter::runtime::config::RuntimeConfig config;
  auto*                                    reviewer = config.add_modules();
  reviewer->set_key("reviewer");
  reviewer->set_model("configured-model");
  reviewer->set_prompt("Review tersely.");

  auto registry = modules::BuiltinModules(config);
  auto runtime  = registry->Require("reviewer");

  const auto defaults = runtime->DefaultSettings();
  assert(defaults.models_size() == 1 && defaults.models(0) == "configured-model");
  assert(defaults.prompts().at("round1") == "Review tersely.");
  assert(defaults.prompts().count("round2") == 1);

  v1::ReviewerJob payload;
  payload.mutable_manuscript()->set_text("text");
  const auto job   = Admit(*runtime, jobmeter::util::ToJson(payload));
  const auto items = runtime->Plan(job);

  const v1::ModuleSettings         empty;
  const std::vector<JobItemRecord> none;
  const auto request = runtime->BuildRequest(modules::ItemCall{job, items[0], none, empty, kNoTerms});
  assert(request.model == "configured-model");
  assert(request.messages[0].text == "Review tersely.");
}

} // namespace

int main() {
  TestEquivalentWords();
  TestChunksCloseOnBlankParagraphs();
  TestChunksRespectParagraphAndWordLimits();
  TestTranslateRoundTrip();
  TestTranslateRejectsBadPayloads();
  TestExtractObjectFindsEmbeddedJson();
  TestCellsAndCsvQuoting();
  TestInfoExtractCsvHasOneRowPerSuccess();
  TestReviewerRoundsFeedForward();
  TestConfiguredPromptReplacesPrimaryPrompt();

  std::cout << "jobmeter_unit_modules: pass\n";
  return 0;
}
