#include <google/protobuf/struct.pb.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "api/jobmeter/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/core/error_status.hpp"
#include "internal/core/job_engine.hpp"
#include "internal/factory.hpp"
#include "internal/history/history_index.hpp"
#include "internal/modules/glossary.hpp"
#include "internal/modules/module_settings.hpp"
#include "internal/retention/retention_sweeper.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

using namespace jobmeter;

namespace {

// Bad arguments; exits 1 instead of 2.
class UsageError : public std::runtime_error {
 public:
  explicit UsageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

void Usage() {
  std::cout << "Usage:\n"
            << "  jobmeterctl <config.yaml> group-set <group_id> <name> [token_budget|unlimited] [window]\n"
            << "  jobmeterctl <config.yaml> limit-set <group_id> <module> <unit_limit|unlimited>\n"
            << "  jobmeterctl <config.yaml> assign <user_id> <group_id>\n"
            << "  jobmeterctl <config.yaml> usage <user_id>\n"
            << "  jobmeterctl <config.yaml> history <user_id> [module|all] [limit]\n"
            << "  jobmeterctl <config.yaml> status <module> <job_id>\n"
            << "  jobmeterctl <config.yaml> sweep\n"
            << "  jobmeterctl <config.yaml> settings <module>\n"
            << "  jobmeterctl <config.yaml> set-models <module> <model> [model...]\n"
            << "  jobmeterctl <config.yaml> glossary-list\n"
            << "  jobmeterctl <config.yaml> glossary-set <source_term> <target_term> [notes]\n"
            << "  jobmeterctl <config.yaml> glossary-remove <source_term>\n";
}

int64_t ParseInt(const std::string& text, const std::string& what) {
  try {
    std::size_t used  = 0;
    const auto  value = std::stoll(text, &used);
    if (used != text.size()) throw UsageError("invalid " + what + ": " + text);
    return value;
  } catch (const std::logic_error&) {
    throw UsageError("invalid " + what + ": " + text);
  }
}

// "unlimited" maps to nullopt
std::optional<int64_t> ParseLimit(const std::string& text, const std::string& what) {
  if (text == "unlimited") return std::nullopt;
  return ParseInt(text, what);
}

void Print(const google::protobuf::Message& message) {
  std::cout << util::ToJson(message) << "\n";
}

void SetTerm(google::protobuf::Struct& out, const db::model::GlossaryTermRecord& term) {
  auto& fields = *out.mutable_fields();
  fields["source_term"].set_string_value(term.source_term);
  fields["target_term"].set_string_value(term.target_term);
  fields["notes"].set_string_value(term.notes);
  fields["updated_at_ms"].set_number_value(static_cast<double>(term.updated_at_ms));
}

int Run(factory::Application& app, const std::string& cmd, const std::vector<std::string>& args) {
  const auto need = [&](std::size_t n) {
    if (args.size() < n) throw UsageError(cmd + " expects at least " + std::to_string(n) + " arguments");
  };

  // ------------------------------------------------------------

  if (cmd == "group-set") {
    need(2);
    core::LimitEdit        budget;
    std::optional<int64_t> window;
    if (args.size() >= 3) budget.emplace(ParseLimit(args[2], "token budget"));
    if (args.size() >= 4) {
      try {
        window = std::chrono::duration_cast<std::chrono::seconds>(util::ParseDuration(args[3])).count();
      } catch (const std::invalid_argument& e) {
        throw UsageError(e.what());
      }
    }
    Print(app.engine->UpsertGroup(args[0], args[1], budget, window));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "limit-set") {
    need(3);
    app.engine->SetModuleLimit(args[0], args[1], ParseLimit(args[2], "unit limit"));
    std::cout << "limit saved\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "assign") {
    need(2);
    app.engine->AssignUser(args[0], args[1]);
    std::cout << "assigned\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "usage") {
    need(1);
    Print(app.engine->UsageSnapshot(args[0]));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "history") {
    need(1);
    const auto module = args.size() >= 2 && args[1] != "all" ? args[1] : std::string();
    const auto limit  = args.size() >= 3 ? ParseInt(args[2], "limit") : static_cast<int64_t>(app.history->Settings().limit);
    if (limit < 0) throw UsageError("limit must not be negative");

    v1::HistoryPage page;
    for (auto& entry : app.engine->ListHistory(args[0], module, static_cast<uint32_t>(limit))) {
      *page.add_entries() = std::move(entry);
    }
    Print(page);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    need(2);
    Print(app.engine->GetStatus(args[0], args[1], core::Requester{"", true}));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "sweep") {
    const auto report = app.sweeper->SweepOnce(util::Now());

    google::protobuf::Struct out;
    auto&                    fields = *out.mutable_fields();
    fields["scanned"].set_number_value(report.scanned);
    fields["purged"].set_number_value(report.purged);
    fields["failed"].set_number_value(report.failed);
    Print(out);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "settings") {
    need(1);
    app.settings->EnsureDefaults(util::Now());
    Print(app.settings->Load(args[0]));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "set-models") {
    need(2);
    Print(app.settings->UpdateModels(args[0], std::vector<std::string>(args.begin() + 1, args.end()), util::Now()));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "glossary-list") {
    google::protobuf::Struct out;
    auto*                    terms = (*out.mutable_fields())["terms"].mutable_list_value();
    for (const auto& term : app.glossary->List()) {
      SetTerm(*terms->add_values()->mutable_struct_value(), term);
    }
    Print(out);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "glossary-set") {
    need(2);
    google::protobuf::Struct out;
    SetTerm(out, app.glossary->Upsert(args[0], args[1], args.size() >= 3 ? args[2] : std::string(), util::Now()));
    Print(out);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "glossary-remove") {
    need(1);
    app.glossary->Remove(args[0]);
    std::cout << "removed\n";
    return 0;
  }

  throw UsageError("unknown command: " + cmd);
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string              config_path = argv[1];
  const std::string              cmd         = argv[2];
  const std::vector<std::string> args(argv + 3, argv + argc);

  // stdout carries the JSON result; diagnostics go to stderr
  auto logger = spdlog::stderr_color_mt("jobmeterctl");
  logger->set_level(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));

  try {
    auto config = config::ConfigLoader::LoadFromYaml(config_path);
    auto app    = factory::Build(config);
    return Run(app, cmd, args);
  } catch (const UsageError& e) {
    std::cerr << e.what() << "\n";
    Usage();
    return 1;
  } catch (const std::exception& e) {
    std::cerr << core::ErrorCodeName(core::ToErrorCode(e)) << ": " << e.what() << "\n";
    return 2;
  }
}
