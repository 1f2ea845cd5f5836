#include "info_extract_module.hpp"

#include <cmath>
#include <set>
#include <sstream>

#include "internal/util/text.hpp"

namespace jobmeter::modules {
namespace {

worker::ModulePolicy DefaultPolicy() {
  worker::StagePolicy documents;
  documents.name            = "documents";
  documents.round           = 1;
  documents.attempt_cap     = 3;
  documents.concurrency_cap = 5;
  documents.delay_mode      = worker::DelayMode::kLinear;
  documents.retry_delay     = std::chrono::milliseconds(1500);
  documents.threshold       = worker::SuccessThreshold::RequireAny();
  documents.units_per_item  = 1;

  worker::ModulePolicy policy;
  policy.stages.push_back(documents);
  return policy;
}

bool TryParseObject(const std::string& text, google::protobuf::Struct* out) {
  try {
    util::FromJson(text, out);
    return true;
  } catch (const std::invalid_argument&) {
    out->Clear();
    return false;
  }
}

std::string FormatNumber(double value) {
  if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < 1e15) {
    return std::to_string(static_cast<long long>(value));
  }
  std::ostringstream out;
  out.precision(15);
  out << value;
  return out.str();
}

} // namespace

google::protobuf::Struct ExtractObject(const std::string& reply) {
  google::protobuf::Struct object;
  const auto               trimmed = util::Trim(reply);
  if (TryParseObject(trimmed, &object)) return object;

  const auto first = trimmed.find('{');
  const auto last  = trimmed.rfind('}');
  if (first != std::string::npos && last != std::string::npos && last > first &&
      TryParseObject(trimmed.substr(first, last - first + 1), &object)) {
    return object;
  }
  throw util::ParseError("reply does not contain a JSON object");
}

std::string ValueToCell(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kStringValue:
      return value.string_value();
    case google::protobuf::Value::kNumberValue:
      return FormatNumber(value.number_value());
    case google::protobuf::Value::kBoolValue:
      return value.bool_value() ? "true" : "false";
    case google::protobuf::Value::kListValue: {
      std::vector<std::string> parts;
      for (const auto& element : value.list_value().values()) {
        auto cell = ValueToCell(element);
        if (!cell.empty()) parts.push_back(std::move(cell));
      }
      return util::Join(parts, "；");
    }
    case google::protobuf::Value::kStructValue:
      return util::ToJson(value.struct_value());
    default:
      return {};
  }
}

std::string CsvField(const std::string& value) {
  if (value.find_first_of(",\"\r\n") == std::string::npos) return value;

  std::string quoted = "\"";
  for (char c : value) {
    if (c == '"') quoted += '"';
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

InfoExtractModule::InfoExtractModule()
    : TypedModule({"info_extract", "Information extraction", "document", "documents"}, DefaultPolicy(), /*estimated_tokens_per_unit=*/8000) {
}

std::map<std::string, std::string> InfoExtractModule::DefaultPrompts() const {
  return {
      {"system",
       "You extract structured information from research papers. Reply with a single JSON object whose keys are exactly the "
       "requested field names. Use an empty string when a field cannot be determined."},
      {"response_guidance", ""},
  };
}

void InfoExtractModule::Check(v1::InfoExtractJob& payload) const {
  if (payload.fields_size() == 0) {
    throw util::ValidationFailed("at least one field must be defined");
  }

  std::set<std::string> names;
  for (auto& field : *payload.mutable_fields()) {
    field.set_name(util::Trim(field.name()));
    field.set_description(util::Trim(field.description()));
    if (field.name().empty()) {
      throw util::ValidationFailed("field name must not be empty");
    }
    if (!names.insert(field.name()).second) {
      throw util::ValidationFailed("duplicate field '" + field.name() + "'");
    }
  }

  if (payload.documents_size() == 0) {
    throw util::ValidationFailed("at least one document is required");
  }
  if (payload.documents_size() > kMaxExtractDocuments) {
    throw util::ValidationFailed("at most " + std::to_string(kMaxExtractDocuments) + " documents per job");
  }
  for (int i = 0; i < payload.documents_size(); ++i) {
    auto* doc = payload.mutable_documents(i);
    if (util::Trim(doc->text()).empty()) {
      throw util::ValidationFailed("document " + std::to_string(i + 1) + " has no text");
    }
    if (doc->filename().empty()) {
      doc->set_filename("document_" + std::to_string(i + 1));
    }
  }
}

int64_t InfoExtractModule::Units(const v1::InfoExtractJob& payload) const {
  return payload.documents_size();
}

std::vector<InfoExtractModule::Planned> InfoExtractModule::PlanItems(const v1::InfoExtractJob& payload) const {
  std::vector<Planned> planned;
  for (int i = 0; i < payload.documents_size(); ++i) {
    Planned item;
    item.round = 1;
    item.index = static_cast<uint32_t>(i);
    *item.payload.mutable_document() = payload.documents(i);
    planned.push_back(std::move(item));
  }
  return planned;
}

llm::Request InfoExtractModule::Build(const JobView& job, const ItemView& item, const std::vector<ItemView>&,
                                      const v1::ModuleSettings& settings, const db::model::Glossary&) const {
  bool       truncated = false;
  const auto text      = util::ClipChars(util::Trim(item.payload.document().text()), kMaxDocumentChars, &truncated);

  std::string prompt = "File name: " + item.payload.document().filename() + "\n\n";
  prompt += "Extract the following fields from the paper:\n";
  for (int i = 0; i < job.payload.fields_size(); ++i) {
    const auto& field = job.payload.fields(i);
    prompt += std::to_string(i + 1) + ". " + field.name() + "\n";
    if (!field.description().empty()) {
      prompt += "   Description: " + field.description() + "\n";
    }
    prompt += "\n";
  }

  const auto guidance = util::Trim(ResolvePrompt(settings, "response_guidance"));
  if (!guidance.empty()) {
    prompt += "Output requirements:\n" + guidance + "\n\n";
  }
  if (truncated) {
    prompt += "Note: the text was truncated to its first " + std::to_string(kMaxDocumentChars) + " characters.\n\n";
  }
  prompt += "Paper text:\n\n" + text;

  llm::Request request;
  request.model = ResolveModel(job.payload.model(), settings);

  const auto system = util::Trim(ResolvePrompt(settings, "system"));
  if (!system.empty()) {
    request.messages.push_back({llm::Role::kSystem, system});
  }
  request.messages.push_back({llm::Role::kUser, std::move(prompt)});
  return request;
}

std::string InfoExtractModule::Parse(const ItemView&, const llm::Response& response) const {
  const auto object = ExtractObject(response.text);

  google::protobuf::Struct cells;
  for (const auto& [name, value] : object.fields()) {
    (*cells.mutable_fields())[name].set_string_value(ValueToCell(value));
  }
  return util::ToJson(cells);
}

std::string InfoExtractModule::Combine(const JobView& job, const std::vector<ItemView>& items, storage::ArtifactStore& store) const {
  std::string csv = CsvField("filename");
  for (const auto& field : job.payload.fields()) {
    csv += "," + CsvField(field.name());
  }
  csv += "\r\n";

  for (const auto& item : items) {
    if (item.record.status != jobmeter::model::JobStatus::kCompleted) continue;

    google::protobuf::Struct cells;
    DecodeStored(item.record.result_text, &cells, "extraction result");

    csv += CsvField(item.payload.document().filename());
    for (const auto& field : job.payload.fields()) {
      auto it = cells.fields().find(field.name());
      csv += "," + CsvField(it == cells.fields().end() ? std::string() : it->second.string_value());
    }
    csv += "\r\n";
  }

  return store.Write(Descriptor().key, job.record.id, "extraction.csv", csv);
}

} // namespace jobmeter::modules
