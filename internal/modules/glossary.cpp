#include "glossary.hpp"

#include "internal/db/api/throw_if_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace jobmeter::modules {

std::string FormatGlossary(const db::model::Glossary& glossary) {
  if (glossary.empty()) return "- (no glossary terms configured)";

  std::string out;
  for (const auto& term : glossary) {
    if (!out.empty()) out += "\n";
    out += "- " + util::Trim(term.source_term) + " = " + util::Trim(term.target_term);
  }
  return out;
}

std::string ApplyGlossary(const std::string& prompt, const db::model::Glossary& glossary) {
  const std::string placeholder(kGlossaryPlaceholder);
  const auto        terms = FormatGlossary(glossary);

  const auto pos = prompt.find(placeholder);
  if (pos == std::string::npos) {
    return util::Trim(prompt) + "\n\nGlossary:\n" + terms;
  }

  auto out = prompt;
  out.replace(pos, placeholder.size(), terms);
  return out;
}

GlossaryStore::GlossaryStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

db::model::Glossary GlossaryStore::List(db::Transaction& tx) {
  return repository_->ListGlossaryTerms(tx);
}

db::model::Glossary GlossaryStore::List() {
  auto tx       = repository_->Begin();
  auto glossary = List(*tx);
  tx->Commit();
  return glossary;
}

db::model::GlossaryTermRecord GlossaryStore::Upsert(const std::string& source_term, const std::string& target_term, const std::string& notes,
                                                    util::TimePoint now) {
  db::model::GlossaryTermRecord term;
  term.source_term   = util::Trim(source_term);
  term.target_term   = util::Trim(target_term);
  term.notes         = util::Trim(notes);
  term.created_at_ms = util::ToUnixMillis(now);
  term.updated_at_ms = term.created_at_ms;
  if (term.source_term.empty() || term.target_term.empty()) {
    throw util::ValidationFailed("glossary terms need a source and a target");
  }

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->UpsertGlossaryTerm(*tx, term), "save glossary term " + term.source_term);

  const auto key = util::LowerAscii(term.source_term);
  for (const auto& stored : repository_->ListGlossaryTerms(*tx)) {
    if (util::LowerAscii(stored.source_term) == key) term = stored;
  }
  tx->Commit();

  JOBMETER_LOG_INFO("glossary term saved", {observability::StringField("source_term", term.source_term)});
  return term;
}

void GlossaryStore::Remove(const std::string& source_term) {
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->DeleteGlossaryTerm(*tx, util::Trim(source_term)), "remove glossary term");
  tx->Commit();

  JOBMETER_LOG_INFO("glossary term removed", {observability::StringField("source_term", source_term)});
}

} // namespace jobmeter::modules
