#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace jobmeter::modules {

// Placeholder a translation prompt may carry for the term list.
inline constexpr const char* kGlossaryPlaceholder = "{{GLOSSARY}}";

// One "- source = target" line per term.
std::string FormatGlossary(const db::model::Glossary& glossary);

// Substitutes the term list for the placeholder, or appends it when the
// prompt has none.
std::string ApplyGlossary(const std::string& prompt, const db::model::Glossary& glossary);

/*
  Admin-managed terminology (glossary_terms). Every translation request
  built for a job sees the list as it stood when the job was claimed.
*/
class GlossaryStore {
 public:
  explicit GlossaryStore(std::shared_ptr<db::Repository> repository);

  db::model::Glossary List(db::Transaction& tx);
  db::model::Glossary List();

  // Terms are trimmed; an empty source or target throws
  // util::ValidationFailed. Replaces a term whose source matches ignoring
  // case.
  db::model::GlossaryTermRecord Upsert(const std::string& source_term, const std::string& target_term, const std::string& notes,
                                       util::TimePoint now);

  // Throws util::NotFound.
  void Remove(const std::string& source_term);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace jobmeter::modules
