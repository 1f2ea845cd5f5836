#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace jobmeter::db::model {

// source_term is unique ignoring ASCII case.
struct GlossaryTermRecord {
  std::string source_term;
  std::string target_term;
  std::string notes;
  int64_t     created_at_ms = 0;
  int64_t     updated_at_ms = 0;
};

using Glossary = std::vector<GlossaryTermRecord>;

} // namespace jobmeter::db::model
