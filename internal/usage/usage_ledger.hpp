#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace jobmeter::usage {

/*
  Append-only usage log.

  Record() never rejects: admission is decided by QuotaPolicy before a
  job exists. Negative amounts are clamped to zero.
*/
class UsageLedger {
 public:
  explicit UsageLedger(std::shared_ptr<db::Repository> repository);

  // Appends inside the caller's transaction.
  void Record(db::Transaction& tx, const std::string& user_id, const std::string& module, int64_t tokens, int64_t units, util::TimePoint now);

  // Opens and commits its own transaction.
  void Record(const std::string& user_id, const std::string& module, int64_t tokens, int64_t units, util::TimePoint now);

  int64_t TokensSince(db::Transaction& tx, const std::string& user_id, util::TimePoint since);
  int64_t Units(db::Transaction& tx, const std::string& user_id, const std::string& module);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace jobmeter::usage
