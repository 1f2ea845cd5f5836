#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace jobmeter::db {

// Converts a non-OK repository result into the matching util exception.
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw jobmeter::util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw jobmeter::util::NotFound(message);
    case ErrorCode::Conflict:
    case ErrorCode::ConstraintViolation:
      throw jobmeter::util::InvalidState(message);
    case ErrorCode::IOError:
    case ErrorCode::Corruption:
      throw jobmeter::util::StorageError(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace jobmeter::db
