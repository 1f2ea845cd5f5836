#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/core/error_status.hpp"

namespace {

using jobmeter::core::ErrorCodeName;
using jobmeter::core::ToErrorCode;
namespace v1   = jobmeter::v1;
namespace util = jobmeter::util;

void TestDomainErrorsMapToTheirCodes() {
  assert(ToErrorCode(util::NotFound("x")) == v1::ERROR_CODE_NOT_FOUND);
  assert(ToErrorCode(util::Forbidden("x")) == v1::ERROR_CODE_FORBIDDEN);
  assert(ToErrorCode(util::Gone("x")) == v1::ERROR_CODE_GONE);
  assert(ToErrorCode(util::QuotaExceeded("x")) == v1::ERROR_CODE_QUOTA_EXCEEDED);
  assert(ToErrorCode(util::ValidationFailed("x")) == v1::ERROR_CODE_VALIDATION_FAILED);
  assert(ToErrorCode(util::ProviderError("x")) == v1::ERROR_CODE_PROVIDER_ERROR);
  assert(ToErrorCode(util::ParseError("x")) == v1::ERROR_CODE_PARSE_ERROR);
  assert(ToErrorCode(util::StorageError("x")) == v1::ERROR_CODE_STORAGE_ERROR);
  assert(ToErrorCode(util::InvalidState("x")) == v1::ERROR_CODE_INVALID_STATE);
  assert(ToErrorCode(util::AlreadyExists("x")) == v1::ERROR_CODE_ALREADY_EXISTS);
}

void TestBadArgumentsAreValidationFailures() {
  assert(ToErrorCode(std::invalid_argument("limit must be >= 0")) == v1::ERROR_CODE_VALIDATION_FAILED);
}

void TestUnknownErrorsAreInternal() {
  assert(ToErrorCode(std::runtime_error("boom")) == v1::ERROR_CODE_INTERNAL);
  assert(ToErrorCode(std::out_of_range("idx")) == v1::ERROR_CODE_INTERNAL);
}

void TestCodeNamesDropPrefix() {
  assert(ErrorCodeName(v1::ERROR_CODE_QUOTA_EXCEEDED) == "QUOTA_EXCEEDED");
  assert(ErrorCodeName(v1::ERROR_CODE_GONE) == "GONE");
  assert(ErrorCodeName(v1::ERROR_CODE_INTERNAL) == "INTERNAL");
}

} // namespace

int main() {
  TestDomainErrorsMapToTheirCodes();
  TestBadArgumentsAreValidationFailures();
  TestUnknownErrorsAreInternal();
  TestCodeNamesDropPrefix();

  std::cout << "jobmeter_unit_error_status: pass\n";
  return 0;
}
