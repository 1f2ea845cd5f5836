#pragma once

#include <exception>
#include <string>

#include "api/jobmeter/v1.hpp"
#include "internal/util/errors.hpp"

namespace jobmeter::core {

/*
  Converts internal exceptions into jobmeter.errors.v1.ErrorCode for the
  outer layer.
*/

v1::ErrorCode ToErrorCode(const std::exception& e);

// "NOT_FOUND", "QUOTA_EXCEEDED", ...
std::string ErrorCodeName(v1::ErrorCode code);

} // namespace jobmeter::core
