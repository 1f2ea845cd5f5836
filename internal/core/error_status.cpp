#include "error_status.hpp"

namespace jobmeter::core {

v1::ErrorCode ToErrorCode(const std::exception& e) {
  using namespace jobmeter::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return v1::ERROR_CODE_NOT_FOUND;
  }
  if (dynamic_cast<const Forbidden*>(&e)) {
    return v1::ERROR_CODE_FORBIDDEN;
  }
  if (dynamic_cast<const Gone*>(&e)) {
    return v1::ERROR_CODE_GONE;
  }
  if (dynamic_cast<const QuotaExceeded*>(&e)) {
    return v1::ERROR_CODE_QUOTA_EXCEEDED;
  }
  if (dynamic_cast<const ValidationFailed*>(&e) || dynamic_cast<const std::invalid_argument*>(&e)) {
    return v1::ERROR_CODE_VALIDATION_FAILED;
  }
  if (dynamic_cast<const ProviderError*>(&e)) {
    return v1::ERROR_CODE_PROVIDER_ERROR;
  }
  if (dynamic_cast<const ParseError*>(&e)) {
    return v1::ERROR_CODE_PARSE_ERROR;
  }
  if (dynamic_cast<const StorageError*>(&e)) {
    return v1::ERROR_CODE_STORAGE_ERROR;
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return v1::ERROR_CODE_INVALID_STATE;
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return v1::ERROR_CODE_ALREADY_EXISTS;
  }

  return v1::ERROR_CODE_INTERNAL;
}

std::string ErrorCodeName(v1::ErrorCode code) {
  const auto& name = v1::ErrorCode_Name(code);
  static const std::string kPrefix = "ERROR_CODE_";
  return name.rfind(kPrefix, 0) == 0 ? name.substr(kPrefix.size()) : name;
}

} // namespace jobmeter::core
