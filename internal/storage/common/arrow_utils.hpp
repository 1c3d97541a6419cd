#pragma once

#include <arrow/result.h>
#include <arrow/status.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace upload::storage::common {

/*
  Arrow reports local I/O failures as Status; these turn them into
  exceptions of the caller's choosing, prefixed with what was attempted.
*/
template <typename Error = std::runtime_error>
void Unwrap(const arrow::Status& status, std::string_view context) {
  if (!status.ok()) {
    throw Error(std::string(context) + ": " + status.ToString());
  }
}

template <typename Error = std::runtime_error, typename T>
T Unwrap(arrow::Result<T> result, std::string_view context) {
  Unwrap<Error>(result.status(), context);
  return std::move(result).ValueUnsafe();
}

} // namespace upload::storage::common
