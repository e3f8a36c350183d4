#pragma once

#include <optional>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace datarouter::service {

struct OperationStatus {
  util::ErrorKind kind = util::ErrorKind::kOk;
  std::string     message;

  bool ok() const {
    return kind == util::ErrorKind::kOk;
  }
};

/*
  Structured outcome of a service call. value is set iff status.ok().
*/
template <typename T>
struct OperationResult {
  OperationStatus  status;
  std::optional<T> value;

  bool ok() const {
    return status.ok();
  }

  static OperationResult Ok(T v) {
    OperationResult r;
    r.value = std::move(v);
    return r;
  }

  static OperationResult Fail(util::ErrorKind kind, std::string message) {
    OperationResult r;
    r.status.kind    = kind;
    r.status.message = std::move(message);
    return r;
  }
};

} // namespace datarouter::service
