#pragma once

#include <string>
#include <utility>

namespace market::db {

/*
  Outcome of a single repository write.

  Backends translate their native error codes into ErrorCode; nothing
  above internal/db sees sqlite3 result codes. Callers that cannot
  continue on failure hand the Result to ThrowIfDbError().
*/

enum class ErrorCode {
  OK = 0,

  NotFound,            // -> util::NotFound
  Busy,                // lock not acquired in time -> util::StorageFailure
  ConstraintViolation, // -> util::StorageFailure
  InternalError,       // -> util::StorageFailure

  IOError,   // -> util::StorageFatal
  Corruption // -> util::StorageFatal
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

void ThrowIfDbError(const Result& result, const std::string& context);

} // namespace market::db
