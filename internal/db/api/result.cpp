#include "result.hpp"

#include "internal/util/errors.hpp"

namespace market::db {

void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::IOError:
    case ErrorCode::Corruption:
      throw util::StorageFatal(message);
    default:
      throw util::StorageFailure(message);
  }
}

} // namespace market::db
