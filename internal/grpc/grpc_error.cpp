#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace market::grpc {

namespace {

template <typename Error>
bool Is(const std::exception& e) {
  return dynamic_cast<const Error*>(&e) != nullptr;
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  using namespace market::util;

  if (Is<NotFound>(e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (Is<InvalidArgument>(e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (Is<InvalidState>(e) || Is<ConfigMismatch>(e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (Is<RemoteFailure>(e) || Is<StorageFailure>(e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace market::grpc
