#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace market::grpc {

/*
  Status returned to query clients for an exception escaping a
  QueryService call:

    NotFound         NOT_FOUND
    InvalidArgument  INVALID_ARGUMENT
    InvalidState     FAILED_PRECONDITION
    ConfigMismatch   FAILED_PRECONDITION
    RemoteFailure    UNAVAILABLE
    StorageFailure   UNAVAILABLE (retryable)
    anything else    INTERNAL
*/
::grpc::Status ToStatus(const std::exception& e);

} // namespace market::grpc
