#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace jobhub::grpc {

/*
  Converts internal exceptions into gRPC status codes.

    NotFound                       -> NOT_FOUND
    AlreadyExists                  -> ALREADY_EXISTS
    Conflict                       -> ABORTED
    InvalidConfig, InvalidRequest  -> INVALID_ARGUMENT
    anything else                  -> INTERNAL
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace jobhub::grpc
