#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace foreman::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace foreman::grpc
