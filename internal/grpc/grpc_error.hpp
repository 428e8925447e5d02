#pragma once

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace depgraph::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  CycleDetected maps to FAILED_PRECONDITION; its message already renders the
  path as "a@1 -> b@1 -> a@1".
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace depgraph::grpc
