#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace depgraph::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace depgraph::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  // DuplicateVersion lands here too
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const MalformedInterface*>(&e) || dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  // the cycle path is part of the message; error_details is reserved for a
  // serialized google.rpc.Status
  if (dynamic_cast<const CycleDetected*>(&e) || dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace depgraph::grpc
