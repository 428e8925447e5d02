#pragma once

#include "depgraph/registry/core/v1/interface.pb.h"
#include "depgraph/registry/core/v1/types.pb.h"

#include "depgraph/registry/services/v1/dependency_graph_service.pb.h"

#include "depgraph/registry/services/v1/dependency_graph_service.grpc.pb.h"

namespace depgraph::registry::v1 {
using namespace ::depgraph::registry::core::v1;
using namespace ::depgraph::registry::services::v1;
}
