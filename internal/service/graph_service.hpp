#pragma once

#include "depgraph/registry/services/v1/dependency_graph_service.pb.h"
#include "service_context.hpp"
#include "depgraph/registry/v1.hpp"

namespace depgraph::service {

/*
  Protocol-level facade over the coordinator and the reader.

  Validates request shape, converts between wire and internal types and
  records per-route spans, metrics and failure logs. Errors propagate as
  util exceptions for the transport adapter to translate.
*/
class GraphService {
public:
  explicit GraphService(ServiceContext ctx);

  depgraph::registry::v1::PublishResponse
  Publish(const depgraph::registry::v1::PublishRequest& req);

  depgraph::registry::v1::GetDependenciesResponse
  GetDependencies(const depgraph::registry::v1::GetDependenciesRequest& req);

  depgraph::registry::v1::GetDependentsResponse
  GetDependents(const depgraph::registry::v1::GetDependentsRequest& req);

  depgraph::registry::v1::GetImpactResponse
  GetImpact(const depgraph::registry::v1::GetImpactRequest& req);

  depgraph::registry::v1::ExportGraphResponse
  ExportGraph(const depgraph::registry::v1::ExportGraphRequest& req);

  depgraph::registry::v1::GetDependencyTreeResponse
  GetDependencyTree(const depgraph::registry::v1::GetDependencyTreeRequest& req);

  depgraph::registry::v1::ListVersionsResponse
  ListVersions(const depgraph::registry::v1::ListVersionsRequest& req);

  depgraph::registry::v1::GetStatsResponse
  GetStats(const depgraph::registry::v1::GetStatsRequest& req);

private:
  ServiceContext ctx_;
};

}
