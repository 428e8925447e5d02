#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "depgraph/registry/services/v1/dependency_graph_service.grpc.pb.h"
#include "internal/service/graph_service.hpp"
#include "depgraph/registry/v1.hpp"

namespace depgraph::grpc {

class GraphServer final : public depgraph::registry::v1::DependencyGraphService::Service {
public:
  explicit GraphServer(std::shared_ptr<depgraph::service::GraphService> svc);

  ::grpc::Status Publish(::grpc::ServerContext*,
                         const depgraph::registry::v1::PublishRequest*,
                         depgraph::registry::v1::PublishResponse*) override;

  ::grpc::Status GetDependencies(::grpc::ServerContext*,
                                 const depgraph::registry::v1::GetDependenciesRequest*,
                                 depgraph::registry::v1::GetDependenciesResponse*) override;

  ::grpc::Status GetDependents(::grpc::ServerContext*,
                               const depgraph::registry::v1::GetDependentsRequest*,
                               depgraph::registry::v1::GetDependentsResponse*) override;

  ::grpc::Status GetImpact(::grpc::ServerContext*,
                           const depgraph::registry::v1::GetImpactRequest*,
                           depgraph::registry::v1::GetImpactResponse*) override;

  ::grpc::Status ExportGraph(::grpc::ServerContext*,
                             const depgraph::registry::v1::ExportGraphRequest*,
                             depgraph::registry::v1::ExportGraphResponse*) override;

  ::grpc::Status GetDependencyTree(::grpc::ServerContext*,
                                   const depgraph::registry::v1::GetDependencyTreeRequest*,
                                   depgraph::registry::v1::GetDependencyTreeResponse*) override;

  ::grpc::Status ListVersions(::grpc::ServerContext*,
                              const depgraph::registry::v1::ListVersionsRequest*,
                              depgraph::registry::v1::ListVersionsResponse*) override;

  ::grpc::Status GetStats(::grpc::ServerContext*,
                          const depgraph::registry::v1::GetStatsRequest*,
                          depgraph::registry::v1::GetStatsResponse*) override;

private:
  template <typename Req, typename Resp, typename Method>
  ::grpc::Status Invoke(Method method, const Req* req, Resp* resp);

  std::shared_ptr<depgraph::service::GraphService> service_;
};

}
