#include "graph_server.hpp"
#include "grpc_error.hpp"

namespace depgraph::grpc {

using namespace depgraph::registry::v1;

GraphServer::GraphServer(std::shared_ptr<depgraph::service::GraphService> svc)
    : service_(std::move(svc)) {}

template <typename Req, typename Resp, typename Method>
::grpc::Status GraphServer::Invoke(Method method, const Req* req, Resp* resp) {
  try {
    *resp = ((*service_).*method)(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GraphServer::Publish(::grpc::ServerContext*, const PublishRequest* req, PublishResponse* resp) {
  return Invoke(&service::GraphService::Publish, req, resp);
}

::grpc::Status GraphServer::GetDependencies(::grpc::ServerContext*, const GetDependenciesRequest* req,
                                            GetDependenciesResponse* resp) {
  return Invoke(&service::GraphService::GetDependencies, req, resp);
}

::grpc::Status GraphServer::GetDependents(::grpc::ServerContext*, const GetDependentsRequest* req,
                                          GetDependentsResponse* resp) {
  return Invoke(&service::GraphService::GetDependents, req, resp);
}

::grpc::Status GraphServer::GetImpact(::grpc::ServerContext*, const GetImpactRequest* req, GetImpactResponse* resp) {
  return Invoke(&service::GraphService::GetImpact, req, resp);
}

::grpc::Status GraphServer::ExportGraph(::grpc::ServerContext*, const ExportGraphRequest* req, ExportGraphResponse* resp) {
  return Invoke(&service::GraphService::ExportGraph, req, resp);
}

::grpc::Status GraphServer::GetDependencyTree(::grpc::ServerContext*, const GetDependencyTreeRequest* req,
                                              GetDependencyTreeResponse* resp) {
  return Invoke(&service::GraphService::GetDependencyTree, req, resp);
}

::grpc::Status GraphServer::ListVersions(::grpc::ServerContext*, const ListVersionsRequest* req, ListVersionsResponse* resp) {
  return Invoke(&service::GraphService::ListVersions, req, resp);
}

::grpc::Status GraphServer::GetStats(::grpc::ServerContext*, const GetStatsRequest* req, GetStatsResponse* resp) {
  return Invoke(&service::GraphService::GetStats, req, resp);
}

}
