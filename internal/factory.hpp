#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace depgraph::db { class Repository; }
namespace depgraph::core { class PublicationCoordinator; class GraphReader; }
namespace depgraph::service { class GraphService; }

namespace depgraph::factory {

/*
  Application

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>               repository;
  std::shared_ptr<core::PublicationCoordinator> coordinator;
  std::shared_ptr<core::GraphReader>            reader;
  std::shared_ptr<service::GraphService>        graph_service;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Composition root: the ONLY place allowed to know concrete DB types.

  The graph is hydrated from the configured publication log before
  this returns.
*/
Application Build(const depgraph::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const depgraph::runtime::config::RuntimeConfig& config);

} // namespace depgraph::factory
