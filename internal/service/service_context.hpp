#pragma once

#include <memory>

namespace depgraph::core { class PublicationCoordinator; class GraphReader; }

namespace depgraph::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<depgraph::core::PublicationCoordinator> coordinator;
  std::shared_ptr<depgraph::core::GraphReader> reader;
};

}
