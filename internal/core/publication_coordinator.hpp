#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "depgraph/registry/core/v1/interface.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/model/contract_version.hpp"
#include "internal/query/query_types.hpp"

namespace depgraph::graph {
class GraphStore;
}
namespace depgraph::cache {
class ResultCache;
}

namespace depgraph::core {

struct PublishResult {
  std::uint64_t                      epoch = 0;
  model::ContractVersion             version;
  std::vector<query::DependencyEdge> edges;
};

/*
  PublicationCoordinator

  The only writer of the graph. One publish at a time:

    extract -> build candidate -> append to log -> swap -> invalidate cache

  Any failure before the swap leaves the graph, the log and the cache as
  they were. Errors are thrown as util::MalformedInterface,
  util::DuplicateVersion or util::CycleDetected; repository failures are
  mapped through the db ErrorCode.
*/
class PublicationCoordinator {
 public:
  PublicationCoordinator(std::shared_ptr<graph::GraphStore> store, std::shared_ptr<cache::ResultCache> cache,
                         std::shared_ptr<db::Repository> repository);

  PublishResult Publish(const std::string& contract_id, const std::string& version_label,
                        const depgraph::registry::core::v1::InterfaceDescription& description);

  // Rebuilds the graph from the publication log. Only valid on an empty graph.
  // Returns the number of publications replayed.
  std::size_t Hydrate();

 private:
  std::shared_ptr<graph::GraphStore>  store_;
  std::shared_ptr<cache::ResultCache> cache_;
  std::shared_ptr<db::Repository>     repository_;

  std::mutex publish_mutex_;
};

} // namespace depgraph::core
