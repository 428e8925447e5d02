#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/cache/result_cache.hpp"
#include "internal/core/graph_reader.hpp"
#include "internal/core/publication_coordinator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/graph/graph_store.hpp"
#include "internal/grpc/graph_server.hpp"
#include "internal/runtime/server.hpp"
#include "internal/service/graph_service.hpp"
#include "internal/service/service_context.hpp"
#include "depgraph/registry/v1.hpp"

namespace {

using namespace depgraph::registry::v1;

std::vector<std::unique_ptr<::grpc::Service>> BuildServices() {
  auto store = std::make_shared<depgraph::graph::GraphStore>();
  auto cache = std::make_shared<depgraph::cache::ResultCache>();

  depgraph::service::ServiceContext ctx;
  ctx.coordinator = std::make_shared<depgraph::core::PublicationCoordinator>(store, cache,
                                                                             std::make_shared<depgraph::db::memory::MemoryRepository>());
  ctx.reader      = std::make_shared<depgraph::core::GraphReader>(store, cache);

  std::vector<std::unique_ptr<::grpc::Service>> services;
  services.push_back(std::make_unique<depgraph::grpc::GraphServer>(std::make_shared<depgraph::service::GraphService>(ctx)));
  return services;
}

void TestPublishAndQueryOverLoopback() {
  depgraph::runtime::Server server("127.0.0.1:0", BuildServices());
  server.Start();
  assert(server.IsRunning());
  assert(server.SelectedPort() > 0);

  auto channel = ::grpc::CreateChannel("127.0.0.1:" + std::to_string(server.SelectedPort()), ::grpc::InsecureChannelCredentials());
  auto stub    = DependencyGraphService::NewStub(channel);

  {
    PublishRequest req;
    req.set_contract_id("wallet");
    req.set_version_label("1");
    req.mutable_interface()->set_contract_id("wallet");
    req.mutable_interface()->add_imports()->set_contract_id("math");

    PublishResponse       resp;
    ::grpc::ClientContext ctx;
    const auto            status = stub->Publish(&ctx, req, &resp);
    assert(status.ok());
    assert(resp.epoch() == 1);
  }

  {
    GetDependentsRequest req;
    req.mutable_subject()->set_contract_id("math");

    GetDependentsResponse resp;
    ::grpc::ClientContext ctx;
    const auto            status = stub->GetDependents(&ctx, req, &resp);
    assert(status.ok());
    assert(resp.dependents_size() == 1);
  }

  {
    GetStatsResponse      resp;
    ::grpc::ClientContext ctx;
    const auto            status = stub->GetStats(&ctx, GetStatsRequest{}, &resp);
    assert(status.ok());
    assert(resp.graph().epoch() == 1);
    assert(resp.graph().nodes() == 1);
  }

  server.Stop();
  assert(!server.IsRunning());
}

void TestStartTwiceIsRejected() {
  depgraph::runtime::Server server("127.0.0.1:0", BuildServices());
  server.Start();

  bool threw = false;
  try {
    server.Start();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(server.IsRunning());
}

} // namespace

int main() {
  TestPublishAndQueryOverLoopback();
  TestStartTwiceIsRejected();

  std::cout << "depgraph_unit_server_loopback: pass\n";
  return 0;
}
