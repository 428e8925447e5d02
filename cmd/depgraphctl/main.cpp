#include <grpcpp/grpcpp.h>
#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#include "depgraph/registry/services/v1/dependency_graph_service.grpc.pb.h"
#include "depgraph/registry/v1.hpp"

using namespace depgraph::registry::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  depgraphctl <addr> publish <contract_id> <version_label> <interface.json>\n"
            << "  depgraphctl <addr> deps <contract@version>\n"
            << "  depgraphctl <addr> dependents <contract | contract@version>\n"
            << "  depgraphctl <addr> impact <contract@version>\n"
            << "  depgraphctl <addr> export\n"
            << "  depgraphctl <addr> tree <contract@version> [max_depth]\n"
            << "  depgraphctl <addr> versions <contract_id>\n"
            << "  depgraphctl <addr> stats\n";
}

// "contract@version" splits at the last '@'; no '@' leaves the label empty.
static VersionRef ParseRef(const std::string& s) {
  VersionRef ref;
  const auto at = s.rfind('@');
  if (at == std::string::npos) {
    ref.set_contract_id(s);
    return ref;
  }
  ref.set_contract_id(s.substr(0, at));
  ref.set_version_label(s.substr(at + 1));
  return ref;
}

static std::optional<VersionRef> ParseVersionRef(const std::string& s) {
  auto ref = ParseRef(s);
  if (ref.contract_id().empty() || ref.version_label().empty()) {
    std::cerr << "expected <contract@version>, got '" << s << "'\n";
    return std::nullopt;
  }
  return ref;
}

static std::string NodeName(const VersionRef& ref) {
  return ref.contract_id() + "@" + ref.version_label();
}

static std::string KindName(ReferenceKind kind) {
  switch (kind) {
    case REFERENCE_KIND_INTERFACE:
      return "interface";
    case REFERENCE_KIND_CLIENT:
      return "client";
    case REFERENCE_KIND_IMPORT:
      return "import";
    default:
      return "unspecified";
  }
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

static void PrintTree(const google::protobuf::RepeatedPtrField<DependencyTreeNode>& nodes, const std::string& prefix) {
  for (int i = 0; i < nodes.size(); ++i) {
    const auto& node = nodes.Get(i);
    const bool  last = i + 1 == nodes.size();

    std::cout << prefix << (last ? "└── " : "├── ");
    if (node.resolved()) {
      std::cout << node.contract_id() << "@" << node.version_label();
    } else {
      std::cout << node.contract_id() << " [Unresolved]";
    }
    std::cout << " (" << KindName(node.kind()) << ")";
    if (node.expanded_elsewhere()) {
      std::cout << " [see above]";
    }
    std::cout << "\n";

    PrintTree(node.dependencies(), prefix + (last ? "    " : "│   "));
  }
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = DependencyGraphService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "publish") {
    if (argc < 6) return 1;

    std::ifstream in(argv[5]);
    if (!in) {
      std::cerr << "cannot read " << argv[5] << "\n";
      return 1;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    PublishRequest req;
    req.set_contract_id(argv[3]);
    req.set_version_label(argv[4]);

    auto parsed = google::protobuf::util::JsonStringToMessage(buffer.str(), req.mutable_interface());
    if (!parsed.ok()) {
      std::cerr << "invalid interface document: " << std::string(parsed.message()) << "\n";
      return 1;
    }

    PublishResponse resp;
    auto            status = stub->Publish(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "published " << NodeName(resp.version().ref()) << " epoch=" << resp.epoch() << "\n";
    for (const auto& edge : resp.edges()) {
      std::cout << "  " << KindName(edge.kind()) << " -> " << edge.to_contract_id() << (edge.target_resolved() ? "" : " [Unresolved]")
                << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "deps") {
    if (argc < 4) return 1;
    auto ref = ParseVersionRef(argv[3]);
    if (!ref) return 1;

    GetDependenciesRequest req;
    *req.mutable_version() = *ref;

    GetDependenciesResponse resp;
    auto                    status = stub->GetDependencies(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& edge : resp.edges()) {
      std::cout << KindName(edge.kind()) << " " << edge.to_contract_id() << (edge.target_resolved() ? "" : " [Unresolved]") << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "dependents") {
    if (argc < 4) return 1;

    GetDependentsRequest req;
    *req.mutable_subject() = ParseRef(argv[3]);

    GetDependentsResponse resp;
    auto                  status = stub->GetDependents(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& dependent : resp.dependents()) {
      std::cout << NodeName(dependent.from()) << " (" << KindName(dependent.kind()) << ")\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "impact") {
    if (argc < 4) return 1;
    auto ref = ParseVersionRef(argv[3]);
    if (!ref) return 1;

    GetImpactRequest req;
    *req.mutable_version() = *ref;

    GetImpactResponse resp;
    auto              status = stub->GetImpact(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& entry : resp.affected()) {
      std::cout << entry.depth() << " " << NodeName(entry.version()) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "export") {
    ExportGraphRequest  req;
    ExportGraphResponse resp;
    auto                status = stub->ExportGraph(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::string                                json;
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    auto printed           = google::protobuf::util::MessageToJsonString(resp, &json, options);
    if (!printed.ok()) {
      std::cerr << std::string(printed.message()) << "\n";
      return 2;
    }
    std::cout << json << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "tree") {
    if (argc < 4) return 1;
    auto ref = ParseVersionRef(argv[3]);
    if (!ref) return 1;

    GetDependencyTreeRequest req;
    *req.mutable_version() = *ref;
    req.set_max_depth(argc >= 5 ? static_cast<uint32_t>(std::stoul(argv[4])) : 0);

    GetDependencyTreeResponse resp;
    auto                      status = stub->GetDependencyTree(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << NodeName(resp.root()) << "\n";
    PrintTree(resp.dependencies(), "");
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "versions") {
    if (argc < 4) return 1;

    ListVersionsRequest req;
    req.set_contract_id(argv[3]);

    ListVersionsResponse resp;
    auto                 status = stub->ListVersions(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& version : resp.versions()) {
      std::cout << version.ref().version_label() << " " << version.interface_hash() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    GetStatsRequest  req;
    GetStatsResponse resp;

    auto status = stub->GetStats(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    const auto& graph = resp.graph();
    const auto& cache = resp.cache();
    std::cout << "epoch=" << graph.epoch() << "\n";
    std::cout << "nodes=" << graph.nodes() << "\n";
    std::cout << "edges=" << graph.edges() << "\n";
    std::cout << "contracts=" << graph.contracts() << "\n";
    std::cout << "cache.enabled=" << (cache.enabled() ? "true" : "false") << "\n";
    std::cout << "cache.entries=" << cache.entries() << "\n";
    std::cout << "cache.hits=" << cache.hits() << "\n";
    std::cout << "cache.misses=" << cache.misses() << "\n";
    std::cout << "cache.stale_evictions=" << cache.stale_evictions() << "\n";
    std::cout << "cache.hit_rate_percent=" << cache.hit_rate_percent() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
