#include "graph_service.hpp"

#include <chrono>
#include <string>
#include <type_traits>

#include "internal/core/graph_reader.hpp"
#include "internal/core/publication_coordinator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace depgraph::service {

using namespace depgraph::registry::v1;

namespace {

std::string Describe(const VersionRef* ref) {
  if (!ref) {
    return "";
  }
  return ref->version_label().empty() ? ref->contract_id() : ref->contract_id() + "@" + ref->version_label();
}

template <typename Fn>
auto ObserveRpc(std::string_view route, const VersionRef* subject, Fn&& fn) {
  depgraph::observability::SpanScope span(route);
  if (subject) {
    span.SetAttribute("contract.id", subject->contract_id());
    span.SetAttribute("contract.version", subject->version_label());
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    auto result = fn();
    depgraph::observability::Metrics::Instance().RecordRequest(route, true);
    depgraph::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    DEPGRAPH_LOG_ERROR("RPC failed", {depgraph::observability::StringField("route", route),
                                      depgraph::observability::StringField("error", ex.what()),
                                      depgraph::observability::StringField("subject", Describe(subject))});
    depgraph::observability::Metrics::Instance().RecordRequest(route, false);
    depgraph::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

model::VersionKey RequireVersion(const VersionRef& ref, const char* what) {
  if (ref.contract_id().empty() || ref.version_label().empty()) {
    throw util::InvalidArgument(std::string(what) + ": contract_id and version_label are required");
  }
  return {ref.contract_id(), ref.version_label()};
}

ReferenceKind ToProto(model::ReferenceKind kind) {
  return static_cast<ReferenceKind>(static_cast<int>(kind));
}

void ToProto(const model::VersionKey& key, VersionRef* out) {
  out->set_contract_id(key.contract_id);
  out->set_version_label(key.version_label);
}

void ToProto(const model::ContractVersion& version, ContractVersion* out) {
  ToProto(version.key, out->mutable_ref());
  out->set_interface_hash(version.interface_hash);
}

void ToProto(const query::DependencyEdge& edge, DependencyEdge* out) {
  ToProto(edge.from, out->mutable_from());
  out->set_to_contract_id(edge.to_contract_id);
  out->set_kind(ToProto(edge.kind));
  out->set_target_resolved(edge.target_resolved);
}

void ToProto(const query::DependencyTreeNode& node, DependencyTreeNode* out) {
  out->set_contract_id(node.contract_id);
  out->set_version_label(node.version_label);
  out->set_kind(ToProto(node.kind));
  out->set_resolved(node.resolved);
  out->set_expanded_elsewhere(node.repeated);
  for (const auto& child : node.dependencies) {
    ToProto(child, out->add_dependencies());
  }
}

} // namespace

GraphService::GraphService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

PublishResponse GraphService::Publish(const PublishRequest& req) {
  VersionRef subject;
  subject.set_contract_id(req.contract_id());
  subject.set_version_label(req.version_label());

  return ObserveRpc("DependencyGraphService.Publish", &subject, [&] {
    if (!req.has_interface()) {
      throw util::MalformedInterface("publish " + Describe(&subject) + ": interface description is required");
    }

    auto result = ctx_.coordinator->Publish(req.contract_id(), req.version_label(), req.interface());

    PublishResponse resp;
    resp.set_epoch(result.epoch);
    ToProto(result.version, resp.mutable_version());
    for (const auto& edge : result.edges) {
      ToProto(edge, resp.add_edges());
    }
    return resp;
  });
}

GetDependenciesResponse GraphService::GetDependencies(const GetDependenciesRequest& req) {
  return ObserveRpc("DependencyGraphService.GetDependencies", &req.version(), [&] {
    auto result = ctx_.reader->Dependencies(RequireVersion(req.version(), "dependencies"));

    GetDependenciesResponse resp;
    resp.set_epoch(result.epoch);
    for (const auto& edge : result.value) {
      ToProto(edge, resp.add_edges());
    }
    return resp;
  });
}

GetDependentsResponse GraphService::GetDependents(const GetDependentsRequest& req) {
  return ObserveRpc("DependencyGraphService.GetDependents", &req.subject(), [&] {
    const auto& subject = req.subject();
    if (subject.contract_id().empty()) {
      throw util::InvalidArgument("dependents: contract_id is required");
    }

    auto result = subject.version_label().empty() ? ctx_.reader->Dependents(subject.contract_id())
                                                  : ctx_.reader->Dependents(model::VersionKey{subject.contract_id(), subject.version_label()});

    GetDependentsResponse resp;
    resp.set_epoch(result.epoch);
    for (const auto& dependent : result.value) {
      auto* out = resp.add_dependents();
      ToProto(dependent.from, out->mutable_from());
      out->set_kind(ToProto(dependent.kind));
    }
    return resp;
  });
}

GetImpactResponse GraphService::GetImpact(const GetImpactRequest& req) {
  return ObserveRpc("DependencyGraphService.GetImpact", &req.version(), [&] {
    auto result = ctx_.reader->Impact(RequireVersion(req.version(), "impact"));

    GetImpactResponse resp;
    resp.set_epoch(result.epoch);
    for (const auto& entry : result.value) {
      auto* out = resp.add_affected();
      ToProto(entry.version, out->mutable_version());
      out->set_depth(entry.depth);
    }
    return resp;
  });
}

ExportGraphResponse GraphService::ExportGraph(const ExportGraphRequest&) {
  return ObserveRpc("DependencyGraphService.ExportGraph", nullptr, [&] {
    auto graph = ctx_.reader->Export();

    ExportGraphResponse resp;
    resp.set_epoch(graph.epoch);
    for (const auto& node : graph.nodes) {
      auto* out = resp.add_nodes();
      out->set_id(node.id);
      out->set_contract_id(node.contract_id);
      out->set_version_label(node.version_label);
    }
    for (const auto& edge : graph.edges) {
      auto* out = resp.add_edges();
      out->set_from(edge.from);
      out->set_to(edge.to);
      out->set_kind(ToProto(edge.kind));
    }
    return resp;
  });
}

GetDependencyTreeResponse GraphService::GetDependencyTree(const GetDependencyTreeRequest& req) {
  return ObserveRpc("DependencyGraphService.GetDependencyTree", &req.version(), [&] {
    const auto root   = RequireVersion(req.version(), "dependency tree");
    auto       result = ctx_.reader->DependencyTree(root, req.max_depth());

    GetDependencyTreeResponse resp;
    resp.set_epoch(result.epoch);
    ToProto(root, resp.mutable_root());
    for (const auto& node : result.value) {
      ToProto(node, resp.add_dependencies());
    }
    return resp;
  });
}

ListVersionsResponse GraphService::ListVersions(const ListVersionsRequest& req) {
  VersionRef subject;
  subject.set_contract_id(req.contract_id());

  return ObserveRpc("DependencyGraphService.ListVersions", &subject, [&] {
    if (req.contract_id().empty()) {
      throw util::InvalidArgument("versions: contract_id is required");
    }

    auto result = ctx_.reader->ListVersions(req.contract_id());

    ListVersionsResponse resp;
    resp.set_epoch(result.epoch);
    for (const auto& version : result.value) {
      ToProto(version, resp.add_versions());
    }
    return resp;
  });
}

GetStatsResponse GraphService::GetStats(const GetStatsRequest&) {
  return ObserveRpc("DependencyGraphService.GetStats", nullptr, [&] {
    const auto graph = ctx_.reader->Stats();
    const auto cache = ctx_.reader->CacheStats();

    GetStatsResponse resp;
    auto*            graph_out = resp.mutable_graph();
    graph_out->set_epoch(graph.epoch);
    graph_out->set_nodes(graph.nodes);
    graph_out->set_edges(graph.edges);
    graph_out->set_contracts(graph.contracts);

    auto* cache_out = resp.mutable_cache();
    cache_out->set_enabled(cache.enabled);
    cache_out->set_epoch(cache.epoch);
    cache_out->set_entries(cache.entries);
    cache_out->set_max_entries(cache.max_entries);
    cache_out->set_hits(cache.hits);
    cache_out->set_misses(cache.misses);
    cache_out->set_stale_evictions(cache.stale_evictions);
    cache_out->set_hit_rate_percent(cache.HitRatePercent());
    return resp;
  });
}

} // namespace depgraph::service
