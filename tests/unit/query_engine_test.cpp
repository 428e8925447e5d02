#include "internal/query/query_engine.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/graph/graph_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using depgraph::graph::GraphStore;
using depgraph::model::ContractVersion;
using depgraph::model::Reference;
using depgraph::model::ReferenceKind;
using depgraph::model::VersionKey;
using depgraph::query::DependencyEdge;
using depgraph::query::Dependent;
using depgraph::query::ImpactEntry;
using depgraph::query::QueryEngine;

void Publish(GraphStore& store, const std::string& contract, const std::string& label, std::vector<Reference> refs = {}) {
  store.CommitNewVersion(ContractVersion{VersionKey{contract, label}, "h-" + contract + label}, refs);
}

// A <- B (client) <- C (import)
void BuildChain(GraphStore& store) {
  Publish(store, "A", "1");
  Publish(store, "B", "1", {{"A", ReferenceKind::kClient}});
  Publish(store, "C", "1", {{"B", ReferenceKind::kImport}});
}

template <typename Fn>
bool ThrowsNotFound(Fn&& fn) {
  try {
    fn();
  } catch (const depgraph::util::NotFound&) {
    return true;
  }
  return false;
}

void TestDirectDependentsAndImpact() {
  GraphStore store;
  BuildChain(store);
  const auto snapshot = store.Current();

  const auto dependents = QueryEngine::Dependents(*snapshot, std::string("A"));
  assert((dependents == std::vector<Dependent>{{VersionKey{"B", "1"}, ReferenceKind::kClient}}));

  const auto impact = QueryEngine::ImpactAnalysis(*snapshot, VersionKey{"A", "1"});
  assert((impact == std::vector<ImpactEntry>{{VersionKey{"B", "1"}, 1}, {VersionKey{"C", "1"}, 2}}));

  assert(QueryEngine::ImpactAnalysis(*snapshot, VersionKey{"C", "1"}).empty());
}

void TestDependenciesOrderedByKindThenTarget() {
  GraphStore store;
  Publish(store, "z", "1");
  Publish(store, "D", "1",
          {{"z", ReferenceKind::kImport}, {"y", ReferenceKind::kClient}, {"x", ReferenceKind::kInterface}, {"a", ReferenceKind::kImport}});

  const auto snapshot = store.Current();
  const auto edges    = QueryEngine::Dependencies(*snapshot, VersionKey{"D", "1"});

  const VersionKey                  d{"D", "1"};
  const std::vector<DependencyEdge> expected{
      {d, "x", ReferenceKind::kInterface, false},
      {d, "y", ReferenceKind::kClient, false},
      {d, "a", ReferenceKind::kImport, false},
      {d, "z", ReferenceKind::kImport, true},
  };
  assert(edges == expected);
  assert(QueryEngine::Dependencies(*snapshot, VersionKey{"z", "1"}).empty());
}

void TestReferencedOnlyContractHasDependents() {
  GraphStore store;
  Publish(store, "wallet", "1", {{"oracle", ReferenceKind::kClient}});
  Publish(store, "bank", "1", {{"oracle", ReferenceKind::kImport}});

  const auto snapshot   = store.Current();
  const auto dependents = QueryEngine::Dependents(*snapshot, std::string("oracle"));

  const std::vector<Dependent> expected{
      {VersionKey{"bank", "1"}, ReferenceKind::kImport},
      {VersionKey{"wallet", "1"}, ReferenceKind::kClient},
  };
  assert(dependents == expected);

  assert(ThrowsNotFound([&] { QueryEngine::ListVersions(*snapshot, "oracle"); }));
  assert(ThrowsNotFound([&] { QueryEngine::Dependents(*snapshot, VersionKey{"oracle", "1"}); }));
}

void TestUnknownSubjectsAreNotFound() {
  GraphStore store;
  BuildChain(store);
  const auto snapshot = store.Current();

  assert(ThrowsNotFound([&] { QueryEngine::Dependents(*snapshot, std::string("nothing")); }));
  assert(ThrowsNotFound([&] { QueryEngine::Dependencies(*snapshot, VersionKey{"A", "9"}); }));
  assert(ThrowsNotFound([&] { QueryEngine::ImpactAnalysis(*snapshot, VersionKey{"nothing", "1"}); }));
  assert(ThrowsNotFound([&] { QueryEngine::DependencyTree(*snapshot, VersionKey{"nothing", "1"}, 4); }));
  assert(ThrowsNotFound([&] { QueryEngine::ListVersions(*snapshot, "nothing"); }));
}

void TestEdgesReachEveryVersionOfTarget() {
  GraphStore store;
  BuildChain(store);
  Publish(store, "A", "2");

  const auto snapshot = store.Current();

  const auto impact = QueryEngine::ImpactAnalysis(*snapshot, VersionKey{"A", "2"});
  assert((impact == std::vector<ImpactEntry>{{VersionKey{"B", "1"}, 1}, {VersionKey{"C", "1"}, 2}}));

  const auto dependents = QueryEngine::Dependents(*snapshot, VersionKey{"A", "2"});
  assert(dependents.size() == 1);
  assert(dependents[0].from == (VersionKey{"B", "1"}));
}

void TestImpactUsesMinimumDepth() {
  GraphStore store;
  Publish(store, "base", "1");
  Publish(store, "mid", "1", {{"base", ReferenceKind::kImport}});
  Publish(store, "top", "1", {{"mid", ReferenceKind::kImport}, {"base", ReferenceKind::kClient}});

  const auto impact = QueryEngine::ImpactAnalysis(*store.Current(), VersionKey{"base", "1"});
  assert((impact == std::vector<ImpactEntry>{{VersionKey{"mid", "1"}, 1}, {VersionKey{"top", "1"}, 1}}));
}

void TestExportKeepsInsertionOrder() {
  GraphStore store;
  BuildChain(store);
  const auto snapshot = store.Current();
  const auto exported = QueryEngine::ExportGraph(*snapshot);

  assert(exported.epoch == 3);
  assert(exported.nodes.size() == 3);
  assert(exported.nodes[0].id == "A@1");
  assert(exported.nodes[1].id == "B@1");
  assert(exported.nodes[2].id == "C@1");
  assert(exported.nodes[2].contract_id == "C");
  assert(exported.nodes[2].version_label == "1");

  assert(exported.edges.size() == 2);
  assert(exported.edges[0].from == "B@1");
  assert(exported.edges[0].to == "A");
  assert(exported.edges[0].kind == ReferenceKind::kClient);
  assert(exported.edges[1].from == "C@1");
  assert(exported.edges[1].to == "B");

  assert(QueryEngine::ExportGraph(*snapshot) == exported);
}

void TestDependencyTreeFollowsLatestVersions() {
  GraphStore store;
  BuildChain(store);
  Publish(store, "A", "2", {{"ghost", ReferenceKind::kImport}});

  const auto snapshot = store.Current();

  const auto tree = QueryEngine::DependencyTree(*snapshot, VersionKey{"C", "1"}, 16);
  assert(tree.size() == 1);
  assert(tree[0].contract_id == "B");
  assert(tree[0].resolved);
  assert(tree[0].version_label == "1");
  assert(tree[0].dependencies.size() == 1);

  const auto& a = tree[0].dependencies[0];
  assert(a.contract_id == "A");
  assert(a.version_label == "2");
  assert(a.kind == ReferenceKind::kClient);
  assert(a.dependencies.size() == 1);
  assert(a.dependencies[0].contract_id == "ghost");
  assert(!a.dependencies[0].resolved);
  assert(a.dependencies[0].version_label.empty());
  assert(a.dependencies[0].dependencies.empty());
}

void TestDependencyTreeDepthBound() {
  GraphStore store;
  BuildChain(store);
  const auto snapshot = store.Current();

  assert(QueryEngine::DependencyTree(*snapshot, VersionKey{"C", "1"}, 0).empty());

  const auto shallow = QueryEngine::DependencyTree(*snapshot, VersionKey{"C", "1"}, 1);
  assert(shallow.size() == 1);
  assert(shallow[0].resolved);
  assert(shallow[0].dependencies.empty());

  const auto two = QueryEngine::DependencyTree(*snapshot, VersionKey{"C", "1"}, 2);
  assert(two[0].dependencies.size() == 1);
  assert(two[0].dependencies[0].dependencies.empty());
}

std::size_t CountTreeNodes(const std::vector<depgraph::query::DependencyTreeNode>& nodes, std::size_t* repeated) {
  std::size_t total = 0;
  for (const auto& node : nodes) {
    total += 1 + CountTreeNodes(node.dependencies, repeated);
    if (node.repeated) {
      assert(node.dependencies.empty());
      ++*repeated;
    }
  }
  return total;
}

void TestSharedDependencyExpandsAtShallowestLevel() {
  GraphStore store;
  Publish(store, "Z", "1");
  Publish(store, "Y", "1", {{"Z", ReferenceKind::kImport}});
  Publish(store, "X", "1", {{"Y", ReferenceKind::kImport}});
  Publish(store, "R", "1", {{"X", ReferenceKind::kImport}, {"Y", ReferenceKind::kImport}});

  const auto tree = QueryEngine::DependencyTree(*store.Current(), VersionKey{"R", "1"}, 16);
  assert(tree.size() == 2);

  // Y sits one level below R, so its occurrence under X is only a marker
  assert(tree[0].contract_id == "X");
  assert(tree[0].dependencies.size() == 1);
  assert(tree[0].dependencies[0].contract_id == "Y");
  assert(tree[0].dependencies[0].resolved);
  assert(tree[0].dependencies[0].repeated);
  assert(tree[0].dependencies[0].dependencies.empty());

  assert(tree[1].contract_id == "Y");
  assert(!tree[1].repeated);
  assert(tree[1].dependencies.size() == 1);
  assert(tree[1].dependencies[0].contract_id == "Z");
}

// 17 layers of 3 contracts, each importing the whole next layer. Expanding
// every path would produce 3^16 leaves.
void TestLayeredDiamondTreeStaysLinear() {
  constexpr int kLayers = 17;
  constexpr int kWidth  = 3;

  auto name = [](int layer, int i) { return "L" + std::to_string(layer) + "_" + std::to_string(i); };

  GraphStore store;
  for (int layer = kLayers - 1; layer >= 0; --layer) {
    for (int i = 0; i < kWidth; ++i) {
      std::vector<Reference> refs;
      if (layer + 1 < kLayers) {
        for (int j = 0; j < kWidth; ++j) {
          refs.push_back({name(layer + 1, j), ReferenceKind::kImport});
        }
      }
      Publish(store, name(layer, i), "1", refs);
    }
  }

  const auto snapshot = store.Current();
  assert(snapshot->NodeCount() == kLayers * kWidth);

  const auto  tree     = QueryEngine::DependencyTree(*snapshot, VersionKey{"L0_0", "1"}, 16);
  std::size_t repeated = 0;

  // root's 3 children, then 3 children under each expanded node of layers 1..15
  assert(CountTreeNodes(tree, &repeated) == 3 + 15 * 3 * 3);
  // layers 2..15 appear under 3 parents each but expand once
  assert(repeated == 14 * 3 * 2);
}

void TestListVersionsInPublishOrder() {
  GraphStore store;
  Publish(store, "token", "2.0.0");
  Publish(store, "token", "1.0.0");
  Publish(store, "token", "10.0.0");

  const auto versions = QueryEngine::ListVersions(*store.Current(), "token");
  assert(versions.size() == 3);
  assert(versions[0].key.version_label == "2.0.0");
  assert(versions[1].key.version_label == "1.0.0");
  assert(versions[2].key.version_label == "10.0.0");
  assert(versions[2].interface_hash == "h-token10.0.0");
}

void TestOldSnapshotAnswersAreStable() {
  GraphStore store;
  BuildChain(store);
  const auto before = store.Current();
  Publish(store, "D", "1", {{"A", ReferenceKind::kImport}});

  assert(QueryEngine::Dependents(*before, std::string("A")).size() == 1);
  assert(QueryEngine::Dependents(*store.Current(), std::string("A")).size() == 2);
}

} // namespace

int main() {
  TestDirectDependentsAndImpact();
  TestDependenciesOrderedByKindThenTarget();
  TestReferencedOnlyContractHasDependents();
  TestUnknownSubjectsAreNotFound();
  TestEdgesReachEveryVersionOfTarget();
  TestImpactUsesMinimumDepth();
  TestExportKeepsInsertionOrder();
  TestDependencyTreeFollowsLatestVersions();
  TestDependencyTreeDepthBound();
  TestSharedDependencyExpandsAtShallowestLevel();
  TestLayeredDiamondTreeStaysLinear();
  TestListVersionsInPublishOrder();
  TestOldSnapshotAnswersAreStable();

  std::cout << "depgraph_unit_query_engine: pass\n";
  return 0;
}
