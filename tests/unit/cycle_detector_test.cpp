#include "internal/graph/cycle_detector.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

using depgraph::graph::CycleDetector;
using depgraph::graph::GraphSnapshot;
using depgraph::graph::NodeIndex;
using depgraph::graph::SnapshotPtr;
using depgraph::model::ContractVersion;
using depgraph::model::Reference;
using depgraph::model::ReferenceKind;
using depgraph::model::VersionKey;

SnapshotPtr Add(const SnapshotPtr& base, const std::string& contract, const std::string& label, std::vector<Reference> refs = {}) {
  return base->Extend(ContractVersion{VersionKey{contract, label}, ""}, std::move(refs));
}

NodeIndex Last(const SnapshotPtr& snapshot) {
  return static_cast<NodeIndex>(snapshot->NodeCount() - 1);
}

std::vector<std::string> Detect(const SnapshotPtr& snapshot, const std::vector<Reference>& refs) {
  auto cycle = CycleDetector::DetectCycle(*snapshot, Last(snapshot), refs);
  if (!cycle) {
    return {};
  }
  return CycleDetector::RenderPath(*snapshot, *cycle);
}

void TestAcyclicChainHasNoCycle() {
  auto s = std::make_shared<const GraphSnapshot>();
  s      = Add(s, "a", "1");
  s      = Add(s, "b", "1", {{"a", ReferenceKind::kImport}});

  const std::vector<Reference> refs{{"b", ReferenceKind::kImport}};
  s = Add(s, "c", "1", refs);
  assert(Detect(s, refs).empty());
}

void TestReferenceToUnpublishedContractHasNoCycle() {
  auto s = std::make_shared<const GraphSnapshot>();

  const std::vector<Reference> refs{{"ghost", ReferenceKind::kClient}};
  s = Add(s, "a", "1", refs);
  assert(Detect(s, refs).empty());
}

void TestSelfContractReferenceClosesImmediately() {
  auto s = std::make_shared<const GraphSnapshot>();
  s      = Add(s, "a", "1");

  const std::vector<Reference> refs{{"a", ReferenceKind::kImport}};
  s = Add(s, "a", "2", refs);

  // a@1 is walked first and has no edges, then the origin itself is reached
  assert((Detect(s, refs) == std::vector<std::string>{"a@2", "a@2"}));
}

void TestThreeNodeCycleThroughOlderVersion() {
  auto s = std::make_shared<const GraphSnapshot>();
  s      = Add(s, "a", "1");
  s      = Add(s, "b", "1", {{"a", ReferenceKind::kClient}});
  s      = Add(s, "c", "1", {{"b", ReferenceKind::kImport}});

  const std::vector<Reference> refs{{"c", ReferenceKind::kClient}};
  s = Add(s, "a", "2", refs);

  assert((Detect(s, refs) == std::vector<std::string>{"a@2", "c@1", "b@1", "a@2"}));
}

void TestFirstClosureFollowsEdgeOrder() {
  auto s = std::make_shared<const GraphSnapshot>();
  s      = Add(s, "a", "1");
  s      = Add(s, "x", "1", {{"a", ReferenceKind::kImport}});
  s      = Add(s, "y", "1", {{"a", ReferenceKind::kImport}});

  const std::vector<Reference> refs{{"y", ReferenceKind::kImport}, {"x", ReferenceKind::kImport}};
  s = Add(s, "a", "2", refs);

  assert((Detect(s, refs) == std::vector<std::string>{"a@2", "y@1", "a@2"}));
}

void TestDiamondWithoutBackEdgeHasNoCycle() {
  auto s = std::make_shared<const GraphSnapshot>();
  s      = Add(s, "base", "1");
  s      = Add(s, "left", "1", {{"base", ReferenceKind::kImport}});
  s      = Add(s, "right", "1", {{"base", ReferenceKind::kImport}});

  const std::vector<Reference> refs{{"left", ReferenceKind::kImport}, {"right", ReferenceKind::kInterface}};
  s = Add(s, "top", "1", refs);
  assert(Detect(s, refs).empty());
}

void TestLongChainReportsFullPath() {
  auto s = std::make_shared<const GraphSnapshot>();
  s      = Add(s, "n0", "1");

  constexpr int kLength = 2000;
  for (int i = 1; i < kLength; ++i) {
    s = Add(s, "n" + std::to_string(i), "1", {{"n" + std::to_string(i - 1), ReferenceKind::kImport}});
  }

  const std::vector<Reference> refs{{"n" + std::to_string(kLength - 1), ReferenceKind::kImport}};
  s = Add(s, "n0", "2", refs);

  const auto path = Detect(s, refs);
  assert(path.size() == static_cast<std::size_t>(kLength) + 1);
  assert(path.front() == "n0@2");
  assert(path.back() == "n0@2");
  assert(path[path.size() - 2] == "n1@1");
}

} // namespace

int main() {
  TestAcyclicChainHasNoCycle();
  TestReferenceToUnpublishedContractHasNoCycle();
  TestSelfContractReferenceClosesImmediately();
  TestThreeNodeCycleThroughOlderVersion();
  TestFirstClosureFollowsEdgeOrder();
  TestDiamondWithoutBackEdgeHasNoCycle();
  TestLongChainReportsFullPath();

  std::cout << "depgraph_unit_cycle_detector: pass\n";
  return 0;
}
