#include "internal/graph/graph_store.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using depgraph::graph::GraphStore;
using depgraph::model::ContractVersion;
using depgraph::model::Reference;
using depgraph::model::ReferenceKind;
using depgraph::model::VersionKey;

ContractVersion Version(const std::string& contract, const std::string& label) {
  return ContractVersion{VersionKey{contract, label}, "hash:" + contract + "@" + label};
}

void TestEmptyStoreStartsAtEpochZero() {
  GraphStore store;
  const auto snapshot = store.Current();
  assert(snapshot);
  assert(snapshot->Epoch() == 0);
  assert(snapshot->NodeCount() == 0);
  assert(snapshot->EdgeCount() == 0);
  assert(!snapshot->HasVersions("token"));
}

void TestCommitAdvancesEpochAndIndexes() {
  GraphStore store;
  store.CommitNewVersion(Version("math", "1"), {});
  store.CommitNewVersion(Version("token", "1"), {{"math", ReferenceKind::kImport}, {"ledger", ReferenceKind::kClient}});
  store.CommitNewVersion(Version("token", "2"), {{"math", ReferenceKind::kImport}});

  const auto snapshot = store.Current();
  assert(snapshot->Epoch() == 3);
  assert(snapshot->NodeCount() == 3);
  assert(snapshot->EdgeCount() == 3);
  assert(snapshot->ContractCount() == 2);

  const auto& versions = snapshot->VersionsOf("token");
  assert(versions.size() == 2);
  assert(snapshot->Node(versions[0]).version.key.version_label == "1");
  assert(snapshot->Node(*snapshot->LatestVersionOf("token")).version.key.version_label == "2");

  // unpublished targets are indexed on the reverse side only
  assert(!snapshot->HasVersions("ledger"));
  assert(snapshot->IsReferenced("ledger"));
  assert(snapshot->ReferencesTo("math").size() == 2);
}

void TestDuplicateVersionIsRejected() {
  GraphStore store;
  store.CommitNewVersion(Version("token", "1"), {});

  bool threw = false;
  try {
    store.CommitNewVersion(Version("token", "1"), {{"math", ReferenceKind::kImport}});
  } catch (const depgraph::util::DuplicateVersion&) {
    threw = true;
  }
  assert(threw);
  assert(store.Current()->Epoch() == 1);
  assert(store.Current()->EdgeCount() == 0);
}

void TestDuplicateReferencesAreCollapsed() {
  GraphStore store;
  store.CommitNewVersion(Version("token", "1"),
                         {{"math", ReferenceKind::kImport}, {"math", ReferenceKind::kImport}, {"math", ReferenceKind::kClient}});

  const auto snapshot = store.Current();
  assert(snapshot->EdgeCount() == 2);
  assert(snapshot->ReferencesTo("math").size() == 2);
}

void TestOldSnapshotIsUnchangedAfterCommit() {
  GraphStore store;
  store.CommitNewVersion(Version("math", "1"), {});
  const auto before = store.Current();

  store.CommitNewVersion(Version("token", "1"), {{"math", ReferenceKind::kImport}});

  assert(before->Epoch() == 1);
  assert(before->NodeCount() == 1);
  assert(before->ReferencesTo("math").empty());
  assert(!before->Find(VersionKey{"token", "1"}));

  const auto after = store.Current();
  assert(after->ReferencesTo("math").size() == 1);
  assert(after->Find(VersionKey{"token", "1"}));
}

void TestSnapshotsShareUntouchedNodes() {
  GraphStore store;
  store.CommitNewVersion(Version("math", "1"), {});
  const auto before = store.Current();
  store.CommitNewVersion(Version("token", "1"), {});
  const auto after = store.Current();

  assert(&before->Node(0) == &after->Node(0));
}

void TestCandidateIsNotVisibleUntilSwap() {
  GraphStore store;
  const auto candidate = store.BuildCandidate(Version("token", "1"), {});

  assert(store.Current()->Epoch() == 0);
  assert(candidate->Epoch() == 1);

  store.Swap(candidate);
  assert(store.Current() == candidate);
}

void TestStaleCandidateSwapIsRejected() {
  GraphStore store;
  const auto first  = store.BuildCandidate(Version("token", "1"), {});
  const auto second = store.BuildCandidate(Version("math", "1"), {});

  store.Swap(first);

  bool threw = false;
  try {
    store.Swap(second);
  } catch (const depgraph::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(store.Current() == first);
  assert(!store.Current()->Find(VersionKey{"math", "1"}));
}

void TestCycleLeavesStoreUntouched() {
  GraphStore store;
  store.CommitNewVersion(Version("a", "1"), {});
  store.CommitNewVersion(Version("b", "1"), {{"a", ReferenceKind::kImport}});
  const auto before = store.Current();

  bool threw = false;
  try {
    store.CommitNewVersion(Version("a", "2"), {{"b", ReferenceKind::kClient}});
  } catch (const depgraph::util::CycleDetected& e) {
    threw = true;
    assert((e.Path() == std::vector<std::string>{"a@2", "b@1", "a@2"}));
  }
  assert(threw);
  assert(store.Current() == before);
}

} // namespace

int main() {
  TestEmptyStoreStartsAtEpochZero();
  TestCommitAdvancesEpochAndIndexes();
  TestDuplicateVersionIsRejected();
  TestDuplicateReferencesAreCollapsed();
  TestOldSnapshotIsUnchangedAfterCommit();
  TestSnapshotsShareUntouchedNodes();
  TestCandidateIsNotVisibleUntilSwap();
  TestStaleCandidateSwapIsRejected();
  TestCycleLeavesStoreUntouched();

  std::cout << "depgraph_unit_graph_store: pass\n";
  return 0;
}
