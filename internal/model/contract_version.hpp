#pragma once

#include <compare>
#include <string>

#include "internal/model/reference_kind.hpp"

namespace depgraph::model {

// (contract_id, version_label) identifies one version node.
struct VersionKey {
  std::string contract_id;
  std::string version_label;

  auto operator<=>(const VersionKey&) const = default;
  bool operator==(const VersionKey&) const  = default;
};

// Rendered node id used by exports and diagnostics: "contract@version".
// Labels never contain '@', so the id is unique per version.
inline std::string NodeId(const VersionKey& key) {
  return key.contract_id + "@" + key.version_label;
}

struct ContractVersion {
  VersionKey  key;
  std::string interface_hash;
};

// One declared reference from a version to another contract.
struct Reference {
  std::string   target_contract_id;
  ReferenceKind kind = ReferenceKind::kImport;

  bool operator==(const Reference&) const = default;
};

} // namespace depgraph::model
