#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace depgraph::db::model {

/*
  One accepted publish.

  kind uses the numeric values of depgraph::model::ReferenceKind so the
  storage layer stays free of graph types.
*/

struct ReferenceRecord {
  std::string target_contract_id;
  int         kind = 0;

  bool operator==(const ReferenceRecord&) const = default;
};

struct PublicationRecord {
  uint64_t    epoch = 0;
  std::string contract_id;
  std::string version_label;
  std::string interface_hash;

  // event timestamp (epoch ms)
  uint64_t published_at_ms = 0;

  std::vector<ReferenceRecord> references;
};

} // namespace depgraph::db::model
