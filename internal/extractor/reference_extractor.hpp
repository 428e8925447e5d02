#pragma once

#include <string>
#include <vector>

#include "depgraph/registry/core/v1/interface.pb.h"
#include "internal/model/contract_version.hpp"

namespace depgraph::extractor {

/*
  ReferenceExtractor

  Turns a parsed interface description into the ordered set of contracts it
  references. Walk order is imports, clients, interfaces (declaration order
  within each); the first occurrence of a (contract, kind) pair fixes its
  position. References to the describing contract itself are dropped.

  Throws util::MalformedInterface when an identifier is missing or malformed.
  Stateless; safe to call from any thread.
*/
class ReferenceExtractor {
 public:
  static std::vector<model::Reference> Extract(const depgraph::registry::core::v1::InterfaceDescription& description);

  // interface_hash from the description, or a content hash of it when unset.
  static std::string ResolveInterfaceHash(const depgraph::registry::core::v1::InterfaceDescription& description);

  static bool IsValidContractId(const std::string& id);

  // Contract id rules, and no '@' so "contract@version" splits at its last '@'.
  static bool IsValidVersionLabel(const std::string& label);
};

} // namespace depgraph::extractor
