#include "reference_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

#include "internal/util/errors.hpp"

namespace depgraph::extractor {

using depgraph::registry::core::v1::ContractBinding;
using depgraph::registry::core::v1::InterfaceDescription;
using depgraph::model::Reference;
using depgraph::model::ReferenceKind;

namespace {

void Collect(const google::protobuf::RepeatedPtrField<ContractBinding>& bindings, ReferenceKind kind, const std::string& self_id,
             const char* section, std::vector<Reference>* out) {
  for (int i = 0; i < bindings.size(); ++i) {
    const auto& binding = bindings.Get(i);
    if (!ReferenceExtractor::IsValidContractId(binding.contract_id())) {
      throw util::MalformedInterface("interface " + self_id + ": " + section + "[" + std::to_string(i) +
                                     "] has a missing or malformed contract_id");
    }

    if (binding.contract_id() == self_id) {
      continue;
    }

    Reference ref{binding.contract_id(), kind};
    if (std::find(out->begin(), out->end(), ref) == out->end()) {
      out->push_back(std::move(ref));
    }
  }
}

uint64_t Fnv1a64(const std::string& bytes) {
  uint64_t hash = 0xcbf29ce484222325ULL;
  for (unsigned char c : bytes) {
    hash ^= c;
    hash *= 0x100000001b3ULL;
  }
  return hash;
}

} // namespace

bool ReferenceExtractor::IsValidContractId(const std::string& id) {
  if (id.empty()) {
    return false;
  }

  if (std::isspace(static_cast<unsigned char>(id.front())) || std::isspace(static_cast<unsigned char>(id.back()))) {
    return false;
  }

  return std::none_of(id.begin(), id.end(), [](char c) { return std::iscntrl(static_cast<unsigned char>(c)) != 0; });
}

bool ReferenceExtractor::IsValidVersionLabel(const std::string& label) {
  return IsValidContractId(label) && label.find('@') == std::string::npos;
}

std::vector<Reference> ReferenceExtractor::Extract(const InterfaceDescription& description) {
  if (!IsValidContractId(description.contract_id())) {
    throw util::MalformedInterface("interface description has a missing or malformed contract_id");
  }

  const auto& self_id = description.contract_id();

  std::vector<Reference> refs;
  refs.reserve(description.imports_size() + description.clients_size() + description.interfaces_size());

  Collect(description.imports(), ReferenceKind::kImport, self_id, "imports", &refs);
  Collect(description.clients(), ReferenceKind::kClient, self_id, "clients", &refs);
  Collect(description.interfaces(), ReferenceKind::kInterface, self_id, "interfaces", &refs);

  return refs;
}

std::string ReferenceExtractor::ResolveInterfaceHash(const InterfaceDescription& description) {
  if (!description.interface_hash().empty()) {
    return description.interface_hash();
  }

  std::string bytes;
  {
    google::protobuf::io::StringOutputStream stream(&bytes);
    google::protobuf::io::CodedOutputStream  coded(&stream);
    coded.SetSerializationDeterministic(true);
    description.SerializeToCodedStream(&coded);
  }

  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(Fnv1a64(bytes)));
  return std::string("fnv1a64:") + buf;
}

} // namespace depgraph::extractor
