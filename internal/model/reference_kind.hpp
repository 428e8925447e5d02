#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace depgraph::model {

// Declaration order is the ordering used when sorting dependencies.
enum class ReferenceKind : std::uint8_t {
  kInterface = 1,
  kClient    = 2,
  kImport    = 3,
};

constexpr std::string_view ToString(ReferenceKind kind) {
  switch (kind) {
    case ReferenceKind::kInterface:
      return "interface";
    case ReferenceKind::kClient:
      return "client";
    case ReferenceKind::kImport:
    default:
      return "import";
  }
}

constexpr std::optional<ReferenceKind> ReferenceKindFromInt(int value) {
  switch (value) {
    case 1:
      return ReferenceKind::kInterface;
    case 2:
      return ReferenceKind::kClient;
    case 3:
      return ReferenceKind::kImport;
    default:
      return std::nullopt;
  }
}

} // namespace depgraph::model
