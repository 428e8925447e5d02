#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace depgraph::db::memory {

namespace {

MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

} // namespace

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

Result MemoryRepository::AppendPublication(Transaction& t, const model::PublicationRecord& r) {
  auto& log = TX(t).Log();

  if (!log.empty() && log.back().epoch > r.epoch) {
    return Result::Err(ErrorCode::OutOfOrder, "epoch " + std::to_string(r.epoch) + " is behind the log");
  }

  const bool duplicate = std::any_of(log.begin(), log.end(), [&](const model::PublicationRecord& e) {
    return e.epoch == r.epoch || (e.contract_id == r.contract_id && e.version_label == r.version_label);
  });
  if (duplicate) return Result::Err(ErrorCode::AlreadyExists, "publication already recorded");

  log.push_back(r);
  return Result::Ok();
}

std::vector<model::PublicationRecord> MemoryRepository::ListPublications(Transaction& t) {
  return TX(t).Log();
}

std::optional<model::PublicationRecord> MemoryRepository::GetPublication(Transaction& t, const std::string& contract_id,
                                                                         const std::string& version_label) {
  const auto& log = TX(t).Log();
  auto it = std::find_if(log.begin(), log.end(), [&](const model::PublicationRecord& e) {
    return e.contract_id == contract_id && e.version_label == version_label;
  });
  if (it == log.end()) return std::nullopt;
  return *it;
}

} // namespace depgraph::db::memory
