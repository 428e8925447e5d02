#include "pg_repository.hpp"

#include <string>
#include <unordered_map>

namespace depgraph::db::postgres {

namespace {

model::PublicationRecord ReadPublication(const pqxx::row& row) {
  model::PublicationRecord r;
  r.epoch           = row[0].as<uint64_t>();
  r.contract_id     = row[1].c_str();
  r.version_label   = row[2].c_str();
  r.interface_hash  = row[3].c_str();
  r.published_at_ms = row[4].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e))
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::Conflict, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::AppendPublication(Transaction& t, const model::PublicationRecord& r) {
  try {
    auto& work = TX(t).Work();
    auto  last = work.exec_prepared("last_epoch");
    if (!last.empty() && !last[0][0].is_null() && last[0][0].as<uint64_t>() > r.epoch) {
      return Result::Err(ErrorCode::OutOfOrder, "epoch " + std::to_string(r.epoch) + " is behind the log");
    }

    work.exec_prepared("insert_publication", r.epoch, r.contract_id, r.version_label, r.interface_hash,
                       r.published_at_ms);

    for (size_t i = 0; i < r.references.size(); ++i) {
      work.exec_prepared("insert_reference", r.epoch, static_cast<int>(i), r.references[i].target_contract_id,
                         r.references[i].kind);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::PublicationRecord> PgRepository::ListPublications(Transaction& t) {
  auto& work = TX(t).Work();
  auto  res  = work.exec_prepared("list_publications");

  std::vector<model::PublicationRecord> records;
  records.reserve(res.size());

  std::unordered_map<uint64_t, size_t> by_epoch;
  for (const auto& row : res) {
    by_epoch[row[0].as<uint64_t>()] = records.size();
    records.push_back(ReadPublication(row));
  }

  // one pass over all references instead of a query per publication
  auto refs = work.exec_prepared("list_references");
  for (const auto& row : refs) {
    auto it = by_epoch.find(row[0].as<uint64_t>());
    if (it == by_epoch.end()) continue;
    records[it->second].references.push_back({row[1].c_str(), row[2].as<int>()});
  }
  return records;
}

std::optional<model::PublicationRecord>
PgRepository::GetPublication(Transaction& t, const std::string& contract_id, const std::string& version_label) {
  auto& work = TX(t).Work();
  auto  res  = work.exec_prepared("get_publication", contract_id, version_label);
  if (res.empty()) return std::nullopt;

  auto r    = ReadPublication(res[0]);
  auto refs = work.exec_prepared("get_references", r.epoch);
  for (const auto& row : refs) {
    r.references.push_back({row[0].c_str(), row[1].as<int>()});
  }
  return r;
}

}
