#include "publication_coordinator.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/cache/result_cache.hpp"
#include "internal/db/model/publication_record.hpp"
#include "internal/extractor/reference_extractor.hpp"
#include "internal/graph/graph_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/query/query_engine.hpp"
#include "internal/util/errors.hpp"

namespace depgraph::core {

using depgraph::observability::DoubleField;
using depgraph::observability::IntField;
using depgraph::observability::StringField;
using depgraph::registry::core::v1::InterfaceDescription;

namespace {

void ThrowIfDbError(const depgraph::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  auto message = context + " (" + depgraph::db::ErrorCodeName(result.code) + ")";
  if (!result.message.empty()) message += ": " + result.message;

  switch (result.code) {
    case depgraph::db::ErrorCode::AlreadyExists:
      throw depgraph::util::AlreadyExists(message);
    case depgraph::db::ErrorCode::OutOfOrder:
    case depgraph::db::ErrorCode::Conflict:
    case depgraph::db::ErrorCode::ConstraintViolation:
      throw depgraph::util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

uint64_t NowUnixMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

db::model::PublicationRecord ToRecord(uint64_t epoch, const model::ContractVersion& version, const std::vector<model::Reference>& refs) {
  db::model::PublicationRecord record;
  record.epoch           = epoch;
  record.contract_id     = version.key.contract_id;
  record.version_label   = version.key.version_label;
  record.interface_hash  = version.interface_hash;
  record.published_at_ms = NowUnixMillis();
  record.references.reserve(refs.size());
  for (const auto& ref : refs) {
    record.references.push_back({ref.target_contract_id, static_cast<int>(ref.kind)});
  }
  return record;
}

std::vector<model::Reference> FromRecord(const db::model::PublicationRecord& record) {
  std::vector<model::Reference> refs;
  refs.reserve(record.references.size());
  for (const auto& ref : record.references) {
    auto kind = model::ReferenceKindFromInt(ref.kind);
    if (!kind) {
      throw util::InvalidState("publication log: epoch " + std::to_string(record.epoch) + " has unknown reference kind " +
                               std::to_string(ref.kind));
    }
    refs.push_back({ref.target_contract_id, *kind});
  }
  return refs;
}

double ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

void RecordGraphSize(const graph::GraphSnapshot& snapshot) {
  observability::Metrics::Instance().SetGraphSize(snapshot.NodeCount(), snapshot.EdgeCount(), snapshot.ContractCount());
}

} // namespace

PublicationCoordinator::PublicationCoordinator(std::shared_ptr<graph::GraphStore> store, std::shared_ptr<cache::ResultCache> cache,
                                               std::shared_ptr<db::Repository> repository)
    : store_(std::move(store)), cache_(std::move(cache)), repository_(std::move(repository)) {
}

PublishResult PublicationCoordinator::Publish(const std::string& contract_id, const std::string& version_label,
                                              const InterfaceDescription& description) {
  std::lock_guard<std::mutex> lock(publish_mutex_);

  observability::SpanScope span("depgraph.publish");
  span.SetAttribute("contract_id", contract_id);
  span.SetAttribute("version_label", version_label);

  const auto  start   = std::chrono::steady_clock::now();
  const auto  node_id = contract_id + "@" + version_label;
  const char* outcome = "error";

  try {
    if (!extractor::ReferenceExtractor::IsValidContractId(contract_id)) {
      throw util::MalformedInterface("publish: missing or malformed contract id");
    }
    if (!extractor::ReferenceExtractor::IsValidVersionLabel(version_label)) {
      throw util::MalformedInterface("publish " + contract_id + ": missing or malformed version label");
    }

    auto refs = extractor::ReferenceExtractor::Extract(description);
    if (description.contract_id() != contract_id) {
      throw util::MalformedInterface("publish " + node_id + ": interface describes contract " + description.contract_id());
    }

    model::ContractVersion version{{contract_id, version_label}, extractor::ReferenceExtractor::ResolveInterfaceHash(description)};

    auto candidate = store_->BuildCandidate(version, refs);

    {
      auto tx = repository_->Begin();
      ThrowIfDbError(repository_->AppendPublication(*tx, ToRecord(candidate->Epoch(), version, refs)), "publish " + node_id);
      tx->Commit();
    }

    store_->Swap(candidate);
    cache_->InvalidateAll();

    PublishResult result;
    result.epoch   = candidate->Epoch();
    result.version = std::move(version);
    result.edges   = query::QueryEngine::Dependencies(*candidate, result.version.key);

    outcome = "accepted";
    const double elapsed_ms = ElapsedMs(start);
    observability::Metrics::Instance().ObservePublishDurationMs(outcome, elapsed_ms);
    RecordGraphSize(*candidate);
    span.SetAttribute("epoch", static_cast<std::int64_t>(result.epoch));

    DEPGRAPH_LOG_INFO("contract version published", {StringField("version", node_id), IntField("epoch", static_cast<std::int64_t>(result.epoch)),
                                                     IntField("edges", static_cast<std::int64_t>(result.edges.size())),
                                                     StringField("interface_hash", result.version.interface_hash),
                                                     DoubleField("duration_ms", elapsed_ms)});
    return result;
  } catch (const std::exception& e) {
    // rejections are the caller's fault; anything else is ours
    bool rejected = true;
    if (dynamic_cast<const util::DuplicateVersion*>(&e)) {
      outcome = "duplicate";
    } else if (dynamic_cast<const util::CycleDetected*>(&e)) {
      outcome = "cycle";
    } else if (dynamic_cast<const util::MalformedInterface*>(&e)) {
      outcome = "malformed";
    } else {
      rejected = false;
    }

    const double elapsed_ms = ElapsedMs(start);
    observability::Log(rejected ? spdlog::level::warn : spdlog::level::err, rejected ? "publish rejected" : "publish failed",
                       {StringField("version", node_id), StringField("outcome", outcome), StringField("error", e.what()),
                        DoubleField("duration_ms", elapsed_ms)});
    span.RecordException(e.what());
    observability::Metrics::Instance().ObservePublishDurationMs(outcome, elapsed_ms);
    throw;
  }
}

std::size_t PublicationCoordinator::Hydrate() {
  std::lock_guard<std::mutex> lock(publish_mutex_);

  if (store_->Current()->Epoch() != 0) {
    throw util::InvalidState("hydrate: graph is not empty");
  }

  auto       tx      = repository_->Begin();
  const auto records = repository_->ListPublications(*tx);
  tx->Commit();

  for (const auto& record : records) {
    model::ContractVersion version{{record.contract_id, record.version_label}, record.interface_hash};

    auto candidate = store_->BuildCandidate(version, FromRecord(record));
    if (candidate->Epoch() != record.epoch) {
      throw util::InvalidState("publication log: expected epoch " + std::to_string(candidate->Epoch()) + ", found " +
                               std::to_string(record.epoch));
    }

    store_->Swap(candidate);
    cache_->InvalidateAll();
  }

  const auto snapshot = store_->Current();
  RecordGraphSize(*snapshot);
  DEPGRAPH_LOG_INFO("publication log replayed", {IntField("publications", static_cast<std::int64_t>(records.size())),
                                                 IntField("epoch", static_cast<std::int64_t>(snapshot->Epoch()))});
  return records.size();
}

} // namespace depgraph::core
