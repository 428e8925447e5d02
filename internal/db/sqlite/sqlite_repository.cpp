#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>

namespace depgraph::db::sqlite {

using depgraph::db::ErrorCode;
using depgraph::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

// A row loop ends on SQLITE_DONE only; anything else means the read was cut short.
static void RequireDone(sqlite3* db, int rc, const char* what) {
    if (rc != SQLITE_DONE)
        throw std::runtime_error(std::string("sqlite ") + what + ": " + sqlite3_errmsg(db));
}

// Finalizes on scope exit.
struct Statement {
    sqlite3_stmt* st = nullptr;

    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
            st = nullptr;
        }
    }
    ~Statement() {
        if (st) sqlite3_finalize(st);
    }

    Statement(const Statement&)            = delete;
    Statement& operator=(const Statement&) = delete;

    explicit operator bool() const { return st != nullptr; }
};

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Publication log
// ------------------------------------------------------------------

Result SqliteRepository::AppendPublication(Transaction& t, const model::PublicationRecord& r) {
    auto* db = TX(t).Handle();

    {
        Statement last(db, "SELECT MAX(epoch) FROM contract_publication;");
        if (!last) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        const int rc = sqlite3_step(last.st);
        if (rc != SQLITE_ROW) return Translate(db, rc);
        if (sqlite3_column_type(last.st, 0) != SQLITE_NULL && ColU64(last.st, 0) > r.epoch)
            return Result::Err(ErrorCode::OutOfOrder, "epoch " + std::to_string(r.epoch) + " is behind the log");
    }

    {
        Statement insert(db,
            "INSERT INTO contract_publication(epoch,contract_id,version_label,interface_hash,published_at_ms)"
            " VALUES(?,?,?,?,?);");
        if (!insert) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

        BindU64(insert.st, 1, r.epoch);
        BindText(insert.st, 2, r.contract_id);
        BindText(insert.st, 3, r.version_label);
        BindText(insert.st, 4, r.interface_hash);
        BindU64(insert.st, 5, r.published_at_ms);

        const int rc = sqlite3_step(insert.st);
        if (rc != SQLITE_DONE) {
            if ((rc & 0xff) == SQLITE_CONSTRAINT)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Translate(db, rc);
        }
    }

    Statement ref(db, "INSERT INTO contract_reference(epoch,seq,target_contract_id,kind) VALUES(?,?,?,?);");
    if (!ref) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (size_t i = 0; i < r.references.size(); ++i) {
        sqlite3_reset(ref.st);
        sqlite3_clear_bindings(ref.st);

        BindU64(ref.st, 1, r.epoch);
        BindI32(ref.st, 2, static_cast<int>(i));
        BindText(ref.st, 3, r.references[i].target_contract_id);
        BindI32(ref.st, 4, r.references[i].kind);

        const int rc = sqlite3_step(ref.st);
        if (rc != SQLITE_DONE) return Translate(db, rc);
    }

    return Result::Ok();
}

std::vector<model::ReferenceRecord> SqliteRepository::LoadReferences(sqlite3* db, uint64_t epoch) {
    Statement st(db, "SELECT target_contract_id,kind FROM contract_reference WHERE epoch=? ORDER BY seq;");
    if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    BindU64(st.st, 1, epoch);

    std::vector<model::ReferenceRecord> refs;
    int rc;
    while ((rc = sqlite3_step(st.st)) == SQLITE_ROW) {
        refs.push_back({ColText(st.st, 0), ColI32(st.st, 1)});
    }
    RequireDone(db, rc, "load references");
    return refs;
}

std::vector<model::PublicationRecord> SqliteRepository::ListPublications(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "SELECT epoch,contract_id,version_label,interface_hash,published_at_ms"
        " FROM contract_publication ORDER BY epoch;");
    if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    std::vector<model::PublicationRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.st)) == SQLITE_ROW) {
        model::PublicationRecord r;
        r.epoch           = ColU64(st.st, 0);
        r.contract_id     = ColText(st.st, 1);
        r.version_label   = ColText(st.st, 2);
        r.interface_hash  = ColText(st.st, 3);
        r.published_at_ms = ColU64(st.st, 4);
        out.push_back(std::move(r));
    }
    RequireDone(db, rc, "list publications");

    for (auto& r : out) {
        r.references = LoadReferences(db, r.epoch);
    }
    return out;
}

std::optional<model::PublicationRecord>
SqliteRepository::GetPublication(Transaction& t, const std::string& contract_id, const std::string& version_label) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "SELECT epoch,contract_id,version_label,interface_hash,published_at_ms"
        " FROM contract_publication WHERE contract_id=? AND version_label=?;");
    if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    BindText(st.st, 1, contract_id);
    BindText(st.st, 2, version_label);

    const int rc = sqlite3_step(st.st);
    if (rc != SQLITE_ROW) {
        RequireDone(db, rc, "get publication");
        return std::nullopt;
    }

    model::PublicationRecord r;
    r.epoch           = ColU64(st.st, 0);
    r.contract_id     = ColText(st.st, 1);
    r.version_label   = ColText(st.st, 2);
    r.interface_hash  = ColText(st.st, 3);
    r.published_at_ms = ColU64(st.st, 4);
    r.references      = LoadReferences(db, r.epoch);
    return r;
}

} // namespace depgraph::db::sqlite
