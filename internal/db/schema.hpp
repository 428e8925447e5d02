#pragma once

namespace depgraph::db::schema {

/*
  Bootstrap DDL. Written in the subset both SQLite and Postgres accept.
*/

// Bump when a table changes shape. SQLite stores it as PRAGMA user_version.
static constexpr int kSchemaVersion = 1;

static constexpr const char* kCreatePublications =
    "CREATE TABLE IF NOT EXISTS contract_publication ("
    " epoch BIGINT PRIMARY KEY,"
    " contract_id TEXT NOT NULL,"
    " version_label TEXT NOT NULL,"
    " interface_hash TEXT NOT NULL,"
    " published_at_ms BIGINT NOT NULL,"
    " UNIQUE(contract_id, version_label));";

static constexpr const char* kCreateReferences =
    "CREATE TABLE IF NOT EXISTS contract_reference ("
    " epoch BIGINT NOT NULL REFERENCES contract_publication(epoch),"
    " seq INTEGER NOT NULL,"
    " target_contract_id TEXT NOT NULL,"
    " kind SMALLINT NOT NULL,"
    " PRIMARY KEY (epoch, seq));";

static constexpr const char* kProbePublications =
    "SELECT epoch,contract_id,version_label,interface_hash,published_at_ms FROM contract_publication LIMIT 1;";

static constexpr const char* kProbeReferences =
    "SELECT epoch,seq,target_contract_id,kind FROM contract_reference LIMIT 1;";

} // namespace depgraph::db::schema
