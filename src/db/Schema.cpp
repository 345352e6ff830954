#include "db/Schema.hpp"
#include "db/DBConnection.hpp"
#include "log/Registry.hpp"

#include <pqxx/pqxx>

#include <array>

using namespace ovdm::db;

namespace {

constexpr std::array kSchema = {
    "CREATE TABLE IF NOT EXISTS transfer_definitions ("
    "    id                          SERIAL PRIMARY KEY,"
    "    name                        TEXT NOT NULL UNIQUE,"
    "    long_name                   TEXT,"
    "    category                    TEXT NOT NULL,"
    "    cruise_or_lowering          TEXT NOT NULL DEFAULT 'cruise',"
    "    transfer_type               TEXT NOT NULL,"
    "    server                      TEXT,"
    "    username                    TEXT,"
    "    password                    TEXT,"
    "    domain                      TEXT,"
    "    share                       TEXT,"
    "    use_ssh_key                 BOOLEAN NOT NULL DEFAULT FALSE,"
    "    mount_required              BOOLEAN NOT NULL DEFAULT FALSE,"
    "    source_dir                  TEXT,"
    "    dest_dir                    TEXT,"
    "    include_filter              TEXT,"
    "    exclude_filter              TEXT,"
    "    ignore_filter               TEXT,"
    "    staleness                   INTEGER NOT NULL DEFAULT 0,"
    "    remove_source_files         BOOLEAN NOT NULL DEFAULT FALSE,"
    "    skip_empty_dirs             BOOLEAN NOT NULL DEFAULT TRUE,"
    "    skip_empty_files            BOOLEAN NOT NULL DEFAULT TRUE,"
    "    sync_to_dest                BOOLEAN NOT NULL DEFAULT FALSE,"
    "    sync_from_source            BOOLEAN NOT NULL DEFAULT FALSE,"
    "    use_start_date              BOOLEAN NOT NULL DEFAULT FALSE,"
    "    local_dir_is_mount_point    BOOLEAN NOT NULL DEFAULT FALSE,"
    "    include_ovdm_files          BOOLEAN NOT NULL DEFAULT FALSE,"
    "    bandwidth_limit             INTEGER NOT NULL DEFAULT 0,"
    "    excluded_collection_systems TEXT,"
    "    excluded_extra_directories  TEXT,"
    "    enable                      BOOLEAN NOT NULL DEFAULT FALSE,"
    "    status                      TEXT NOT NULL DEFAULT 'idle',"
    "    pid                         INTEGER,"
    "    last_result                 TEXT,"
    "    created_at                  TIMESTAMPTZ NOT NULL DEFAULT NOW(),"
    "    updated_at                  TIMESTAMPTZ NOT NULL DEFAULT NOW()"
    ")",

    "CREATE TABLE IF NOT EXISTS core_vars ("
    "    name  TEXT PRIMARY KEY,"
    "    value TEXT"
    ")",

    "CREATE TABLE IF NOT EXISTS extra_directories ("
    "    id       SERIAL PRIMARY KEY,"
    "    name     TEXT NOT NULL UNIQUE,"
    "    dest_dir TEXT NOT NULL"
    ")",

    "CREATE TABLE IF NOT EXISTS lowerings ("
    "    cruise_id   TEXT NOT NULL,"
    "    lowering_id TEXT NOT NULL,"
    "    PRIMARY KEY (cruise_id, lowering_id)"
    ")",

    "INSERT INTO core_vars (name, value) VALUES ('systemStatus', 'Off') ON CONFLICT (name) DO NOTHING"
};

}

void ovdm::db::ensureSchema(const config::DatabaseConfig& cfg) {
    const DBConnection conn(cfg);
    pqxx::work txn(conn.get());
    for (const auto* stmt : kSchema) txn.exec(stmt);
    txn.commit();
    log::Registry::db()->info("[Schema] Schema verified ({} statements)", kSchema.size());
}
