#include "db/DBConnection.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace ovdm::db;
using namespace ovdm::log;

namespace {

std::string quoted(const std::string& value) {
    std::string out = "'";
    for (const char c : value) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    return out + "'";
}

}

std::string ovdm::db::connectionString(const config::DatabaseConfig& cfg) {
    std::string out = "host=" + quoted(cfg.host) + " port=" + std::to_string(cfg.port) +
                      " dbname=" + quoted(cfg.name) + " user=" + quoted(cfg.user);
    if (!cfg.password.empty()) out += " password=" + quoted(cfg.password);
    return out;
}

DBConnection::DBConnection(const config::DatabaseConfig& cfg)
    : conn_(std::make_unique<pqxx::connection>(connectionString(cfg))) {
    Registry::db()->debug("[DBConnection] Connected to {}@{}:{}/{}", cfg.user, cfg.host, cfg.port, cfg.name);
}

DBConnection::~DBConnection() { if (conn_ && conn_->is_open()) conn_->close(); }

pqxx::connection& DBConnection::get() const { return *conn_; }

void DBConnection::initPrepared() const {
    if (!conn_ || !conn_->is_open()) throw std::runtime_error("Database connection is not open");

    initPreparedDefinitions();
    initPreparedCoreVars();
    initPreparedExtraDirectories();
    initPreparedLowerings();
}

void DBConnection::initPreparedDefinitions() const {
    conn_->prepare("get_transfer_definition", "SELECT * FROM transfer_definitions WHERE id = $1");

    conn_->prepare("list_transfer_definitions", "SELECT * FROM transfer_definitions ORDER BY id");

    conn_->prepare("update_transfer_live_state",
                   "UPDATE transfer_definitions SET status = $2, pid = $3, last_result = $4, updated_at = NOW() "
                   "WHERE id = $1");
}

void DBConnection::initPreparedCoreVars() const {
    conn_->prepare("list_core_vars", "SELECT name, value FROM core_vars");

    conn_->prepare("upsert_core_var",
                   "INSERT INTO core_vars (name, value) VALUES ($1, $2) "
                   "ON CONFLICT (name) DO UPDATE SET value = EXCLUDED.value");
}

void DBConnection::initPreparedExtraDirectories() const {
    conn_->prepare("get_extra_directory", "SELECT id, name, dest_dir FROM extra_directories WHERE id = $1");
}

void DBConnection::initPreparedLowerings() const {
    conn_->prepare("list_lowerings_by_cruise",
                   "SELECT lowering_id FROM lowerings WHERE cruise_id = $1 ORDER BY lowering_id");
}
