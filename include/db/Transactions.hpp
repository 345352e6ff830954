#pragma once

#include "db/DBPool.hpp"
#include "log/Registry.hpp"

#include <memory>
#include <pqxx/pqxx>
#include <stdexcept>
#include <string>
#include <utility>

namespace ovdm::db {

class Transactions {
  public:
    static inline std::shared_ptr<DBPool> dbPool_;

    struct Lease {
        std::unique_ptr<DBConnection> conn;
        ~Lease() { if (conn && dbPool_) dbPool_->release(std::move(conn)); }
    };

    static void init(const config::DatabaseConfig& cfg) { dbPool_ = std::make_shared<DBPool>(cfg); }

    template <typename Func>
    static auto exec(const std::string& ctx, Func&& func) -> decltype(func(std::declval<pqxx::work&>())) {
        if (!dbPool_) throw std::runtime_error("Transactions not initialized!");

        log::Registry::db()->trace("[Transactions::exec] Starting transaction: {}", ctx);

        // Declared before the transaction so the connection goes back to the pool only after it closes.
        Lease lease{dbPool_->acquire()};
        pqxx::work txn(lease.conn->get());

        try {
            if constexpr (std::is_void_v<decltype(func(txn))>) {
                func(txn);
                txn.commit();
                log::Registry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
            } else {
                auto result = func(txn);
                txn.commit();
                log::Registry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                return result;
            }
        } catch (...) {
            log::Registry::db()->error("[Transactions::exec] Exception in transaction context '{}', rolling back", ctx);
            throw;
        }

        if constexpr (!std::is_void_v<decltype(func(txn))>) {
            throw std::logic_error("Unreachable path in Transactions::exec");
        }
    }
};

}
