#pragma once

#include "db/DBConnection.hpp"
#include "util/errors.hpp"

#include <memory>
#include <pqxx/pqxx>
#include <spdlog/logger.h>
#include <string>
#include <type_traits>
#include <utility>

namespace fsnap::db {

class Transactions {
public:
    // Runs func inside one pqxx::work and commits. Any failure rolls back; the
    // error is logged and rethrown as StoreError("<ctx>: <cause>"), except
    // NotFoundError and TagFormatError which keep their type.
    template <typename Func>
    static auto exec(DBConnection& conn, const std::shared_ptr<spdlog::logger>& log, const std::string& ctx,
                     Func&& func) -> decltype(func(std::declval<pqxx::work&>())) {
        log->trace("[Transactions::exec] Starting transaction: {}", ctx);

        try {
            pqxx::work txn(conn.get());
            if constexpr (std::is_void_v<decltype(func(txn))>) {
                func(txn);
                txn.commit();
                log->trace("[Transactions::exec] Transaction committed: {}", ctx);
            } else {
                auto result = func(txn);
                txn.commit();
                log->trace("[Transactions::exec] Transaction committed: {}", ctx);
                return result;
            }
        } catch (const NotFoundError&) {
            throw;
        } catch (const TagFormatError& e) {
            log->error("[Transactions::exec] {} rolled back: {}", ctx, e.what());
            throw;
        } catch (const std::exception& e) {
            log->error("[Transactions::exec] {} rolled back: {}", ctx, e.what());
            throw StoreError(ctx + ": " + e.what());
        }

        if constexpr (!std::is_void_v<decltype(func(std::declval<pqxx::work&>()))>)
            throw std::logic_error("Unreachable path in Transactions::exec");
    }
};

}
