#pragma once

#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace nl2sql {

/**
 * @brief Database execution collaborator
 *
 * Receives only sandbox-normalized SQL. Implementations must not throw;
 * failures come back in ExecutionResult (timed_out set when the budget
 * was exceeded).
 */
class IQueryExecutor {
public:
    virtual ~IQueryExecutor() = default;

    /**
     * @brief Execute a read-only statement
     * @param sql Sandbox-normalized SQL
     * @param budget Wall-clock limit for the statement; zero means none
     */
    [[nodiscard]] virtual ExecutionResult execute(const std::string& sql,
                                                  std::chrono::milliseconds budget) = 0;
};

/**
 * @brief PostgreSQL executor - one short-lived connection per statement
 *
 * Every statement runs inside BEGIN READ ONLY with a transaction-local
 * statement_timeout and is always rolled back. Rows are fetched in
 * single-row mode and capped at max_result_rows.
 */
class PgQueryExecutor final : public IQueryExecutor {
public:
    struct Config {
        std::string connection_string;
        uint32_t connect_timeout_s = 10;
        uint32_t max_result_rows = 1000;
    };

    explicit PgQueryExecutor(Config config);

    [[nodiscard]] ExecutionResult execute(const std::string& sql,
                                          std::chrono::milliseconds budget) override;

private:
    Config config_;
};

} // namespace nl2sql
