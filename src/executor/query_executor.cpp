#include "executor/query_executor.hpp"
#include "db/pg_handles.hpp"
#include "core/utils.hpp"

#include <cstring>
#include <format>

namespace nl2sql {

/// SQLSTATE query_canceled, raised when statement_timeout fires
static constexpr const char* kQueryCanceled = "57014";

namespace {

/// Run a utility statement; returns the error message or empty on success.
std::string run_command(PGconn* conn, const std::string& sql) {
    PGResultPtr res(PQexec(conn, sql.c_str()));
    if (!res || PQresultStatus(res.get()) != PGRES_COMMAND_OK) {
        return PQerrorMessage(conn);
    }
    return "";
}

bool is_query_canceled(const PGresult* res) {
    const char* state = PQresultErrorField(res, PG_DIAG_SQLSTATE);
    return state && std::strcmp(state, kQueryCanceled) == 0;
}

void read_columns(const PGresult* res, ExecutionResult& result) {
    if (!result.columns.empty()) return;
    const int ncols = PQnfields(res);
    for (int i = 0; i < ncols; ++i) {
        result.columns.emplace_back(PQfname(res, i));
    }
}

} // anonymous namespace

PgQueryExecutor::PgQueryExecutor(Config config)
    : config_(std::move(config)) {}

ExecutionResult PgQueryExecutor::execute(const std::string& sql,
                                         std::chrono::milliseconds budget) {
    utils::Timer timer;
    ExecutionResult result;

    const auto fail = [&](std::string message) {
        result.success = false;
        result.error_message = std::move(message);
        result.execution_time = std::chrono::microseconds(timer.elapsed_us());
        return result;
    };

    // dbname with expand_dbname=1 accepts both key=value strings and URIs
    const std::string connect_timeout = std::to_string(config_.connect_timeout_s);
    const char* keywords[] = {"dbname", "connect_timeout", nullptr};
    const char* values[] = {config_.connection_string.c_str(), connect_timeout.c_str(), nullptr};
    PGConnPtr conn(PQconnectdbParams(keywords, values, 1));

    if (!conn || PQstatus(conn.get()) != CONNECTION_OK) {
        const std::string msg = conn ? PQerrorMessage(conn.get()) : "out of memory";
        utils::log::error(std::format("Executor: connection failed: {}", utils::trim(msg)));
        return fail("Database connection failed");
    }

    if (auto err = run_command(conn.get(), "BEGIN READ ONLY"); !err.empty()) {
        return fail(std::format("BEGIN failed: {}", utils::trim(err)));
    }
    if (budget.count() > 0) {
        const auto set_timeout = std::format("SET LOCAL statement_timeout = {}", budget.count());
        if (auto err = run_command(conn.get(), set_timeout); !err.empty()) {
            return fail(std::format("Setting statement timeout failed: {}", utils::trim(err)));
        }
    }

    if (!PQsendQuery(conn.get(), sql.c_str())) {
        return fail(utils::trim(PQerrorMessage(conn.get())));
    }
    if (!PQsetSingleRowMode(conn.get())) {
        utils::log::warn("Executor: single-row mode unavailable, fetching whole result");
    }

    std::string error;
    // Drain every result so the connection is usable for ROLLBACK
    while (true) {
        PGResultPtr res(PQgetResult(conn.get()));
        if (!res) break;

        const auto status = PQresultStatus(res.get());
        if (status == PGRES_SINGLE_TUPLE || status == PGRES_TUPLES_OK) {
            read_columns(res.get(), result);
            const int ncols = PQnfields(res.get());
            for (int row = 0; row < PQntuples(res.get()); ++row) {
                if (result.rows.size() >= config_.max_result_rows) {
                    result.truncated = true;
                    break;
                }
                Row values_row;
                values_row.reserve(static_cast<size_t>(ncols));
                for (int col = 0; col < ncols; ++col) {
                    values_row.push_back(pg_cell(res.get(), row, col));
                }
                result.rows.push_back(std::move(values_row));
            }
        } else if (error.empty()) {
            error = PQresultErrorMessage(res.get());
            result.timed_out = is_query_canceled(res.get());
        }
    }

    if (auto err = run_command(conn.get(), "ROLLBACK"); !err.empty()) {
        utils::log::warn(std::format("Executor: ROLLBACK failed: {}", utils::trim(err)));
    }

    if (!error.empty()) {
        result.rows.clear();
        result.truncated = false;
        return fail(utils::trim(error));
    }

    if (result.truncated) {
        utils::log::warn(std::format("Executor: result truncated at {} rows",
                                     config_.max_result_rows));
    }

    result.success = true;
    result.execution_time = std::chrono::microseconds(timer.elapsed_us());
    return result;
}

} // namespace nl2sql
