#pragma once

#include <libpq-fe.h>

#include <memory>
#include <string>

namespace nl2sql {

struct PGConnDeleter {
    void operator()(PGconn* conn) const noexcept {
        if (conn) PQfinish(conn);
    }
};
using PGConnPtr = std::unique_ptr<PGconn, PGConnDeleter>;

struct PGResultDeleter {
    void operator()(PGresult* res) const noexcept {
        if (res) PQclear(res);
    }
};
using PGResultPtr = std::unique_ptr<PGresult, PGResultDeleter>;

/// Cell text; NULL comes back as an empty string.
[[nodiscard]] inline std::string pg_cell(const PGresult* res, int row, int col) {
    const char* v = PQgetvalue(res, row, col);
    return v ? std::string(v) : std::string();
}

} // namespace nl2sql
