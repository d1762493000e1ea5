#include <catch2/catch_test_macros.hpp>
#include "security/sql_sandbox.hpp"
#include "parser/sql_validator.hpp"
#include "fixtures/chinook_catalog.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace nl2sql;

namespace {

std::shared_ptr<const CatalogSnapshot> chinook() {
    static const auto catalog = testing::make_chinook_catalog();
    return catalog->snapshot();
}

bool has_identifier(const SandboxDecision& d, const std::string& id) {
    return std::find(d.referenced_identifiers.begin(), d.referenced_identifiers.end(), id)
        != d.referenced_identifiers.end();
}

} // anonymous namespace

// ============================================================================
// Allowed Queries
// ============================================================================

TEST_CASE("Sandbox: plain select gets default limit", "[sandbox]") {
    SqlSandbox sandbox;
    const auto d = sandbox.check("SELECT first_name, email FROM customer", *chinook());

    REQUIRE(d.allowed);
    CHECK(d.reason == SandboxReason::NONE);
    CHECK(d.normalized_sql == "SELECT first_name, email FROM customer LIMIT 200");
    CHECK(d.limit_injected);
    CHECK_FALSE(d.limit_clamped);
    CHECK(d.execution_budget == std::chrono::milliseconds(30000));
    CHECK(has_identifier(d, "customer"));
    CHECK(has_identifier(d, "customer.first_name"));
    CHECK(has_identifier(d, "customer.email"));
}

TEST_CASE("Sandbox: row limit handling", "[sandbox][limit]") {
    SqlSandbox sandbox;

    SECTION("Limit within bounds is kept") {
        const auto d = sandbox.check("SELECT name FROM genre LIMIT 10", *chinook());
        REQUIRE(d.allowed);
        CHECK(d.normalized_sql == "SELECT name FROM genre LIMIT 10");
        CHECK_FALSE(d.limit_injected);
        CHECK_FALSE(d.limit_clamped);
    }

    SECTION("Limit above max_rows is clamped") {
        const auto d = sandbox.check("SELECT * FROM customer LIMIT 5000;", *chinook());
        REQUIRE(d.allowed);
        CHECK(d.normalized_sql == "SELECT * FROM customer LIMIT 1000");
        CHECK(d.limit_clamped);
    }

    SECTION("Non-constant limit is denied") {
        const auto d = sandbox.check("SELECT * FROM customer LIMIT ALL", *chinook());
        CHECK_FALSE(d.allowed);
        CHECK(d.reason == SandboxReason::UNBOUNDED_LIMIT);
    }

    SECTION("Configured default limit") {
        SqlSandbox::Config cfg;
        cfg.default_limit = 20;
        cfg.max_rows = 50;
        SqlSandbox custom(cfg);
        const auto d = custom.check("SELECT name FROM artist", *chinook());
        REQUIRE(d.allowed);
        CHECK(d.normalized_sql == "SELECT name FROM artist LIMIT 20");
    }
}

TEST_CASE("Sandbox: joins, aliases and CTEs", "[sandbox]") {
    SqlSandbox sandbox;

    SECTION("Aliased join") {
        const auto d = sandbox.check(
            "SELECT c.first_name, i.total FROM customer c "
            "JOIN invoice i ON i.customer_id = c.customer_id", *chinook());
        REQUIRE(d.allowed);
        CHECK(has_identifier(d, "invoice.total"));
        CHECK(has_identifier(d, "customer.first_name"));
    }

    SECTION("CTE and output alias") {
        const auto d = sandbox.check(
            "WITH recent AS (SELECT customer_id, total FROM invoice) "
            "SELECT customer_id, sum(total) AS spent FROM recent "
            "GROUP BY customer_id ORDER BY spent DESC", *chinook());
        REQUIRE(d.allowed);
        CHECK(d.limit_injected);
    }
}

// ============================================================================
// Denials
// ============================================================================

TEST_CASE("Sandbox: forbidden keywords", "[sandbox][deny]") {
    SqlSandbox sandbox;

    SECTION("Piggybacked DROP") {
        const auto d = sandbox.check("SELECT * FROM customer; DROP TABLE customer;", *chinook());
        CHECK_FALSE(d.allowed);
        CHECK(d.reason == SandboxReason::FORBIDDEN_KEYWORD);
        CHECK(d.detail == "drop");
        CHECK(d.normalized_sql.empty());
    }

    SECTION("Case-insensitive") {
        const auto d = sandbox.check("Update customer SET email = ''", *chinook());
        CHECK(d.reason == SandboxReason::FORBIDDEN_KEYWORD);
        CHECK(d.detail == "update");
    }

    SECTION("Sleep function") {
        const auto d = sandbox.check("SELECT pg_sleep(5)", *chinook());
        CHECK(d.reason == SandboxReason::FORBIDDEN_KEYWORD);
        CHECK(d.detail == "pg_sleep");
    }

    SECTION("Scan covers string literals") {
        const auto d = sandbox.check("SELECT * FROM track WHERE name = 'Delete Me'", *chinook());
        CHECK(d.reason == SandboxReason::FORBIDDEN_KEYWORD);
    }

    SECTION("Keyword inside an identifier is not a match") {
        const auto d = sandbox.check("SELECT last_name FROM customer", *chinook());
        CHECK(d.allowed);
    }
}

TEST_CASE("Sandbox: statement shape", "[sandbox][deny]") {
    SqlSandbox sandbox;

    SECTION("Multiple statements") {
        const auto d = sandbox.check("SELECT 1; SELECT 2", *chinook());
        CHECK(d.reason == SandboxReason::MULTI_STATEMENT);
    }

    SECTION("Empty after comments") {
        const auto d = sandbox.check("-- nothing here\n/* or here */ ;", *chinook());
        CHECK(d.reason == SandboxReason::EMPTY_SQL);
    }

    SECTION("Unparseable") {
        const auto d = sandbox.check("SELEC * FROM customer", *chinook());
        CHECK(d.reason == SandboxReason::UNPARSEABLE);
    }

    SECTION("SELECT INTO is not read-only") {
        const auto d = sandbox.check("SELECT * INTO backup FROM customer", *chinook());
        CHECK(d.reason == SandboxReason::NOT_READ_ONLY);
    }

    SECTION("EXPLAIN is not a plain select") {
        const auto d = sandbox.check("EXPLAIN SELECT * FROM customer", *chinook());
        CHECK(d.reason == SandboxReason::NOT_READ_ONLY);
    }
}

TEST_CASE("Sandbox: identifier allow-list", "[sandbox][deny]") {
    SqlSandbox sandbox;

    SECTION("Unknown table") {
        const auto d = sandbox.check("SELECT * FROM users", *chinook());
        CHECK(d.reason == SandboxReason::UNKNOWN_IDENTIFIER);
        CHECK(d.detail == "users");
    }

    SECTION("Unknown column") {
        const auto d = sandbox.check("SELECT salary FROM employee", *chinook());
        CHECK(d.reason == SandboxReason::UNKNOWN_IDENTIFIER);
        CHECK(d.detail == "salary");
    }

    SECTION("Unknown qualified column") {
        const auto d = sandbox.check("SELECT c.salary FROM customer c", *chinook());
        CHECK(d.reason == SandboxReason::UNKNOWN_IDENTIFIER);
        CHECK(d.detail == "c.salary");
    }
}

TEST_CASE("Sandbox: reserved schemas", "[sandbox][deny]") {
    SqlSandbox sandbox;

    CHECK(sandbox.check("SELECT * FROM pg_catalog.pg_tables", *chinook()).reason
          == SandboxReason::FORBIDDEN_SCHEMA);
    CHECK(sandbox.check("SELECT * FROM information_schema.tables", *chinook()).reason
          == SandboxReason::FORBIDDEN_SCHEMA);
    CHECK(sandbox.check("SELECT * FROM pg_user", *chinook()).reason
          == SandboxReason::FORBIDDEN_SCHEMA);
}

TEST_CASE("Sandbox: system functions", "[sandbox][deny]") {
    SqlSandbox sandbox;

    SECTION("Unqualified pg_ functions") {
        for (const char* sql : {"SELECT pg_terminate_backend(1234)",
                                "SELECT pg_cancel_backend(1234)",
                                "SELECT pg_reload_conf()",
                                "SELECT pg_read_file('/etc/passwd')",
                                "SELECT pg_ls_dir('.')"}) {
            INFO(sql);
            const auto d = sandbox.check(sql, *chinook());
            CHECK_FALSE(d.allowed);
            CHECK(d.reason == SandboxReason::FORBIDDEN_SCHEMA);
        }
        CHECK(sandbox.check("SELECT pg_terminate_backend(1234)", *chinook()).detail
              == "pg_terminate_backend");
    }

    SECTION("Large object and dblink functions") {
        CHECK(sandbox.check("SELECT lo_import('/tmp/x')", *chinook()).reason
              == SandboxReason::FORBIDDEN_SCHEMA);
        CHECK(sandbox.check("SELECT dblink_connect('host=x')", *chinook()).reason
              == SandboxReason::FORBIDDEN_SCHEMA);
    }

    SECTION("Administration functions") {
        const auto d = sandbox.check(
            "SELECT name FROM genre WHERE current_setting('server_version') <> ''", *chinook());
        CHECK(d.reason == SandboxReason::FORBIDDEN_SCHEMA);
        CHECK(d.detail == "current_setting");

        CHECK(sandbox.check("SELECT set_config('search_path', 'x', false)", *chinook()).reason
              == SandboxReason::FORBIDDEN_SCHEMA);
        CHECK(sandbox.check("SELECT nextval('invoice_id_seq')", *chinook()).reason
              == SandboxReason::FORBIDDEN_SCHEMA);
    }

    SECTION("Schema-qualified system function") {
        const auto d = sandbox.check("SELECT pg_catalog.version()", *chinook());
        CHECK(d.reason == SandboxReason::FORBIDDEN_SCHEMA);
        CHECK(d.detail == "pg_catalog.version");
    }

    SECTION("Ordinary functions are allowed") {
        const auto d = sandbox.check(
            "SELECT lower(name), count(*) FROM genre GROUP BY lower(name)", *chinook());
        CHECK(d.allowed);
    }

    SECTION("Configured admin list") {
        SqlSandbox::Config cfg;
        cfg.forbidden_functions = {"LOWER"};
        SqlSandbox custom(cfg);
        CHECK(custom.check("SELECT lower(name) FROM genre", *chinook()).reason
              == SandboxReason::FORBIDDEN_SCHEMA);
        CHECK(custom.check("SELECT current_setting('x')", *chinook()).allowed);
        CHECK(custom.check("SELECT pg_reload_conf()", *chinook()).reason
              == SandboxReason::FORBIDDEN_SCHEMA);
    }
}

// ============================================================================
// Decision Properties
// ============================================================================

TEST_CASE("Sandbox: decisions are deterministic", "[sandbox]") {
    const std::vector<std::string> statements = {
        "SELECT first_name, email FROM customer",
        "SELECT name FROM genre LIMIT 5000",
        "DROP TABLE customer",
        "SELECT salary FROM employee",
        "SELECT * FROM pg_user",
        "SELECT 1; SELECT 2",
        "SELECT pg_reload_conf()",
    };

    SqlSandbox first;
    SqlSandbox second;
    const auto other_catalog = testing::make_chinook_catalog();

    for (const auto& sql : statements) {
        INFO(sql);
        const auto a = first.check(sql, *chinook());
        const auto b = first.check(sql, *chinook());
        const auto c = second.check(sql, *other_catalog->snapshot());
        CHECK(a.allowed == b.allowed);
        CHECK(a.reason == b.reason);
        CHECK(a.normalized_sql == b.normalized_sql);
        CHECK(a.allowed == c.allowed);
        CHECK(a.reason == c.reason);
        CHECK(a.detail == c.detail);
        CHECK(a.normalized_sql == c.normalized_sql);
    }
}

TEST_CASE("Sandbox: normalized SQL still parses", "[sandbox][limit]") {
    SqlSandbox sandbox;
    SqlValidator validator;

    struct Case {
        const char* sql;
        bool injected;
        bool clamped;
    };
    const Case cases[] = {
        {"SELECT name FROM genre UNION SELECT name FROM artist", true, false},
        {"SELECT name FROM genre ORDER BY name", true, false},
        {"SELECT name FROM genre ORDER BY name OFFSET 10", true, false},
        {"SELECT name FROM genre -- every genre", true, false},
        {"SELECT name FROM genre /* all */;", true, false},
        {"SELECT name FROM genre;", true, false},
        {"SELECT name FROM genre ORDER BY name LIMIT 5000 OFFSET 10", false, true},
        {"SELECT name FROM genre FETCH FIRST 5000 ROWS ONLY", false, true},
        {"SELECT name FROM genre LIMIT 5000; -- trailing", false, true},
        {"SELECT name FROM genre FETCH FIRST 5 ROWS ONLY", false, false},
    };

    for (const auto& c : cases) {
        INFO(c.sql);
        const auto d = sandbox.check(c.sql, *chinook());
        REQUIRE(d.allowed);
        CHECK(d.limit_injected == c.injected);
        CHECK(d.limit_clamped == c.clamped);
        const auto v = validator.validate(d.normalized_sql);
        INFO(d.normalized_sql);
        CHECK(v.valid);
        CHECK(v.statement_count == 1);
    }
}

TEST_CASE("Sandbox: custom keyword list replaces defaults", "[sandbox]") {
    SqlSandbox::Config cfg;
    cfg.forbidden_keywords = {"GENRE"};
    SqlSandbox sandbox(cfg);

    CHECK(sandbox.check("SELECT name FROM genre", *chinook()).reason
          == SandboxReason::FORBIDDEN_KEYWORD);
    CHECK(sandbox.check("SELECT name FROM artist", *chinook()).allowed);
}

TEST_CASE("Sandbox: reason codes", "[sandbox]") {
    CHECK(std::string(sandbox_reason_to_string(SandboxReason::FORBIDDEN_KEYWORD)) == "FORBIDDEN_KEYWORD");
    CHECK(std::string(sandbox_reason_to_string(SandboxReason::MULTI_STATEMENT)) == "MULTI_STATEMENT");
}
