#include <catch2/catch_test_macros.hpp>
#include "parser/sql_text.hpp"

using namespace nl2sql;
using namespace nl2sql::sql_text;

TEST_CASE("SqlText: strip_comments", "[sql_text]") {
    SECTION("Line and block comments") {
        const auto out = strip_comments("SELECT 1 -- one\n/* two */ FROM t");
        CHECK(out.find("one") == std::string::npos);
        CHECK(out.find("two") == std::string::npos);
        CHECK(out.find("SELECT 1") != std::string::npos);
        CHECK(out.find("FROM t") != std::string::npos);
    }

    SECTION("Comment markers inside literals survive") {
        const auto out = strip_comments("SELECT '-- not a comment', \"a/*b\" FROM t");
        CHECK(out == "SELECT '-- not a comment', \"a/*b\" FROM t");
    }

    SECTION("Escaped quote inside literal") {
        const auto out = strip_comments("SELECT 'it''s -- fine' -- gone");
        CHECK(out.find("it''s -- fine") != std::string::npos);
        CHECK(out.find("gone") == std::string::npos);
    }

    SECTION("Nested block comment") {
        CHECK(strip_comments("/* a /* b */ c */SELECT 1") == " SELECT 1");
    }

    SECTION("Dollar-quoted body") {
        const auto out = strip_comments("SELECT $$ -- kept $$");
        CHECK(out == "SELECT $$ -- kept $$");
    }
}

TEST_CASE("SqlText: strip_terminator", "[sql_text]") {
    CHECK(strip_terminator("  SELECT 1 ;; ") == "SELECT 1");
    CHECK(strip_terminator(";").empty());
}

TEST_CASE("SqlText: extract_sql", "[sql_text]") {
    SECTION("SQL fence with prose around it") {
        const auto e = extract_sql("Here you go:\n```sql\nSELECT * FROM customer;\n```\nEnjoy.");
        CHECK(e.text == "SELECT * FROM customer;");
        CHECK(e.fenced_as_sql);
    }

    SECTION("Upper-case fence tag") {
        const auto e = extract_sql("```SQL\nSELECT 1\n```");
        CHECK(e.text == "SELECT 1");
        CHECK(e.fenced_as_sql);
    }

    SECTION("Generic fence with info string") {
        const auto e = extract_sql("```postgresql\nSELECT 2\n```");
        CHECK(e.text == "SELECT 2");
        CHECK_FALSE(e.fenced_as_sql);
    }

    SECTION("Generic fence opening on a statement keyword") {
        const auto e = extract_sql("```SELECT\n  name FROM customer\n```");
        CHECK(e.text == "SELECT\n  name FROM customer");
        CHECK_FALSE(e.fenced_as_sql);
        CHECK(looks_like_sql(e));

        const auto with = extract_sql("```with\nx AS (SELECT 1) SELECT * FROM x\n```");
        CHECK(with.text == "with\nx AS (SELECT 1) SELECT * FROM x");
    }

    SECTION("Bare text") {
        const auto e = extract_sql("  SELECT 3  ");
        CHECK(e.text == "SELECT 3");
        CHECK_FALSE(e.fenced_as_sql);
    }
}

TEST_CASE("SqlText: looks_like_sql", "[sql_text]") {
    CHECK(looks_like_sql({"SELECT * FROM t", false}));
    CHECK(looks_like_sql({"with x as (select 1) select * from x", false}));
    CHECK(looks_like_sql({"(SELECT 1)", false}));
    CHECK(looks_like_sql({"-- comment\nSELECT 1", false}));

    SECTION("Mutating SQL is still SQL") {
        CHECK(looks_like_sql({"DROP TABLE customer", false}));
        CHECK(looks_like_sql({"delete from invoice", false}));
    }

    SECTION("Prose is not SQL") {
        CHECK_FALSE(looks_like_sql({"Hello! I can help you query the music store.", false}));
        CHECK_FALSE(looks_like_sql({"你好，我可以帮你查询数据。", false}));
        CHECK_FALSE(looks_like_sql({"Selecting customers requires a table name.", false}));
    }

    SECTION("SQL fence wins") {
        CHECK(looks_like_sql({"anything", true}));
    }
}
