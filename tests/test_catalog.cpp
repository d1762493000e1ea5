#include <catch2/catch_test_macros.hpp>
#include "schema/catalog_loader.hpp"
#include "schema/name_aliases.hpp"
#include "schema/schema_catalog.hpp"
#include "fixtures/chinook_catalog.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

using namespace nl2sql;
using nl2sql::testing::kChinookCatalogJson;
using nl2sql::testing::make_chinook_catalog;

namespace {

/// Original Chinook naming: CamelCase tables and columns, no declared keys.
constexpr std::string_view kCamelCaseJson = R"({
  "tables": [
    {"name": "Artist", "columns": [
      {"name": "ArtistId", "type": "integer", "primary_key": true, "nullable": false},
      {"name": "Name", "type": "text"}]},
    {"name": "Album", "columns": [
      {"name": "AlbumId", "type": "integer", "primary_key": true, "nullable": false},
      {"name": "Title", "type": "text"},
      {"name": "ArtistId", "type": "integer", "nullable": false}]},
    {"name": "Employee", "columns": [
      {"name": "EmployeeId", "type": "integer", "primary_key": true, "nullable": false}]},
    {"name": "Customers", "columns": [
      {"name": "CustomerId", "type": "integer", "primary_key": true, "nullable": false},
      {"name": "SupportRepId", "type": "integer"}]},
    {"name": "Invoice", "columns": [
      {"name": "InvoiceId", "type": "integer", "primary_key": true, "nullable": false},
      {"name": "CustomerId", "type": "integer", "nullable": false},
      {"name": "BillingCountry", "type": "text"}]},
    {"name": "InvoiceLine", "columns": [
      {"name": "InvoiceLineId", "type": "integer", "primary_key": true, "nullable": false},
      {"name": "InvoiceId", "type": "integer", "nullable": false},
      {"name": "TrackId", "type": "integer", "nullable": false}]}
  ]
})";

std::shared_ptr<const CatalogSnapshot> camel_case_snapshot() {
    auto loaded = CatalogLoader::load_from_string(kCamelCaseJson);
    REQUIRE(loaded.success);
    SchemaCatalog catalog;
    catalog.install(std::move(loaded.tables));
    return catalog.snapshot();
}

} // anonymous namespace

// ============================================================================
// Loader
// ============================================================================

TEST_CASE("CatalogLoader: loads the catalog document", "[catalog]") {
    const auto loaded = CatalogLoader::load_from_string(kChinookCatalogJson);
    REQUIRE(loaded.success);
    REQUIRE(loaded.tables.size() == 9);

    const auto& customer = loaded.tables[5];
    CHECK(customer.name == "customer");
    CHECK(customer.description == "Store customers");
    CHECK(customer.aliases == std::vector<std::string>{"客户", "customers"});

    const auto* email = customer.find_column("EMAIL");
    REQUIRE(email != nullptr);
    CHECK_FALSE(email->nullable);
    CHECK(email->aliases == std::vector<std::string>{"邮箱"});
    CHECK(customer.find_column("customer_id")->is_primary_key);

    SECTION("Foreign key nullability follows the column") {
        const auto& track = loaded.tables[3];
        REQUIRE(track.foreign_keys.size() == 2);
        CHECK(track.foreign_keys[1].ref_table == "genre");
        CHECK(track.foreign_keys[1].nullable);

        const auto& invoice = loaded.tables[6];
        CHECK_FALSE(invoice.foreign_keys.front().nullable);
    }
}

TEST_CASE("CatalogLoader: rejects malformed documents", "[catalog]") {
    SECTION("Not JSON") {
        const auto r = CatalogLoader::load_from_string("{tables");
        CHECK_FALSE(r.success);
        CHECK(r.error_message.find("not valid JSON") != std::string::npos);
    }

    SECTION("No tables array") {
        const auto r = CatalogLoader::load_from_string(R"({"tabels": []})");
        CHECK_FALSE(r.success);
        CHECK(r.error_message.find("'tables' array") != std::string::npos);
    }

    SECTION("Dangling foreign key") {
        const auto r = CatalogLoader::load_from_string(R"({"tables": [
            {"name": "invoice",
             "columns": [{"name": "customer_id", "type": "integer"}],
             "foreign_keys": [{"column": "customer_id", "ref_table": "customer", "ref_column": "id"}]}
        ]})");
        CHECK_FALSE(r.success);
        CHECK(r.error_message.find("referenced table 'customer' not found") != std::string::npos);
    }

    SECTION("Foreign key on a missing column") {
        const auto r = CatalogLoader::load_from_string(R"({"tables": [
            {"name": "a", "columns": [{"name": "id", "type": "integer"}],
             "foreign_keys": [{"column": "b_id", "ref_table": "a", "ref_column": "id"}]}
        ]})");
        CHECK_FALSE(r.success);
        CHECK(r.error_message.find("'b_id' is not a column") != std::string::npos);
    }

    SECTION("Duplicate table names") {
        const auto r = CatalogLoader::load_from_string(
            R"({"tables": [{"name": "Album", "columns": []}, {"name": "album", "columns": []}]})");
        CHECK_FALSE(r.success);
        CHECK(r.error_message.find("duplicate table") != std::string::npos);
    }

    SECTION("Missing file") {
        const auto r = CatalogLoader::load_from_file("/nonexistent/catalog.json");
        CHECK_FALSE(r.success);
        CHECK(r.error_message.find("Cannot open catalog file") != std::string::npos);
    }
}

TEST_CASE("CatalogLoader: infers foreign keys from column names", "[catalog]") {
    const auto loaded = CatalogLoader::load_from_string(kCamelCaseJson);
    REQUIRE(loaded.success);
    const auto& tables = loaded.tables;

    SECTION("<Table>Id references the table's primary key") {
        const auto& album = tables[1];
        REQUIRE(album.foreign_keys.size() == 1);
        CHECK(album.foreign_keys[0].column == "ArtistId");
        CHECK(album.foreign_keys[0].ref_table == "Artist");
        CHECK(album.foreign_keys[0].ref_column == "ArtistId");
        CHECK(album.foreign_keys[0].inferred);
        CHECK_FALSE(album.foreign_keys[0].nullable);
    }

    SECTION("Plural table names and role columns") {
        const auto& invoice = tables[4];
        REQUIRE(invoice.foreign_keys.size() == 1);
        CHECK(invoice.foreign_keys[0].ref_table == "Customers");

        const auto& customers = tables[3];
        REQUIRE(customers.foreign_keys.size() == 1);
        CHECK(customers.foreign_keys[0].column == "SupportRepId");
        CHECK(customers.foreign_keys[0].ref_table == "Employee");
        CHECK(customers.foreign_keys[0].nullable);
    }

    SECTION("Primary keys and unknown tables are skipped") {
        CHECK(tables[0].foreign_keys.empty());
        const auto& line = tables[5];
        REQUIRE(line.foreign_keys.size() == 1);   // TrackId has no table
        CHECK(line.foreign_keys[0].ref_table == "Invoice");
    }

    SECTION("Inferred keys feed the join graph") {
        const auto snap = camel_case_snapshot();
        CHECK(snap->join_graph().edges().size() == 4);
    }

    SECTION("Declared keys are kept as they are") {
        const auto chinook = CatalogLoader::load_from_string(kChinookCatalogJson);
        REQUIRE(chinook.success);
        for (const auto& t : chinook.tables) {
            for (const auto& fk : t.foreign_keys) CHECK_FALSE(fk.inferred);
        }
    }

    SECTION("Inference can be switched off") {
        std::string doc(kCamelCaseJson);
        doc.insert(doc.find('{') + 1, "\"infer_foreign_keys\": false,");
        const auto plain = CatalogLoader::load_from_string(doc);
        REQUIRE(plain.success);
        for (const auto& t : plain.tables) CHECK(t.foreign_keys.empty());
    }
}

TEST_CASE("CatalogLoader: row counts and sample values", "[catalog]") {
    const auto loaded = CatalogLoader::load_from_string(R"({"tables": [
        {"name": "genre", "row_count": 25, "columns": [
          {"name": "genre_id", "type": "integer", "primary_key": true, "nullable": false,
           "sample_values": [1, 2, 3, 4]},
          {"name": "name", "type": "text",
           "sample_values": ["Rock", "Jazz", "A very long genre name beyond twenty"]},
          {"name": "active", "type": "boolean", "sample_values": [true, 2.5]}]}
    ]})");
    REQUIRE(loaded.success);

    const auto& genre = loaded.tables[0];
    REQUIRE(genre.row_count.has_value());
    CHECK(*genre.row_count == 25);
    CHECK(genre.columns[0].sample_values == std::vector<std::string>{"1", "2", "3", "4"});
    CHECK(genre.columns[2].sample_values == std::vector<std::string>{"true", "2.5"});

    SchemaCatalog catalog;
    catalog.install(loaded.tables);
    const auto snap = catalog.snapshot();

    SECTION("Prompt shows row count and up to three short samples") {
        const auto text = snap->format_for_prompt({"genre"}, true);
        CHECK(text.find("Table genre [25 rows]") != std::string::npos);
        CHECK(text.find("  - genre_id integer PRIMARY KEY NOT NULL e.g. [1, 2, 3]\n")
              != std::string::npos);
        CHECK(text.find("e.g. [Rock, Jazz, A very long genre na]") != std::string::npos);
    }

    SECTION("Samples are left out unless asked for") {
        const auto text = snap->format_for_prompt({"genre"});
        CHECK(text.find("Table genre [25 rows]") != std::string::npos);
        CHECK(text.find("e.g.") == std::string::npos);
    }

    SECTION("Negative row count is rejected") {
        const auto r = CatalogLoader::load_from_string(
            R"({"tables": [{"name": "genre", "row_count": -1, "columns": []}]})");
        CHECK_FALSE(r.success);
        CHECK(r.error_message.find("row_count must be >= 0") != std::string::npos);
    }
}

// ============================================================================
// Name Aliases
// ============================================================================

TEST_CASE("name_aliases: generated match terms", "[catalog]") {
    CHECK(name_aliases::to_snake_case("InvoiceLine") == "invoice_line");
    CHECK(name_aliases::to_snake_case("CustomerId") == "customer_id");
    CHECK(name_aliases::to_snake_case("HTTPCode") == "http_code");
    CHECK(name_aliases::to_snake_case("first_name") == "first_name");

    CHECK(name_aliases::for_column("BillingCountry")
          == std::vector<std::string>{"billingcountry", "billing_country", "billing country"});
    CHECK(name_aliases::for_column("email") == std::vector<std::string>{"email"});

    CHECK(name_aliases::for_table("customers") == std::vector<std::string>{"customers", "customer"});
    const auto track = name_aliases::for_table("Track");
    CHECK(std::find(track.begin(), track.end(), "tracks") != track.end());
    CHECK(name_aliases::for_table("客户") == std::vector<std::string>{"客户"});
}

// ============================================================================
// Snapshot
// ============================================================================

TEST_CASE("CatalogSnapshot: lookups", "[catalog]") {
    const auto catalog = make_chinook_catalog();
    const auto snap = catalog->snapshot();

    CHECK(snap->version() == 1);
    CHECK(snap->table_count() == 9);
    CHECK(snap->has_table("Customer"));
    CHECK_FALSE(snap->has_table("users"));
    CHECK(snap->has_column("invoice", "TOTAL"));
    CHECK_FALSE(snap->has_column("invoice", "salary"));
    CHECK(snap->any_table_has_column("unit_price"));
    CHECK_FALSE(snap->any_table_has_column("salary"));
}

TEST_CASE("CatalogSnapshot: relevant tables", "[catalog]") {
    const auto snap = make_chinook_catalog()->snapshot();

    SECTION("Table alias in Chinese") {
        CHECK(snap->find_relevant_tables("查询前5个客户的名字和邮箱")
              == std::vector<std::string>{"customer"});
    }

    SECTION("Table name in English") {
        CHECK(snap->find_relevant_tables("Which is the most popular genre?")
              == std::vector<std::string>{"genre"});
    }

    SECTION("Plural and spaced names, catalog order") {
        CHECK(snap->find_relevant_tables("invoice lines per track")
              == std::vector<std::string>{"track", "invoice", "invoice_line"});
    }

    SECTION("Column alias owned by one table") {
        CHECK(snap->find_relevant_tables("平均时长是多少")
              == std::vector<std::string>{"track"});
    }

    SECTION("Nothing recognised") {
        CHECK(snap->find_relevant_tables("hello there").empty());
    }
}

TEST_CASE("CatalogSnapshot: generated aliases for CamelCase names", "[catalog]") {
    const auto snap = camel_case_snapshot();

    CHECK(snap->find_relevant_tables("total by billing country")
          == std::vector<std::string>{"invoice"});
    CHECK(snap->find_relevant_tables("show invoice lines")
          == std::vector<std::string>{"invoice", "invoiceline"});
    CHECK(snap->find_relevant_tables("list each customer")
          == std::vector<std::string>{"customers"});
}

TEST_CASE("CatalogSnapshot: prompt description", "[catalog]") {
    const auto snap = make_chinook_catalog()->snapshot();
    const auto text = snap->format_for_prompt({"customer"});

    CHECK(text.find("Table customer (客户, customers): Store customers") != std::string::npos);
    CHECK(text.find("  - customer_id integer PRIMARY KEY NOT NULL") != std::string::npos);
    CHECK(text.find("support_rep_id integer REFERENCES employee(employee_id)") != std::string::npos);
    CHECK(text.find("-- 名字") != std::string::npos);
    CHECK(text.find("Table invoice") == std::string::npos);

    CHECK(snap->format_for_prompt({}).find("Table app_setting") != std::string::npos);
}

// ============================================================================
// Join Graph
// ============================================================================

TEST_CASE("JoinGraph: built from foreign keys", "[catalog]") {
    const auto snap = make_chinook_catalog()->snapshot();
    const auto& graph = snap->join_graph();

    CHECK(graph.table_count() == 9);
    CHECK(graph.edges().size() == 7);
    CHECK(graph.has_table("app_setting"));
    CHECK(graph.neighbors("app_setting").empty());
    CHECK(graph.neighbors("no_such_table").empty());

    const auto& nb = graph.neighbors("customer");
    REQUIRE(nb.size() == 2);
    CHECK(nb[0].table == "employee");
    CHECK(nb[1].table == "invoice");
    CHECK(graph.edge(nb[1].edge_index).condition() == "invoice.customer_id = customer.customer_id");

    SECTION("Self references are kept as edges but not as neighbors") {
        CatalogLoader::LoadResult loaded = CatalogLoader::load_from_string(R"({"tables": [
            {"name": "employee",
             "columns": [{"name": "employee_id", "type": "integer"}, {"name": "reports_to", "type": "integer"}],
             "foreign_keys": [{"column": "reports_to", "ref_table": "employee", "ref_column": "employee_id"}]}
        ]})");
        REQUIRE(loaded.success);
        const JoinGraph self(loaded.tables);
        CHECK(self.edges().size() == 1);
        CHECK(self.neighbors("employee").empty());
    }
}

// ============================================================================
// RCU Catalog
// ============================================================================

TEST_CASE("SchemaCatalog: snapshot replacement", "[catalog]") {
    SECTION("Starts empty") {
        SchemaCatalog catalog;
        CHECK(catalog.version() == 0);
        REQUIRE(catalog.snapshot() != nullptr);
        CHECK(catalog.snapshot()->table_count() == 0);
        CHECK_FALSE(catalog.reload());
    }

    SECTION("Readers keep their snapshot across a reload") {
        int calls = 0;
        SchemaCatalog catalog([&calls]() -> Result<std::vector<TableSchema>> {
            ++calls;
            auto loaded = CatalogLoader::load_from_string(kChinookCatalogJson);
            if (calls == 2) loaded.tables.pop_back();
            return Result<std::vector<TableSchema>>::ok(std::move(loaded.tables));
        });

        REQUIRE(catalog.reload());
        const auto held = catalog.snapshot();
        REQUIRE(catalog.reload());

        CHECK(held->version() == 1);
        CHECK(held->table_count() == 9);
        CHECK(catalog.version() == 2);
        CHECK(catalog.snapshot()->table_count() == 8);
    }

    SECTION("Failed reload keeps the old snapshot") {
        bool fail = false;
        SchemaCatalog catalog([&fail]() -> Result<std::vector<TableSchema>> {
            if (fail) {
                return Result<std::vector<TableSchema>>::error(ErrorCategory::IO_ERROR, "gone");
            }
            return Result<std::vector<TableSchema>>::ok(
                CatalogLoader::load_from_string(kChinookCatalogJson).tables);
        });

        REQUIRE(catalog.reload());
        fail = true;
        CHECK_FALSE(catalog.reload());
        CHECK(catalog.version() == 1);
        CHECK(catalog.snapshot()->has_table("customer"));
    }
}
