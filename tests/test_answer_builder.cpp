#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "orchestrator/answer_builder.hpp"
#include "mocks/mock_text_completer.hpp"

#include <memory>
#include <string>

using namespace nl2sql;
using nl2sql::testing::MockTextCompleter;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

namespace {

ExecutionResult genre_result(size_t rows) {
    ExecutionResult r;
    r.success = true;
    r.columns = {"name", "total"};
    const char* genres[] = {"Rock", "Jazz", "Metal"};
    for (size_t i = 0; i < rows; ++i) {
        r.rows.push_back({genres[i % 3], std::to_string(i + 1)});
    }
    return r;
}

} // anonymous namespace

TEST_CASE("AnswerBuilder: data summary", "[answer]") {
    SECTION("Empty result") {
        ExecutionResult empty;
        empty.success = true;
        empty.columns = {"name"};
        CHECK(AnswerBuilder::format_data_summary(empty) == AnswerBuilder::kEmptyResultText);
    }

    SECTION("Small result is shown in full") {
        const auto text = AnswerBuilder::format_data_summary(genre_result(3));
        CHECK(text == "3 rows:\n"
                      "| name | total |\n"
                      "| --- | --- |\n"
                      "| Rock | 1 |\n"
                      "| Jazz | 2 |\n"
                      "| Metal | 3 |\n");
    }

    SECTION("Large result is sampled with statistics") {
        const auto text = AnswerBuilder::format_data_summary(genre_result(12));
        CHECK_THAT(text, StartsWith("12 rows. First 5 rows:\n"));
        CHECK_THAT(text, ContainsSubstring("| Jazz | 5 |"));
        CHECK_THAT(text, !ContainsSubstring("| Rock | 7 |"));
        CHECK_THAT(text, ContainsSubstring("- total: max=12, min=1, avg=6.50, sum=78, count=12"));
        CHECK_THAT(text, ContainsSubstring("- name: 3 unique of 12 values"));
    }

    SECTION("Truncation is mentioned") {
        auto result = genre_result(11);
        result.truncated = true;
        CHECK_THAT(AnswerBuilder::format_data_summary(result), StartsWith("11 rows (truncated)."));
    }
}

TEST_CASE("AnswerBuilder: key statistics", "[answer]") {
    ExecutionResult r;
    r.columns = {"mixed", "blank"};
    r.rows = {{"1.5", ""}, {"n/a", ""}, {"2.5", ""}};

    const auto stats = AnswerBuilder::key_statistics(r);
    REQUIRE(stats.size() == 1);
    CHECK(stats[0].column == "mixed");
    CHECK(stats[0].numeric);
    CHECK(stats[0].count == 2);
    CHECK(stats[0].total_count == 3);
    CHECK(stats[0].sum == 4.0);
    CHECK(stats[0].avg == 2.0);
}

TEST_CASE("AnswerBuilder: answer text", "[answer]") {
    auto completer = std::make_shared<MockTextCompleter>();
    AnswerBuilder builder(completer);
    const auto result = genre_result(3);

    SECTION("Collaborator answer") {
        completer->push(CompletionUseCase::ANSWER, "  Rock leads the list.  ");
        CHECK(builder.build("Top genres?", "SELECT name, total FROM x", result) == "Rock leads the list.");

        const auto requests = completer->requests_for(CompletionUseCase::ANSWER);
        REQUIRE(requests.size() == 1);
        CHECK(requests[0].temperature == 0.3);
        CHECK_THAT(requests[0].user_prompt, ContainsSubstring("SELECT name, total FROM x"));
        CHECK_THAT(requests[0].user_prompt, ContainsSubstring("| Metal | 3 |"));
    }

    SECTION("Collaborator failure falls back") {
        completer->push_failure(CompletionUseCase::ANSWER);
        CHECK(builder.build("Top genres?", "SELECT 1", result) == "Query succeeded and returned 3 rows.");
    }

    SECTION("Blank reply falls back") {
        completer->push(CompletionUseCase::ANSWER, "   ");
        CHECK(builder.build("Top genres?", "SELECT 1", result) == "Query succeeded and returned 3 rows.");
    }

    SECTION("Empty result fallback") {
        completer->push_failure(CompletionUseCase::ANSWER);
        CHECK(builder.build("Top genres?", "SELECT 1", ExecutionResult{}) == AnswerBuilder::kEmptyResultText);
    }
}
