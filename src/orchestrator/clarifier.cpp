#include "orchestrator/clarifier.hpp"
#include "core/utils.hpp"
#include "orchestrator/prompts.hpp"

#include <format>
#include <regex>

namespace nl2sql {

namespace {

// "1. text", "2) text", "3、text" (、 is multi-byte, hence the alternation)
const std::regex& option_pattern() {
    static const std::regex re(R"(^\s*([0-9]+)\s*(?:\.|\)|、|．)\s*(.+)$)");
    return re;
}

constexpr std::string_view kQuestionLabels[] = {
    "question:", "question：", "问题:", "问题：", "q:"
};

std::optional<std::string> labelled_question(const std::string& line) {
    const auto lowered = utils::to_lower(line);
    for (const auto label : kQuestionLabels) {
        if (lowered.starts_with(label)) {
            return utils::trim(std::string_view(line).substr(label.size()));
        }
    }
    return std::nullopt;
}

constexpr std::string_view kQuestionSlot = "{question}";
constexpr std::string_view kAnswerSlot = "{answer}";

} // anonymous namespace

Clarifier::Clarifier(std::shared_ptr<ITextCompleter> completer, std::string merge_template)
    : completer_(std::move(completer)), merge_template_(std::move(merge_template)) {}

// ============================================================================
// Question
// ============================================================================

ClarificationQuestion Clarifier::ask(std::string_view question,
                                     const AmbiguityFinding& finding,
                                     const std::string& memory_context) const {
    CompletionRequest request;
    request.use_case = CompletionUseCase::CLARIFICATION;
    request.system_prompt = std::string(prompts::kClarificationSystem);
    request.user_prompt = prompts::clarification_user_prompt(question, finding.reason);
    request.context = memory_context;

    const auto response = completer_->complete(request);
    if (!response.success) {
        utils::log::warn(std::format("Clarification: text completion failed ({}), using fallback",
                                     response.error));
        return fallback_question(finding);
    }

    auto parsed = parse_question(response.content);
    if (!parsed) {
        utils::log::warn("Clarification: unparseable question, using fallback");
        return fallback_question(finding);
    }
    if (parsed->options.empty()) {
        parsed->options = fallback_question(finding).options;
    }
    parsed->rule = finding.rule;
    parsed->kind = finding.kind;
    return *parsed;
}

std::optional<ClarificationQuestion> Clarifier::parse_question(std::string_view text) {
    ClarificationQuestion result;
    std::string first_plain_line;

    for (const auto& raw_line : utils::split(std::string(text), '\n')) {
        const auto line = utils::trim(raw_line);
        if (line.empty() || line.starts_with("```")) continue;

        if (auto q = labelled_question(line)) {
            if (result.question.empty()) result.question = std::move(*q);
            continue;
        }

        std::smatch m;
        if (std::regex_match(line, m, option_pattern())) {
            if (result.options.size() < kMaxOptions) {
                result.options.push_back(utils::trim(m[2].str()));
            }
            continue;
        }

        if (first_plain_line.empty()) first_plain_line = line;
    }

    if (result.question.empty()) result.question = std::move(first_plain_line);
    if (result.question.empty()) return std::nullopt;
    return result;
}

ClarificationQuestion Clarifier::fallback_question(const AmbiguityFinding& finding) {
    ClarificationQuestion q;
    q.rule = finding.rule;
    q.kind = finding.kind;

    switch (finding.kind) {
        case AmbiguityKind::REFERENCE:
            q.question = "Which records are you referring to?";
            q.options = {"The results of my previous question", "All records"};
            break;
        case AmbiguityKind::TIME_RANGE:
            q.question = "Which time range should the query cover?";
            q.options = {"This year", "Last year", "Past 30 days", "All time"};
            break;
        case AmbiguityKind::METRIC:
            q.question = "How should the result be measured?";
            q.options = {"By total sales amount", "By number of orders", "By quantity sold"};
            break;
        case AmbiguityKind::AGGREGATION:
            q.question = "How should the data be summarized?";
            q.options = {"Count", "Total (sum)", "Average"};
            break;
        default:
            q.question = "Could you describe in more detail what you want to see?";
            q.options = {"Show the detailed rows", "Show a total count"};
            break;
    }
    return q;
}

// ============================================================================
// Answer Merge
// ============================================================================

std::string Clarifier::resolve_answer(std::string_view answer,
                                      const std::vector<std::string>& options) {
    auto trimmed = utils::trim(answer);
    if (const auto n = utils::try_parse_int<size_t>(trimmed)) {
        if (*n >= 1 && *n <= options.size()) {
            return options[*n - 1];
        }
    }
    return trimmed;
}

std::string Clarifier::merge(std::string_view working_question,
                             std::string_view answer,
                             const std::vector<std::string>& options) const {
    const auto resolved = resolve_answer(answer, options);
    if (resolved.empty()) return std::string(working_question);

    // Single pass; each slot is filled once
    std::string merged;
    merged.reserve(merge_template_.size() + working_question.size() + resolved.size());
    bool question_done = false;
    bool answer_done = false;
    const std::string_view tpl = merge_template_;
    size_t i = 0;
    while (i < tpl.size()) {
        if (!question_done && tpl.substr(i).starts_with(kQuestionSlot)) {
            merged += working_question;
            i += kQuestionSlot.size();
            question_done = true;
        } else if (!answer_done && tpl.substr(i).starts_with(kAnswerSlot)) {
            merged += resolved;
            i += kAnswerSlot.size();
            answer_done = true;
        } else {
            merged += tpl[i++];
        }
    }
    return merged;
}

} // namespace nl2sql
