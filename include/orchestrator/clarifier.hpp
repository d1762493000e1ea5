#pragma once

#include "intent/ambiguity_rules.hpp"
#include "llm/text_completer.hpp"
#include "orchestrator/session_state.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nl2sql {

/**
 * @brief Closed-form clarification questions and answer merging
 *
 * The question itself comes from the text-completion collaborator, grounded
 * in the recent session history. When the collaborator fails or replies in
 * an unusable shape, a fixed question for the ambiguity kind is used.
 */
class Clarifier {
public:
    static constexpr size_t kMaxOptions = 5;
    static constexpr std::string_view kDefaultMergeTemplate = "{question} ({answer})";

    Clarifier(std::shared_ptr<ITextCompleter> completer,
              std::string merge_template = std::string(kDefaultMergeTemplate));

    [[nodiscard]] ClarificationQuestion ask(std::string_view question,
                                            const AmbiguityFinding& finding,
                                            const std::string& memory_context) const;

    /**
     * @brief Compose the user's answer into the working question
     *
     * An answer that is just an option number ("2") is replaced by that
     * option's text first. Substitution is literal: {question} and {answer}
     * are replaced once each.
     */
    [[nodiscard]] std::string merge(std::string_view working_question,
                                    std::string_view answer,
                                    const std::vector<std::string>& options) const;

    /**
     * @brief Parse "Question: ..." / "问题：..." plus numbered options
     *
     * Options may be numbered "1.", "1)" or "1、". Without a labelled line
     * the first non-option line is the question. Extra options are dropped.
     */
    [[nodiscard]] static std::optional<ClarificationQuestion> parse_question(std::string_view text);

    [[nodiscard]] static ClarificationQuestion fallback_question(const AmbiguityFinding& finding);

    /// Option text for a numeric answer in range, else the trimmed answer.
    [[nodiscard]] static std::string resolve_answer(std::string_view answer,
                                                    const std::vector<std::string>& options);

    [[nodiscard]] const std::string& merge_template() const { return merge_template_; }

private:
    std::shared_ptr<ITextCompleter> completer_;
    std::string merge_template_;
};

} // namespace nl2sql
