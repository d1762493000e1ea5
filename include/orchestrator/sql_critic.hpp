#pragma once

#include "core/types.hpp"
#include "llm/text_completer.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace nl2sql {

/**
 * @brief Produces a repair rationale for failed SQL
 *
 * Only explains; the orchestrator owns the attempt budget and feeds the
 * rationale back into generation. Never fails: when the collaborator is
 * unavailable the rationale is built from the diagnostics alone.
 */
class SqlCritic {
public:
    explicit SqlCritic(std::shared_ptr<ITextCompleter> completer);

    [[nodiscard]] std::string critique(std::string_view question,
                                       std::string_view sql,
                                       const std::vector<Diagnostic>& diagnostics,
                                       std::string_view schema) const;

    /// Rationale used when the collaborator gives nothing usable.
    [[nodiscard]] static std::string fallback_rationale(const std::vector<Diagnostic>& diagnostics);

private:
    std::shared_ptr<ITextCompleter> completer_;
};

} // namespace nl2sql
