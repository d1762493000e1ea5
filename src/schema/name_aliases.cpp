#include "schema/name_aliases.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>

namespace nl2sql::name_aliases {

namespace {

void add_unique(std::vector<std::string>& out, std::string term) {
    if (term.empty()) return;
    if (std::find(out.begin(), out.end(), term) == out.end()) {
        out.push_back(std::move(term));
    }
}

bool is_ascii_name(std::string_view name) {
    return !name.empty() && static_cast<unsigned char>(name.front()) < 0x80;
}

} // anonymous namespace

std::string to_snake_case(std::string_view name) {
    std::string out;
    out.reserve(name.size() + 4);
    for (size_t i = 0; i < name.size(); ++i) {
        const auto c = static_cast<unsigned char>(name[i]);
        if (std::isupper(c) && i > 0) {
            const auto prev = static_cast<unsigned char>(name[i - 1]);
            const bool next_lower = i + 1 < name.size() &&
                std::islower(static_cast<unsigned char>(name[i + 1]));
            // "CustomerId" -> customer_id, "HTTPCode" -> http_code
            if (std::islower(prev) || std::isdigit(prev) || (std::isupper(prev) && next_lower)) {
                out += '_';
            }
        }
        out += static_cast<char>(std::tolower(c));
    }
    return out;
}

std::vector<std::string> for_column(std::string_view name) {
    std::vector<std::string> terms;
    add_unique(terms, utils::to_lower(name));
    if (!is_ascii_name(name)) return terms;

    const auto snake = to_snake_case(name);
    add_unique(terms, snake);
    if (snake.find('_') != std::string::npos) {
        std::string spaced = snake;
        std::replace(spaced.begin(), spaced.end(), '_', ' ');
        add_unique(terms, std::move(spaced));
    }
    return terms;
}

std::vector<std::string> for_table(std::string_view name) {
    std::vector<std::string> terms = for_column(name);
    if (!is_ascii_name(name)) return terms;

    const size_t base_count = terms.size();
    for (size_t i = 0; i < base_count; ++i) {
        const std::string term = terms[i];
        if (term.size() > 3 && term.ends_with('s') && !term.ends_with("ss")) {
            add_unique(terms, term.substr(0, term.size() - 1));
        } else {
            add_unique(terms, term + "s");
            add_unique(terms, term + "es");
        }
    }
    return terms;
}

} // namespace nl2sql::name_aliases
