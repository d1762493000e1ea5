#pragma once

#include "config/config_types.hpp"

#include <string>
#include <vector>

namespace nl2sql {

/**
 * @brief Extract typed config from nl2sql.toml (toml++)
 *
 * String values may reference environment variables as ${NAME}; unset
 * variables expand to nothing. A top-level `include = ["a.toml", ...]`
 * pulls in other files relative to the including file; the including file
 * wins on conflicts. Include depth is capped at 10.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        EngineConfig config;

        static LoadResult ok(EngineConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to nl2sql.toml
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string (no include support)
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Every problem found, empty when the config is usable.
    [[nodiscard]] static std::vector<std::string> validate_config(const EngineConfig& config);

    /// ${VAR} substitution; throws std::runtime_error on an unclosed "${".
    [[nodiscard]] static std::string expand_env_vars(const std::string& input);
};

} // namespace nl2sql
