#pragma once

#include "config/config_types.hpp"

#include <string>
#include <vector>

namespace keygate {

// ============================================================================
// ConfigLoader - Extract typed config from TOML or JSON
// ============================================================================

/**
 * @brief Builds a ProxyConfig from a config file
 *
 * Files ending in ".json" are parsed with glaze, everything else as TOML
 * with toml++. Both go through the same section extractors, so the key
 * names are identical in either format. "${VAR}" in any string value is
 * replaced by the environment variable (empty when unset).
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        ProxyConfig config;

        static LoadResult ok(ProxyConfig cfg) {
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

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    [[nodiscard]] static LoadResult load_from_json(const std::string& json_content);

    // Every problem found, empty when the config is usable
    [[nodiscard]] static std::vector<std::string> validate_config(const ProxyConfig& config);
};

} // namespace keygate
