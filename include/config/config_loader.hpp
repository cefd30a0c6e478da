#pragma once

#include "config/config_types.hpp"
#include "explorer/explorer_config.hpp"

#include <string>
#include <vector>

namespace apidocs {

// ============================================================================
// ExplorerServerConfig - Complete parsed configuration
// ============================================================================

struct ExplorerServerConfig {
    ServerConfig server;
    LoggingConfig logging;
    ExplorerSection explorer;
    AssetConfig assets;
    std::vector<DocumentSource> documents;
};

/// Options for make_explorer_config() equivalent to an [explorer] section.
[[nodiscard]] std::vector<ExplorerOption> to_explorer_options(const ExplorerSection& section);

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        ExplorerServerConfig config;

        static LoadResult ok(ExplorerServerConfig cfg) {
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
     * @param config_path Path to explorer.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// All validation errors; empty when the config is usable.
    [[nodiscard]] static std::vector<std::string> validate_config(const ExplorerServerConfig& config);
};

} // namespace apidocs
