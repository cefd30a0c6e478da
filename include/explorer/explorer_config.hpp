#pragma once

#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace apidocs {

class IAssetServer;

/// Registry name used when no instance name is configured.
inline constexpr const char* kDefaultInstanceName = "swagger";

/**
 * @brief Runtime options of one mounted API explorer
 *
 * Built once by make_explorer_config() and never modified afterwards.
 * Script-typed fields (before_script, after_script, plugins, ui_config)
 * are emitted verbatim into the entry page.
 */
struct ExplorerConfig {
    std::string url = "doc.json";              // Description document URL advertised to the UI
    std::string doc_expansion = "list";        // list | full | none (not validated)
    std::string dom_id = "swagger-ui";
    std::string instance_name = kDefaultInstanceName;  // Document registry key
    bool deep_linking = true;
    bool persist_authorization = false;
    std::string before_script;
    std::string after_script;
    std::vector<std::string> plugins;
    std::map<std::string, std::string> ui_config;
    std::shared_ptr<IAssetServer> asset_server;  // null = default_asset_server()
};

using ExplorerOption = std::function<void(ExplorerConfig&)>;

/**
 * @brief Apply options in order over the defaults.
 *
 * An instance name left empty by the options falls back to
 * kDefaultInstanceName.
 */
[[nodiscard]] ExplorerConfig make_explorer_config(std::initializer_list<ExplorerOption> options);
[[nodiscard]] ExplorerConfig make_explorer_config(const std::vector<ExplorerOption>& options = {});

// ============================================================================
// Option factories
// ============================================================================

namespace options {

[[nodiscard]] ExplorerOption url(std::string url);
[[nodiscard]] ExplorerOption doc_expansion(std::string expansion);
[[nodiscard]] ExplorerOption dom_id(std::string id);
[[nodiscard]] ExplorerOption instance_name(std::string name);
[[nodiscard]] ExplorerOption deep_linking(bool enabled);
[[nodiscard]] ExplorerOption persist_authorization(bool enabled);
[[nodiscard]] ExplorerOption before_script(std::string js);
[[nodiscard]] ExplorerOption after_script(std::string js);
[[nodiscard]] ExplorerOption plugins(std::vector<std::string> plugins);
[[nodiscard]] ExplorerOption ui_config(std::map<std::string, std::string> props);

/// Serve the UI bundle from @p server instead of the process default.
[[nodiscard]] ExplorerOption asset_server(std::shared_ptr<IAssetServer> server);

} // namespace options

} // namespace apidocs
