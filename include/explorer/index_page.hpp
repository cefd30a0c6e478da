#pragma once

#include "core/error.hpp"
#include "explorer/explorer_config.hpp"

#include <string>

namespace apidocs {

/**
 * @brief Renders the explorer entry page from its configuration
 */
class ITemplateRenderer {
public:
    virtual ~ITemplateRenderer() = default;

    [[nodiscard]] virtual Result<std::string> render(const ExplorerConfig& config) const = 0;
};

/**
 * @brief Swagger UI bootstrap page
 *
 * Loads swagger-ui-bundle.js and swagger-ui-standalone-preset.js relative
 * to the mount prefix and calls SwaggerUIBundle() with the configured
 * options. url, doc_expansion and dom_id are escaped as JS string
 * literals; before_script, after_script, plugins and ui_config entries
 * are emitted verbatim. Output depends only on the config.
 */
class IndexPageRenderer : public ITemplateRenderer {
public:
    [[nodiscard]] Result<std::string> render(const ExplorerConfig& config) const override;
};

} // namespace apidocs
