#include "explorer/index_page.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace apidocs {

namespace {

constexpr const char* kPageHead = R"HTML(<!-- HTML for static distribution bundle build -->
<!DOCTYPE html>
<html lang="en">
<head>
  <meta charset="UTF-8">
  <title>Swagger UI</title>
  <link rel="stylesheet" type="text/css" href="./swagger-ui.css" >
  <link rel="icon" type="image/png" href="./favicon-32x32.png" sizes="32x32" />
  <link rel="icon" type="image/png" href="./favicon-16x16.png" sizes="16x16" />
  <style>
    html
    {
        box-sizing: border-box;
        overflow: -moz-scrollbars-vertical;
        overflow-y: scroll;
    }
    *,
    *:before,
    *:after
    {
        box-sizing: inherit;
    }

    body {
      margin:0;
      background: #fafafa;
    }
  </style>
</head>

<body>
)HTML";

constexpr const char* kBundleScripts = R"HTML(
<script src="./swagger-ui-bundle.js" charset="UTF-8"> </script>
<script src="./swagger-ui-standalone-preset.js" charset="UTF-8"> </script>
<script>
window.onload = function() {
)HTML";

constexpr const char* kPageTail = R"HTML(}
</script>
</body>

</html>
)HTML";

std::string escape_html_attr(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (const char c : s) {
        switch (c) {
            case '&':  result += "&amp;"; break;
            case '<':  result += "&lt;"; break;
            case '>':  result += "&gt;"; break;
            case '"':  result += "&#34;"; break;
            case '\'': result += "&#39;"; break;
            default:   result += c;
        }
    }
    return result;
}

std::string build_page(const ExplorerConfig& config) {
    std::string html;
    html.reserve(4096);

    html += kPageHead;
    html += std::format("<div id=\"{}\"></div>\n", escape_html_attr(config.dom_id));
    html += kBundleScripts;

    if (!config.before_script.empty()) {
        html += std::format("  {}\n", config.before_script);
    }

    html += "  // Build a system\n";
    html += "  const ui = SwaggerUIBundle({\n";
    html += std::format("    url: \"{}\",\n", utils::escape_js_string(config.url));
    html += std::format("    deepLinking: {},\n", utils::booltostr(config.deep_linking));
    html += std::format("    docExpansion: \"{}\",\n", utils::escape_js_string(config.doc_expansion));
    html += std::format("    dom_id: \"#{}\",\n", utils::escape_js_string(config.dom_id));
    html += std::format("    persistAuthorization: {},\n", utils::booltostr(config.persist_authorization));
    html += "    validatorUrl: null,\n";
    html += "    presets: [\n";
    html += "      SwaggerUIBundle.presets.apis,\n";
    html += "      SwaggerUIStandalonePreset\n";
    html += "    ],\n";
    html += "    plugins: [\n";
    html += "      SwaggerUIBundle.plugins.DownloadUrl";
    for (const auto& plugin : config.plugins) {
        html += std::format(",\n      {}", plugin);
    }
    html += "\n    ],\n";
    for (const auto& [key, value] : config.ui_config) {
        html += std::format("    {}: {},\n", key, value);
    }
    html += "    layout: \"StandaloneLayout\"\n";
    html += "  })\n\n";
    html += "  window.ui = ui\n";

    if (!config.after_script.empty()) {
        html += std::format("  {}\n", config.after_script);
    }

    html += kPageTail;
    return html;
}

} // anonymous namespace

Result<std::string> IndexPageRenderer::render(const ExplorerConfig& config) const {
    try {
        return Result<std::string>::ok(build_page(config));
    } catch (const std::exception& e) {
        return Result<std::string>::error(ErrorCategory::RENDER_ERROR,
            std::format("Rendering entry page failed: {}", e.what()));
    }
}

} // namespace apidocs
