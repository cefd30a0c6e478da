#include "explorer/content_type.hpp"
#include "server/http_constants.hpp"

#include <array>
#include <utility>

namespace apidocs {

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 5> kExtensionTable = {{
    {".html", http::kHtmlContentType},
    {".css",  http::kCssContentType},
    {".js",   http::kJavaScriptContentType},
    {".png",  http::kPngContentType},
    {".json", http::kJsonContentType},
}};

} // anonymous namespace

std::optional<std::string_view> content_type_for_extension(std::string_view ext) {
    for (const auto& [known, type] : kExtensionTable) {
        if (ext == known) return type;
    }
    return std::nullopt;
}

std::string_view path_extension(std::string_view path) {
    for (size_t i = path.size(); i > 0; --i) {
        const char c = path[i - 1];
        if (c == '/') break;
        if (c == '.') return path.substr(i - 1);
    }
    return {};
}

} // namespace apidocs
