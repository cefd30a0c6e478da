#pragma once

#include <optional>
#include <string_view>

namespace apidocs {

/// Content-Type for the explorer's well-known extensions (".html", ".css",
/// ".js", ".png", ".json"); case-sensitive. nullopt = leave header unset.
[[nodiscard]] std::optional<std::string_view> content_type_for_extension(std::string_view ext);

/// Extension of the final element of @p path, including the dot ("" if none).
[[nodiscard]] std::string_view path_extension(std::string_view path);

[[nodiscard]] inline std::optional<std::string_view> content_type_for_path(std::string_view path) {
    return content_type_for_extension(path_extension(path));
}

} // namespace apidocs
