#pragma once

#include <string>
#include <string_view>

namespace apidocs {

/**
 * @brief Mount prefix and final path segment of a raw request URI
 *
 * "/api/docs/index.html?x=1" → prefix "/api/docs/", relative "index.html"
 * "/api/docs/"               → prefix "/api/docs/", relative ""
 */
struct ResolvedPath {
    std::string prefix;    // Up to and including the last '/'
    std::string relative;  // Final segment, query and fragment removed
};

/**
 * @brief Split a raw request URI (request target) into prefix and relative path.
 *
 * The query/fragment is cut at the first '?' or '#'; later '?' characters
 * belong to the query. A path with no '/' yields an empty prefix and the
 * whole path as the relative part. Never fails.
 */
[[nodiscard]] ResolvedPath resolve_request_uri(std::string_view uri);

} // namespace apidocs
