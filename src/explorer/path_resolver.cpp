#include "explorer/path_resolver.hpp"

namespace apidocs {

ResolvedPath resolve_request_uri(std::string_view uri) {
    const auto query_pos = uri.find_first_of("?#");
    const std::string_view path = (query_pos == std::string_view::npos)
        ? uri : uri.substr(0, query_pos);

    const auto slash = path.rfind('/');
    if (slash == std::string_view::npos) {
        return ResolvedPath{std::string(), std::string(path)};
    }
    return ResolvedPath{
        std::string(path.substr(0, slash + 1)),
        std::string(path.substr(slash + 1))};
}

} // namespace apidocs
