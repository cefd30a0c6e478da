#pragma once

#include <string>
#include <string_view>

namespace apidocs::http {

// std::string because cpp-httplib APIs require const std::string&
inline const std::string kContentTypeHeader = "Content-Type";
inline const std::string kCacheControlHeader = "Cache-Control";
inline const std::string kMethodGet = "GET";

inline constexpr const char* kHtmlContentType = "text/html; charset=utf-8";
inline constexpr const char* kCssContentType = "text/css; charset=utf-8";
inline constexpr const char* kJavaScriptContentType = "application/javascript";
inline constexpr const char* kPngContentType = "image/png";
inline constexpr const char* kJsonContentType = "application/json; charset=utf-8";
inline constexpr const char* kPlainTextContentType = "text/plain; charset=utf-8";
inline constexpr const char* kOctetStreamContentType = "application/octet-stream";

inline constexpr const char* kMethodNotAllowedBody = "Method not allowed";
inline constexpr const char* kInternalServerErrorBody = "Internal Server Error";
inline constexpr const char* kNotFoundBody = "Not Found";
inline constexpr const char* kForbiddenBody = "Forbidden";

} // namespace apidocs::http
