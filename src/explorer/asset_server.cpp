#include "explorer/asset_server.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <array>
#include <format>
#include <fstream>
#include <iterator>
#include <mutex>
#include <optional>
#include <system_error>
#include <utility>

#ifndef APIDOCS_DEFAULT_ASSET_DIR
#define APIDOCS_DEFAULT_ASSET_DIR "swagger-ui"
#endif

namespace apidocs {

namespace {

void set_error(httplib::Response& res, ErrorCategory category) {
    if (category == ErrorCategory::ASSET_FORBIDDEN) {
        res.status = httplib::StatusCode::Forbidden_403;
        res.set_content(http::kForbiddenBody, http::kPlainTextContentType);
    } else {
        res.status = httplib::StatusCode::NotFound_404;
        res.set_content(http::kNotFoundBody, http::kPlainTextContentType);
    }
}

/// Keep a Content-Type already chosen by the caller; otherwise infer one.
std::string response_content_type(const httplib::Response& res, std::string_view path) {
    if (res.has_header(http::kContentTypeHeader)) {
        return res.get_header_value(http::kContentTypeHeader);
    }
    return std::string(asset_mime_type(path));
}

/// Path below @p prefix, or nullopt when the request is not under it.
std::optional<std::string> strip_prefix(const std::string& path, const std::string& prefix) {
    if (!utils::starts_with(path, prefix)) return std::nullopt;
    return path.substr(prefix.size());
}

} // anonymous namespace

std::string_view asset_mime_type(std::string_view path) {
    static constexpr std::array<std::pair<std::string_view, std::string_view>, 14> kMimeTable = {{
        {".html",  "text/html; charset=utf-8"},
        {".htm",   "text/html; charset=utf-8"},
        {".css",   "text/css; charset=utf-8"},
        {".js",    "application/javascript"},
        {".mjs",   "application/javascript"},
        {".map",   "application/json"},
        {".json",  "application/json; charset=utf-8"},
        {".png",   "image/png"},
        {".jpg",   "image/jpeg"},
        {".jpeg",  "image/jpeg"},
        {".gif",   "image/gif"},
        {".svg",   "image/svg+xml"},
        {".ico",   "image/x-icon"},
        {".txt",   "text/plain; charset=utf-8"},
    }};

    const auto slash = path.rfind('/');
    const auto dot = path.rfind('.');
    if (dot == std::string_view::npos || (slash != std::string_view::npos && dot < slash)) {
        return http::kOctetStreamContentType;
    }
    const std::string ext = utils::to_lower(std::string(path.substr(dot)));
    for (const auto& [known, type] : kMimeTable) {
        if (ext == known) return type;
    }
    return http::kOctetStreamContentType;
}

// ============================================================================
// DirectoryAssetServer
// ============================================================================

DirectoryAssetServer::DirectoryAssetServer(Config config)
    : config_(std::move(config)) {}

void DirectoryAssetServer::set_prefix(std::string prefix) {
    std::unique_lock lock(prefix_mutex_);
    prefix_ = std::move(prefix);
}

std::string DirectoryAssetServer::prefix() const {
    std::shared_lock lock(prefix_mutex_);
    return prefix_;
}

Result<std::filesystem::path> DirectoryAssetServer::resolve(const std::string& request_path) const {
    namespace fs = std::filesystem;
    using PathResult = Result<fs::path>;

    const auto rest = strip_prefix(request_path, prefix());
    if (!rest || rest->empty()) {
        return PathResult::error(ErrorCategory::ASSET_NOT_FOUND,
            std::format("{} is not an asset path", request_path));
    }

    std::error_code ec;
    const fs::path base = fs::weakly_canonical(config_.root, ec);
    if (ec) {
        return PathResult::error(ErrorCategory::ASSET_NOT_FOUND,
            std::format("Asset root {} unavailable: {}", config_.root.string(), ec.message()));
    }
    const fs::path full = fs::weakly_canonical(base / fs::path(*rest), ec);
    const fs::path relative = full.lexically_relative(base);
    if (ec || relative.empty() || *relative.begin() == "..") {
        return PathResult::error(ErrorCategory::ASSET_FORBIDDEN,
            std::format("{} escapes the asset root", request_path));
    }

    if (!fs::is_regular_file(full, ec)) {
        return PathResult::error(ErrorCategory::ASSET_NOT_FOUND,
            std::format("No asset at {}", full.string()));
    }
    return PathResult::ok(full);
}

void DirectoryAssetServer::serve(const httplib::Request& req, httplib::Response& res) {
    const auto file = resolve(req.path);
    if (file.is_error()) {
        if (file.error_category() == ErrorCategory::ASSET_FORBIDDEN) {
            utils::log::warn(file.error_message());
        }
        set_error(res, file.error_category());
        return;
    }

    std::ifstream in(file.value(), std::ios::binary);
    if (!in) {
        set_error(res, ErrorCategory::ASSET_NOT_FOUND);
        return;
    }
    std::string body{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};

    const auto type = response_content_type(res, file.value().string());
    res.status = httplib::StatusCode::OK_200;
    if (config_.cache_max_age_seconds > 0) {
        res.set_header(http::kCacheControlHeader,
            std::format("public, max-age={}", config_.cache_max_age_seconds));
    }
    res.set_content(std::move(body), type);
}

// ============================================================================
// InMemoryAssetServer
// ============================================================================

InMemoryAssetServer::InMemoryAssetServer(std::unordered_map<std::string, std::string> files)
    : files_(std::move(files)) {}

void InMemoryAssetServer::set_prefix(std::string prefix) {
    std::unique_lock lock(prefix_mutex_);
    prefix_ = std::move(prefix);
}

std::string InMemoryAssetServer::prefix() const {
    std::shared_lock lock(prefix_mutex_);
    return prefix_;
}

Result<std::string> InMemoryAssetServer::lookup(const std::string& request_path) const {
    const auto rest = strip_prefix(request_path, prefix());
    const auto it = rest ? files_.find(*rest) : files_.end();
    if (it == files_.end()) {
        return Result<std::string>::error(ErrorCategory::ASSET_NOT_FOUND,
            std::format("No embedded asset at {}", request_path));
    }
    return Result<std::string>::ok(it->second);
}

void InMemoryAssetServer::serve(const httplib::Request& req, httplib::Response& res) {
    auto content = lookup(req.path);
    if (content.is_error()) {
        set_error(res, content.error_category());
        return;
    }
    res.status = httplib::StatusCode::OK_200;
    res.set_content(std::move(content.value()), response_content_type(res, req.path));
}

// ============================================================================
// Process default
// ============================================================================

std::shared_ptr<IAssetServer> default_asset_server() {
    static const auto server = std::make_shared<DirectoryAssetServer>(
        DirectoryAssetServer::Config{APIDOCS_DEFAULT_ASSET_DIR});
    return server;
}

} // namespace apidocs
