#pragma once

#include "core/error.hpp"

#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
}

namespace apidocs {

/**
 * @brief Serves the static files of the UI bundle (scripts, styles, images)
 *
 * The explorer writes the mount prefix once, on its first request; the
 * asset server strips it from request paths before looking up files.
 */
class IAssetServer {
public:
    virtual ~IAssetServer() = default;

    virtual void set_prefix(std::string prefix) = 0;
    [[nodiscard]] virtual std::string prefix() const = 0;

    /// Owns the whole response: status, body, headers.
    virtual void serve(const httplib::Request& req, httplib::Response& res) = 0;
};

/// MIME type by extension, case-insensitive. Unknown → application/octet-stream.
[[nodiscard]] std::string_view asset_mime_type(std::string_view path);

/**
 * @brief Asset server backed by a directory on disk
 *
 * - Request path outside the prefix, missing file, directory → 404
 * - Path escaping the root after canonicalisation → 403
 * - Content-Type is only set when the response carries none yet
 */
class DirectoryAssetServer : public IAssetServer {
public:
    struct Config {
        std::filesystem::path root;
        int cache_max_age_seconds = 3600;  // 0 = no Cache-Control header
    };

    explicit DirectoryAssetServer(Config config);

    void set_prefix(std::string prefix) override;
    [[nodiscard]] std::string prefix() const override;
    void serve(const httplib::Request& req, httplib::Response& res) override;

    /// File backing @p request_path: ASSET_NOT_FOUND outside the prefix or for a
    /// missing file, ASSET_FORBIDDEN when it escapes the root.
    [[nodiscard]] Result<std::filesystem::path> resolve(const std::string& request_path) const;

    [[nodiscard]] const std::filesystem::path& root() const { return config_.root; }

private:
    Config config_;
    mutable std::shared_mutex prefix_mutex_;
    std::string prefix_;
};

/**
 * @brief Asset server over a fixed in-memory file table
 *
 * Keys are paths relative to the prefix ("swagger-ui.css").
 */
class InMemoryAssetServer : public IAssetServer {
public:
    explicit InMemoryAssetServer(std::unordered_map<std::string, std::string> files = {});

    void set_prefix(std::string prefix) override;
    [[nodiscard]] std::string prefix() const override;
    void serve(const httplib::Request& req, httplib::Response& res) override;

    /// Contents stored for @p request_path; ASSET_NOT_FOUND otherwise.
    [[nodiscard]] Result<std::string> lookup(const std::string& request_path) const;

private:
    const std::unordered_map<std::string, std::string> files_;
    mutable std::shared_mutex prefix_mutex_;
    std::string prefix_;
};

/// Process-wide asset server used when ExplorerConfig::asset_server is null.
/// Rooted at APIDOCS_DEFAULT_ASSET_DIR.
[[nodiscard]] std::shared_ptr<IAssetServer> default_asset_server();

} // namespace apidocs
