#pragma once

#include "explorer/asset_server.hpp"
#include "explorer/document_registry.hpp"
#include "explorer/explorer_config.hpp"
#include "explorer/index_page.hpp"
#include "explorer/prefix_latch.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace apidocs {

/**
 * @brief HTTP handler serving the API explorer under one mount prefix
 *
 * Per GET request, on the last segment of the decoded request path:
 * - "index.html" → rendered entry page
 * - "doc.json"   → description document from the registry (500 if unavailable)
 * - ""           → 301 to <prefix>index.html
 * - anything else → delegated to the asset server
 *
 * Any other method gets 405. The prefix is latched from the first GET and
 * handed to the asset server once. Safe to call concurrently.
 */
class ExplorerHandler {
public:
    static constexpr std::string_view kIndexPage = "index.html";
    static constexpr std::string_view kDocumentPath = "doc.json";

    explicit ExplorerHandler(
        ExplorerConfig config = make_explorer_config(),
        std::shared_ptr<IDocumentRegistry> documents = DocumentRegistry::instance(),
        std::shared_ptr<ITemplateRenderer> renderer = std::make_shared<IndexPageRenderer>());

    ExplorerHandler(const ExplorerHandler&) = delete;
    ExplorerHandler& operator=(const ExplorerHandler&) = delete;

    void handle(const httplib::Request& req, httplib::Response& res);

    void operator()(const httplib::Request& req, httplib::Response& res) {
        handle(req, res);
    }

    /// Route every method under @p mount_point (e.g. "/swagger/") to this handler.
    /// The handler must outlive @p svr.
    void register_routes(httplib::Server& svr, const std::string& mount_point);

    [[nodiscard]] const ExplorerConfig& config() const { return config_; }
    [[nodiscard]] IAssetServer& asset_server() const { return *assets_; }

    /// Latched mount prefix; empty before the first GET.
    [[nodiscard]] const std::string& prefix() const { return latch_.prefix(); }

    struct Stats {
        uint64_t pages_rendered;
        uint64_t documents_served;
        uint64_t document_failures;
        uint64_t render_failures;
        uint64_t redirects;
        uint64_t assets_delegated;
        uint64_t method_rejects;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    void handle_index_page(httplib::Response& res, std::optional<std::string_view> content_type);
    void handle_document(httplib::Response& res, std::optional<std::string_view> content_type);
    void handle_redirect(httplib::Response& res);
    void handle_asset(const httplib::Request& req, httplib::Response& res);

    const ExplorerConfig config_;
    const std::shared_ptr<IAssetServer> assets_;
    const std::shared_ptr<IDocumentRegistry> documents_;
    const std::shared_ptr<ITemplateRenderer> renderer_;
    PrefixLatch latch_;

    std::atomic<uint64_t> pages_rendered_{0};
    std::atomic<uint64_t> documents_served_{0};
    std::atomic<uint64_t> document_failures_{0};
    std::atomic<uint64_t> render_failures_{0};
    std::atomic<uint64_t> redirects_{0};
    std::atomic<uint64_t> assets_delegated_{0};
    std::atomic<uint64_t> method_rejects_{0};
};

} // namespace apidocs
