#include "explorer/explorer_handler.hpp"
#include "explorer/content_type.hpp"
#include "explorer/path_resolver.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>

namespace apidocs {

namespace {

constexpr auto kRelaxed = std::memory_order_relaxed;

void set_internal_error(httplib::Response& res) {
    res.status = httplib::StatusCode::InternalServerError_500;
    res.set_content(http::kInternalServerErrorBody, http::kPlainTextContentType);
}

/// Mount points are plain paths; quote regex metacharacters for httplib's matcher.
std::string escape_regex(const std::string& s) {
    std::string result;
    result.reserve(s.size() + 8);
    for (const char c : s) {
        switch (c) {
            case '\\': case '^': case '$': case '.': case '|': case '?':
            case '*': case '+': case '(': case ')': case '[': case ']':
            case '{': case '}':
                result += '\\';
                [[fallthrough]];
            default:
                result += c;
        }
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// Constructor
// ============================================================================

ExplorerHandler::ExplorerHandler(
    ExplorerConfig config,
    std::shared_ptr<IDocumentRegistry> documents,
    std::shared_ptr<ITemplateRenderer> renderer)
    : config_(std::move(config)),
      assets_(config_.asset_server ? config_.asset_server : default_asset_server()),
      documents_(documents ? std::move(documents) : DocumentRegistry::instance()),
      renderer_(renderer ? std::move(renderer) : std::make_shared<IndexPageRenderer>()) {}

// ============================================================================
// Route registration
// ============================================================================

void ExplorerHandler::register_routes(httplib::Server& svr, const std::string& mount_point) {
    const std::string pattern = escape_regex(mount_point) + ".*";
    auto handler = [this](const httplib::Request& req, httplib::Response& res) {
        handle(req, res);
    };

    // Non-GET verbs are routed too, so they get 405 instead of the server's 404
    svr.Get(pattern, handler);
    svr.Post(pattern, handler);
    svr.Put(pattern, handler);
    svr.Patch(pattern, handler);
    svr.Delete(pattern, handler);
    svr.Options(pattern, handler);
}

// ============================================================================
// Dispatch
// ============================================================================

void ExplorerHandler::handle(const httplib::Request& req, httplib::Response& res) {
    if (req.method != http::kMethodGet) {
        method_rejects_.fetch_add(1, kRelaxed);
        res.status = httplib::StatusCode::MethodNotAllowed_405;
        res.set_content(http::kMethodNotAllowedBody, http::kPlainTextContentType);
        return;
    }

    // Decoded path, the same form the asset server strips the prefix from
    const auto resolved = resolve_request_uri(req.path);
    latch_.bind(resolved.prefix, *assets_);

    const auto content_type = content_type_for_path(resolved.relative);
    if (content_type) {
        res.set_header(http::kContentTypeHeader, std::string(*content_type));
    }

    if (resolved.relative == kIndexPage) {
        handle_index_page(res, content_type);
    } else if (resolved.relative == kDocumentPath) {
        handle_document(res, content_type);
    } else if (resolved.relative.empty()) {
        handle_redirect(res);
    } else {
        handle_asset(req, res);
    }
}

// ============================================================================
// Handler: GET <prefix>index.html
// ============================================================================

void ExplorerHandler::handle_index_page(httplib::Response& res,
                                        std::optional<std::string_view> content_type) {
    auto page = renderer_->render(config_);
    if (page.is_error()) {
        render_failures_.fetch_add(1, kRelaxed);
        utils::log::error(std::format("Explorer entry page unavailable ({}): {}",
            error_category_to_string(page.error_category()), page.error_message()));
        set_internal_error(res);
        return;
    }

    pages_rendered_.fetch_add(1, kRelaxed);
    res.status = httplib::StatusCode::OK_200;
    res.set_content(std::move(page.value()),
        std::string(content_type.value_or(http::kHtmlContentType)));
}

// ============================================================================
// Handler: GET <prefix>doc.json
// ============================================================================

void ExplorerHandler::handle_document(httplib::Response& res,
                                      std::optional<std::string_view> content_type) {
    auto doc = documents_->read_doc(config_.instance_name);
    if (doc.is_error()) {
        document_failures_.fetch_add(1, kRelaxed);
        utils::log::warn(std::format("Description document '{}' unavailable ({}): {}",
            config_.instance_name, error_category_to_string(doc.error_category()),
            doc.error_message()));
        set_internal_error(res);
        return;
    }

    documents_served_.fetch_add(1, kRelaxed);
    res.status = httplib::StatusCode::OK_200;
    res.set_content(std::move(doc.value()),
        std::string(content_type.value_or(http::kJsonContentType)));
}

// ============================================================================
// Handler: GET <prefix>
// ============================================================================

void ExplorerHandler::handle_redirect(httplib::Response& res) {
    redirects_.fetch_add(1, kRelaxed);
    res.set_redirect(latch_.prefix() + std::string(kIndexPage),
        httplib::StatusCode::MovedPermanently_301);
}

// ============================================================================
// Handler: GET <prefix><asset>
// ============================================================================

void ExplorerHandler::handle_asset(const httplib::Request& req, httplib::Response& res) {
    assets_delegated_.fetch_add(1, kRelaxed);
    try {
        assets_->serve(req, res);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Asset server failed on {}: {}", req.path, e.what()));
        set_internal_error(res);
    }
}

// ============================================================================
// Stats
// ============================================================================

ExplorerHandler::Stats ExplorerHandler::get_stats() const {
    return {
        pages_rendered_.load(kRelaxed),
        documents_served_.load(kRelaxed),
        document_failures_.load(kRelaxed),
        render_failures_.load(kRelaxed),
        redirects_.load(kRelaxed),
        assets_delegated_.load(kRelaxed),
        method_rejects_.load(kRelaxed)
    };
}

} // namespace apidocs
