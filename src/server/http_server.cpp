#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "explorer/explorer_handler.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>

#include <format>
#include <stdexcept>

namespace apidocs {

ExplorerServer::ExplorerServer(
    std::shared_ptr<ExplorerHandler> explorer,
    ServerConfig config,
    std::string mount_point)
    : explorer_(std::move(explorer)),
      config_(std::move(config)),
      mount_point_(std::move(mount_point)) {
    if (!explorer_) {
        throw std::invalid_argument("ExplorerServer requires an explorer handler");
    }
}

ExplorerServer::~ExplorerServer() = default;

// ============================================================================
// start() — creates server, registers routes, binds, listens
// ============================================================================

void ExplorerServer::start() {
    httplib::Server* svr = nullptr;
    {
        std::lock_guard lock(server_mutex_);
        if (stopping_.load(std::memory_order_acquire)) {
            utils::log::info("Stop requested before start; not listening");
            return;
        }
        server_ = std::make_unique<httplib::Server>();
        svr = server_.get();
    }

    const size_t pool_size = config_.thread_pool_size;
    svr->new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    register_routes(*svr);

    int port = config_.port;
    if (port == 0) {
        port = svr->bind_to_any_port(config_.host);
    } else if (!svr->bind_to_port(config_.host, port)) {
        port = -1;
    }
    if (port < 0) {
        throw std::runtime_error(std::format("Failed to bind {}:{}",
            config_.host, config_.port));
    }
    bound_port_.store(port, std::memory_order_release);

    utils::log::info(std::format("API explorer listening on http://{}:{}{} ({} threads)",
        config_.host, port, mount_point_, pool_size));

    // stop() may have run between the unlock above and here
    if (stopping_.load(std::memory_order_acquire)) {
        utils::log::info("Stop requested before listen; not listening");
        return;
    }
    if (!svr->listen_after_bind()) {
        throw std::runtime_error(std::format("Listener on {}:{} failed",
            config_.host, port));
    }
}

void ExplorerServer::stop() {
    stopping_.store(true, std::memory_order_release);
    std::lock_guard lock(server_mutex_);
    if (server_) {
        server_->stop();
    }
    utils::log::info("Server stopped");
}

bool ExplorerServer::is_running() const {
    std::lock_guard lock(server_mutex_);
    return server_ && server_->is_running();
}

// ============================================================================
// Route registration
// ============================================================================

void ExplorerServer::register_routes(httplib::Server& svr) {
    svr.Get(config_.health_endpoint, [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    explorer_->register_routes(svr, mount_point_);
}

// ============================================================================
// Handler: GET /health
// ============================================================================

void ExplorerServer::handle_health(const httplib::Request&, httplib::Response& res) {
    const auto stats = explorer_->get_stats();
    const nlohmann::json body = {
        {"status", "ok"},
        {"mount", mount_point_},
        {"prefix", explorer_->prefix()},
        {"stats", {
            {"pages_rendered", stats.pages_rendered},
            {"documents_served", stats.documents_served},
            {"document_failures", stats.document_failures},
            {"render_failures", stats.render_failures},
            {"redirects", stats.redirects},
            {"assets_delegated", stats.assets_delegated},
            {"method_rejects", stats.method_rejects},
        }},
    };
    res.status = httplib::StatusCode::OK_200;
    res.set_content(body.dump(), http::kJsonContentType);
}

} // namespace apidocs
