#include <catch2/catch_test_macros.hpp>
#include "explorer/explorer_handler.hpp"
#include "server/http_server.hpp"
#include "mocks/mock_asset_server.hpp"
#include "mocks/mock_document_registry.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>

using namespace apidocs;

namespace {

constexpr const char* kLoopback = "127.0.0.1";

template <typename Pred>
bool wait_for(Pred ready) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!ready()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

std::shared_ptr<ExplorerHandler> make_handler(
        std::shared_ptr<testing::MockAssetServer> assets = std::make_shared<testing::MockAssetServer>()) {
    return std::make_shared<ExplorerHandler>(
        make_explorer_config({options::asset_server(std::move(assets))}),
        std::make_shared<testing::MockDocumentRegistry>());
}

/// httplib::Server with one explorer mounted, listening on an ephemeral loopback port.
class MountedServer {
public:
    MountedServer(ExplorerHandler& handler, const std::string& mount) {
        handler.register_routes(svr_, mount);
        port_ = svr_.bind_to_any_port(kLoopback);
        REQUIRE(port_ > 0);
        thread_ = std::thread([this] { svr_.listen_after_bind(); });
        if (!wait_for([this] { return svr_.is_running(); })) {
            svr_.stop();
            thread_.join();
            FAIL("loopback server did not start");
        }
    }

    ~MountedServer() {
        svr_.stop();
        if (thread_.joinable()) thread_.join();
    }

    httplib::Client client() const { return httplib::Client(kLoopback, port_); }

private:
    httplib::Server svr_;
    int port_ = -1;
    std::thread thread_;
};

/// ExplorerServer running start() on a background thread.
class RunningExplorerServer {
public:
    explicit RunningExplorerServer(std::shared_ptr<ExplorerHandler> handler) {
        ServerConfig cfg;
        cfg.host = kLoopback;
        cfg.port = 0;
        cfg.thread_pool_size = 2;
        server_ = std::make_unique<ExplorerServer>(std::move(handler), cfg, "/api/docs/");
        thread_ = std::thread([this] { server_->start(); });
        if (!wait_for([this] { return server_->is_running() && server_->port() > 0; })) {
            server_->stop();
            thread_.join();
            FAIL("explorer server did not start");
        }
    }

    ~RunningExplorerServer() {
        server_->stop();
        if (thread_.joinable()) thread_.join();
    }

    httplib::Client client() const { return httplib::Client(kLoopback, server_->port()); }

private:
    std::unique_ptr<ExplorerServer> server_;
    std::thread thread_;
};

} // anonymous namespace

// ============================================================================
// ExplorerHandler::register_routes
// ============================================================================

TEST_CASE("HttpRoutes: non-GET under the mount is 405", "[http]") {
    auto handler = make_handler();
    MountedServer server(*handler, "/api/docs/");
    auto cli = server.client();

    auto post = cli.Post("/api/docs/index.html", "{}", "application/json");
    REQUIRE(post);
    CHECK(post->status == 405);
    CHECK(post->body == "Method not allowed");

    auto put = cli.Put("/api/docs/doc.json", "{}", "application/json");
    REQUIRE(put);
    CHECK(put->status == 405);

    auto patch = cli.Patch("/api/docs/doc.json", "{}", "application/json");
    REQUIRE(patch);
    CHECK(patch->status == 405);

    auto del = cli.Delete("/api/docs/index.html");
    REQUIRE(del);
    CHECK(del->status == 405);

    auto opts = cli.Options("/api/docs/index.html");
    REQUIRE(opts);
    CHECK(opts->status == 405);

    CHECK(handler->prefix().empty());
    CHECK(handler->get_stats().method_rejects == 5);
}

TEST_CASE("HttpRoutes: bare mount redirects over the wire", "[http]") {
    auto handler = make_handler();
    MountedServer server(*handler, "/api/docs/");
    auto cli = server.client();

    auto res = cli.Get("/api/docs/");
    REQUIRE(res);
    CHECK(res->status == 301);
    CHECK(res->get_header_value("Location") == "/api/docs/index.html");

    auto page = cli.Get("/api/docs/index.html?tab=models");
    REQUIRE(page);
    CHECK(page->status == 200);
    CHECK(page->get_header_value("Content-Type") == "text/html; charset=utf-8");
}

TEST_CASE("HttpRoutes: paths outside the mount are not routed", "[http]") {
    auto handler = make_handler();
    MountedServer server(*handler, "/api/docs/");
    auto cli = server.client();

    auto res = cli.Get("/other/x");
    REQUIRE(res);
    CHECK(res->status == 404);
    CHECK(handler->prefix().empty());
}

TEST_CASE("HttpRoutes: mount is matched literally", "[http]") {
    auto handler = make_handler();
    MountedServer server(*handler, "/v1.0/");
    auto cli = server.client();

    auto miss = cli.Get("/v1x0/index.html");
    REQUIRE(miss);
    CHECK(miss->status == 404);

    auto hit = cli.Get("/v1.0/index.html");
    REQUIRE(hit);
    CHECK(hit->status == 200);
    CHECK(handler->prefix() == "/v1.0/");
}

TEST_CASE("HttpRoutes: percent-encoded mount reaches the asset server", "[http]") {
    auto assets = std::make_shared<InMemoryAssetServer>(
        std::unordered_map<std::string, std::string>{{"swagger-ui.css", "body{}"}});
    auto handler = std::make_shared<ExplorerHandler>(
        make_explorer_config({options::asset_server(assets)}),
        std::make_shared<testing::MockDocumentRegistry>());
    MountedServer server(*handler, "/my docs/");
    auto cli = server.client();

    auto res = cli.Get("/my%20docs/swagger-ui.css");
    REQUIRE(res);
    CHECK(res->status == 200);
    CHECK(res->body == "body{}");
    CHECK(assets->prefix() == "/my docs/");
}

// ============================================================================
// ExplorerServer
// ============================================================================

TEST_CASE("ExplorerServer: health reports status and stats", "[http]") {
    auto handler = make_handler();
    RunningExplorerServer server(handler);
    auto cli = server.client();

    auto before = cli.Get("/health");
    REQUIRE(before);
    CHECK(before->status == 200);
    CHECK(before->get_header_value("Content-Type") == "application/json; charset=utf-8");
    const auto initial = nlohmann::json::parse(before->body);
    CHECK(initial["status"] == "ok");
    CHECK(initial["mount"] == "/api/docs/");
    CHECK(initial["stats"]["redirects"] == 0);

    auto redirect = cli.Get("/api/docs/");
    REQUIRE(redirect);
    REQUIRE(redirect->status == 301);

    auto after = cli.Get("/health");
    REQUIRE(after);
    const auto health = nlohmann::json::parse(after->body);
    CHECK(health["stats"]["redirects"] == 1);
    CHECK(health["prefix"] == "/api/docs/");
}

TEST_CASE("ExplorerServer: explorer routes are mounted", "[http]") {
    auto handler = make_handler();
    RunningExplorerServer server(handler);
    auto cli = server.client();

    auto doc = cli.Get("/api/docs/doc.json");
    REQUIRE(doc);
    CHECK(doc->status == 200);
    CHECK(doc->body == R"({"swagger":"2.0"})");

    auto post = cli.Post("/api/docs/doc.json", "{}", "application/json");
    REQUIRE(post);
    CHECK(post->status == 405);
}

TEST_CASE("ExplorerServer: stop before start does not listen", "[http]") {
    ServerConfig cfg;
    cfg.host = kLoopback;
    cfg.port = 0;
    ExplorerServer server(make_handler(), cfg);

    server.stop();
    server.start();

    CHECK_FALSE(server.is_running());
    CHECK(server.port() == 0);
}

TEST_CASE("ExplorerServer: null handler is rejected", "[http]") {
    CHECK_THROWS_AS(ExplorerServer(nullptr), std::invalid_argument);
}
