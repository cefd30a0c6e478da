#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <string>

using namespace apidocs;

namespace {

bool has_error(const std::vector<std::string>& errors, const std::string& needle) {
    for (const auto& e : errors) {
        if (e.find(needle) != std::string::npos) return true;
    }
    return false;
}

} // anonymous namespace

// ============================================================================
// Loading
// ============================================================================

TEST_CASE("ConfigLoader: empty document yields defaults", "[config]") {
    const auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.server.host == "0.0.0.0");
    CHECK(cfg.server.port == 8080);
    CHECK(cfg.server.thread_pool_size == 4);
    CHECK(cfg.server.health_endpoint == "/health");
    CHECK(cfg.logging.level == "info");
    CHECK(cfg.explorer.mount == "/swagger/");
    CHECK(cfg.explorer.doc_expansion == "list");
    CHECK(cfg.explorer.deep_linking);
    CHECK(cfg.assets.dir == "swagger-ui");
    CHECK(cfg.assets.cache_max_age_seconds == 3600);
    CHECK(cfg.documents.empty());
}

TEST_CASE("ConfigLoader: full example", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[server]
host = "127.0.0.1"
port = 9090
threads = 8
health_endpoint = "/healthz"

[logging]
level = "warn"

[explorer]
mount = "/api/docs/"
url = "openapi.json"
doc_expansion = "full"
dom_id = "explorer"
instance_name = "billing"
deep_linking = false
persist_authorization = true
before_script = "console.log('a')"
after_script = "console.log('b')"
plugins = ["MyPlugin", "OtherPlugin"]

[explorer.ui_config]
defaultModelsExpandDepth = -1
showExtensions = true
filter = "'pets'"
maxDisplayedTags = 2.5

[assets]
dir = "/srv/swagger-ui"
cache_max_age_seconds = 60

[[documents]]
name = "billing"
file = "docs/billing.json"

[[documents]]
file = "docs/swagger.json"
)");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.server.host == "127.0.0.1");
    CHECK(cfg.server.port == 9090);
    CHECK(cfg.server.thread_pool_size == 8);
    CHECK(cfg.server.health_endpoint == "/healthz");
    CHECK(cfg.logging.level == "warn");

    const auto& e = cfg.explorer;
    CHECK(e.mount == "/api/docs/");
    CHECK(e.url == "openapi.json");
    CHECK(e.doc_expansion == "full");
    CHECK(e.dom_id == "explorer");
    CHECK(e.instance_name == "billing");
    CHECK_FALSE(e.deep_linking);
    CHECK(e.persist_authorization);
    CHECK(e.before_script == "console.log('a')");
    CHECK(e.after_script == "console.log('b')");
    REQUIRE(e.plugins.size() == 2);
    CHECK(e.plugins[1] == "OtherPlugin");

    CHECK(e.ui_config.at("defaultModelsExpandDepth") == "-1");
    CHECK(e.ui_config.at("showExtensions") == "true");
    CHECK(e.ui_config.at("filter") == "'pets'");
    CHECK(e.ui_config.at("maxDisplayedTags") == "2.5");

    CHECK(cfg.assets.dir == "/srv/swagger-ui");
    CHECK(cfg.assets.cache_max_age_seconds == 60);

    REQUIRE(cfg.documents.size() == 2);
    CHECK(cfg.documents[0].name == "billing");
    CHECK(cfg.documents[0].file == "docs/billing.json");
    CHECK(cfg.documents[1].name == "swagger");
}

TEST_CASE("ConfigLoader: environment variables are expanded", "[config]") {
    ::setenv("APIDOCS_TEST_ASSET_DIR", "/opt/ui", 1);
    const auto result = ConfigLoader::load_from_string(R"(
[assets]
dir = "${APIDOCS_TEST_ASSET_DIR}/dist"
)");
    REQUIRE(result.success);
    CHECK(result.config.assets.dir == "/opt/ui/dist");
    ::unsetenv("APIDOCS_TEST_ASSET_DIR");
}

TEST_CASE("ConfigLoader: unclosed substitution fails", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[assets]
dir = "${BROKEN"
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("ConfigLoader: malformed TOML fails", "[config]") {
    const auto result = ConfigLoader::load_from_string("[server\nport = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("ConfigLoader: missing file fails", "[config]") {
    const auto result = ConfigLoader::load_from_file("/nonexistent/apidocs/explorer.toml");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to load config") != std::string::npos);
}

TEST_CASE("ConfigLoader: out-of-range port fails", "[config]") {
    const auto result = ConfigLoader::load_from_string("[server]\nport = 70000\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("server.port") != std::string::npos);
}

TEST_CASE("ConfigLoader: cache max-age outside int range fails", "[config]") {
    for (const char* value : {"4294967296", "2147483648", "-5"}) {
        const auto result = ConfigLoader::load_from_string(
            std::string("[assets]\ncache_max_age_seconds = ") + value + "\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find(std::string("got ") + value) != std::string::npos);
    }

    const auto largest = ConfigLoader::load_from_string(
        "[assets]\ncache_max_age_seconds = 2147483647\n");
    REQUIRE(largest.success);
    CHECK(largest.config.assets.cache_max_age_seconds == 2147483647);
}

TEST_CASE("ConfigLoader: non-string plugin fails", "[config]") {
    const auto result = ConfigLoader::load_from_string("[explorer]\nplugins = [\"A\", 3]\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("plugins") != std::string::npos);
}

TEST_CASE("ConfigLoader: ui_config rejects tables", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[explorer.ui_config.nested]
x = 1
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("explorer.ui_config.nested") != std::string::npos);
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("ConfigLoader: validation collects every error", "[config]") {
    ExplorerServerConfig cfg;
    cfg.server.port = 0;
    cfg.server.thread_pool_size = 0;
    cfg.logging.level = "verbose";
    cfg.explorer.mount = "docs";
    cfg.assets.cache_max_age_seconds = -1;
    cfg.documents = {{"a", "a.json"}, {"a", ""}, {"", "c.json"}};

    const auto errors = ConfigLoader::validate_config(cfg);
    CHECK(has_error(errors, "server.port"));
    CHECK(has_error(errors, "server.threads"));
    CHECK(has_error(errors, "logging.level"));
    CHECK(has_error(errors, "explorer.mount"));
    CHECK(has_error(errors, "assets.cache_max_age_seconds"));
    CHECK(has_error(errors, "documents[1].name 'a' is duplicated"));
    CHECK(has_error(errors, "documents[1].file"));
    CHECK(has_error(errors, "documents[2].name"));
}

TEST_CASE("ConfigLoader: mount may not shadow the health endpoint", "[config]") {
    ExplorerServerConfig cfg;
    cfg.explorer.mount = "/health/";
    CHECK(has_error(ConfigLoader::validate_config(cfg), "health_endpoint"));
}

TEST_CASE("ConfigLoader: validation failure is reported by load", "[config]") {
    const auto result = ConfigLoader::load_from_string("[explorer]\nmount = \"/docs\"\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Config validation failed:") == 0);
}

TEST_CASE("ConfigLoader: defaults validate cleanly", "[config]") {
    CHECK(ConfigLoader::validate_config(ExplorerServerConfig{}).empty());
}

// ============================================================================
// Explorer options
// ============================================================================

TEST_CASE("ConfigLoader: section maps onto explorer options", "[config]") {
    ExplorerSection section;
    section.doc_expansion = "none";
    section.deep_linking = false;
    section.plugins = {"P"};
    section.ui_config = {{"showExtensions", "true"}};

    const auto cfg = make_explorer_config(to_explorer_options(section));
    CHECK(cfg.doc_expansion == "none");
    CHECK_FALSE(cfg.deep_linking);
    CHECK(cfg.instance_name == kDefaultInstanceName);
    REQUIRE(cfg.plugins.size() == 1);
    CHECK(cfg.ui_config.at("showExtensions") == "true");
    CHECK(cfg.asset_server == nullptr);
}
