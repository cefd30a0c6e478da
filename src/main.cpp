#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "explorer/asset_server.hpp"
#include "explorer/document_registry.hpp"
#include "explorer/explorer_handler.hpp"
#include "server/http_server.hpp"

#include <csignal>
#include <cstdlib>
#include <format>
#include <memory>

using namespace apidocs;

// Global instance for signal handling
std::shared_ptr<ExplorerServer> g_server;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));
    if (g_server) {
        g_server->stop();
    }
}

int main(int argc, char* argv[]) {
    try {
        utils::log::info("API explorer service starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::string config_file = "config/explorer.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/3] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        const auto& cfg = config_result.config;

        if (const auto level = utils::log::parse_level(cfg.logging.level)) {
            utils::log::set_level(*level);
        }

        const auto& expansion = cfg.explorer.doc_expansion;
        if (expansion != "list" && expansion != "full" && expansion != "none") {
            utils::log::warn(std::format(
                "explorer.doc_expansion '{}' is not one of list, full, none; passing through",
                expansion));
        }

        // =====================================================================
        // [2/3] Description documents
        // =====================================================================
        auto registry = DocumentRegistry::instance();
        for (const auto& doc : cfg.documents) {
            registry->register_file(doc.name, doc.file);
            utils::log::info(std::format("[2/3] Document '{}' from {}", doc.name, doc.file));
        }
        if (cfg.documents.empty()) {
            utils::log::warn("[2/3] No [[documents]] configured; doc.json will return 500");
        }

        // =====================================================================
        // [3/3] Explorer handler + HTTP server
        // =====================================================================
        auto assets = std::make_shared<DirectoryAssetServer>(DirectoryAssetServer::Config{
            cfg.assets.dir, cfg.assets.cache_max_age_seconds});
        utils::log::info(std::format("[3/3] Serving UI assets from {}", cfg.assets.dir));

        auto explorer_options = to_explorer_options(cfg.explorer);
        explorer_options.push_back(options::asset_server(assets));
        auto explorer = std::make_shared<ExplorerHandler>(
            make_explorer_config(explorer_options), registry);

        g_server = std::make_shared<ExplorerServer>(explorer, cfg.server, cfg.explorer.mount);

        // Blocks until stop()
        g_server->start();

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
