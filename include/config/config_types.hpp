#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace apidocs {

// ============================================================================
// Configuration Types
// ============================================================================

struct ServerConfig {
    std::string host;
    uint16_t port;
    size_t thread_pool_size;
    std::string health_endpoint;

    ServerConfig()
        : host("0.0.0.0"),
          port(8080),
          thread_pool_size(4),
          health_endpoint("/health") {}
};

struct LoggingConfig {
    std::string level = "info";
};

/// [explorer] section: mount point plus the ExplorerConfig options
struct ExplorerSection {
    std::string mount = "/swagger/";
    std::string url = "doc.json";
    std::string doc_expansion = "list";
    std::string dom_id = "swagger-ui";
    std::string instance_name;               // empty = default registry name
    bool deep_linking = true;
    bool persist_authorization = false;
    std::string before_script;
    std::string after_script;
    std::vector<std::string> plugins;
    std::map<std::string, std::string> ui_config;
};

struct AssetConfig {
    std::string dir = "swagger-ui";
    int cache_max_age_seconds = 3600;
};

/// [[documents]] entry: description document loaded from a file
struct DocumentSource {
    std::string name;
    std::string file;
};

} // namespace apidocs
