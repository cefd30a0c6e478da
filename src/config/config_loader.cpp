#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <cstdint>
#include <cstdlib>
#include <format>
#include <limits>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace apidocs {

// ============================================================================
// TOML Parsing Helpers (env expansion, typed extraction)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

std::string toml_string(const toml::table& tbl, std::string_view key, const std::string& fallback) {
    return expand_env_vars(tbl[key].value_or(fallback));
}

std::vector<std::string> toml_string_array(const toml::table& tbl, std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(expand_env_vars(s->get()));
            } else {
                throw std::runtime_error(
                    std::format("{} must contain only strings", key));
            }
        }
    }
    return result;
}

/// Scalar rendered as the JavaScript literal text it stands for.
std::string toml_scalar_as_js(const toml::node& node, std::string_view key) {
    if (const auto* s = node.as_string()) return expand_env_vars(s->get());
    if (const auto* b = node.as_boolean()) return utils::booltostr(b->get());
    if (const auto* i = node.as_integer()) return std::to_string(i->get());
    if (const auto* f = node.as_floating_point()) return std::format("{}", f->get());
    throw std::runtime_error(
        std::format("explorer.ui_config.{} must be a string, boolean or number", key));
}

// ---- Section extractors ----------------------------------------------------

ServerConfig extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = toml_string(s, "host", "0.0.0.0"s);

    const int64_t port = s["port"].value_or(int64_t{8080});
    if (!utils::in_range<0, 65535>(port)) {
        throw std::runtime_error(std::format("server.port must be 1-65535, got {}", port));
    }
    cfg.port = static_cast<uint16_t>(port);

    const int64_t threads = s["threads"].value_or(int64_t{4});
    cfg.thread_pool_size = threads > 0 ? static_cast<size_t>(threads) : 0;
    cfg.health_endpoint = toml_string(s, "health_endpoint", "/health"s);
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = toml_string(*logging, "level", "info"s);
    return cfg;
}

ExplorerSection extract_explorer(const toml::table& root) {
    ExplorerSection cfg;
    const auto* explorer = root["explorer"].as_table();
    if (!explorer) return cfg;
    const auto& e = *explorer;

    cfg.mount = toml_string(e, "mount", cfg.mount);
    cfg.url = toml_string(e, "url", cfg.url);
    cfg.doc_expansion = toml_string(e, "doc_expansion", cfg.doc_expansion);
    cfg.dom_id = toml_string(e, "dom_id", cfg.dom_id);
    cfg.instance_name = toml_string(e, "instance_name", ""s);
    cfg.deep_linking = e["deep_linking"].value_or(cfg.deep_linking);
    cfg.persist_authorization = e["persist_authorization"].value_or(cfg.persist_authorization);
    cfg.before_script = toml_string(e, "before_script", ""s);
    cfg.after_script = toml_string(e, "after_script", ""s);
    cfg.plugins = toml_string_array(e, "plugins");

    if (const auto* ui = e["ui_config"].as_table()) {
        for (const auto& [key, val] : *ui) {
            const std::string k(key.str());
            cfg.ui_config[k] = toml_scalar_as_js(val, k);
        }
    }
    return cfg;
}

AssetConfig extract_assets(const toml::table& root) {
    AssetConfig cfg;
    const auto* assets = root["assets"].as_table();
    if (!assets) return cfg;

    cfg.dir = toml_string(*assets, "dir", cfg.dir);
    const int64_t max_age =
        (*assets)["cache_max_age_seconds"].value_or(int64_t{cfg.cache_max_age_seconds});
    if (!utils::in_range<0, std::numeric_limits<int>::max()>(max_age)) {
        throw std::runtime_error(std::format(
            "assets.cache_max_age_seconds must be 0-{}, got {}",
            std::numeric_limits<int>::max(), max_age));
    }
    cfg.cache_max_age_seconds = static_cast<int>(max_age);
    return cfg;
}

std::vector<DocumentSource> extract_documents(const toml::table& root) {
    std::vector<DocumentSource> result;
    const auto* arr = root["documents"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* doc = elem.as_table();
        if (!doc) continue;

        DocumentSource src;
        src.name = toml_string(*doc, "name", kDefaultInstanceName);
        src.file = toml_string(*doc, "file", ""s);
        result.push_back(std::move(src));
    }
    return result;
}

ExplorerServerConfig extract_all_sections(const toml::table& tbl) {
    ExplorerServerConfig config;
    config.server = extract_server(tbl);
    config.logging = extract_logging(tbl);
    config.explorer = extract_explorer(tbl);
    config.assets = extract_assets(tbl);
    config.documents = extract_documents(tbl);
    return config;
}

ConfigLoader::LoadResult validate_and_return(ExplorerServerConfig config) {
    const auto errors = ConfigLoader::validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

} // anonymous namespace

// ============================================================================
// Explorer options
// ============================================================================

std::vector<ExplorerOption> to_explorer_options(const ExplorerSection& section) {
    return {
        options::url(section.url),
        options::doc_expansion(section.doc_expansion),
        options::dom_id(section.dom_id),
        options::instance_name(section.instance_name),
        options::deep_linking(section.deep_linking),
        options::persist_authorization(section.persist_authorization),
        options::before_script(section.before_script),
        options::after_script(section.after_script),
        options::plugins(section.plugins),
        options::ui_config(section.ui_config),
    };
}

// ============================================================================
// ConfigLoader Public API
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = toml::parse_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = toml::parse(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const ExplorerServerConfig& config) {
    std::vector<std::string> errors;

    if (config.server.port == 0) {
        errors.push_back("server.port must be 1-65535, got 0");
    }
    if (config.server.thread_pool_size == 0) {
        errors.push_back("server.threads must be > 0");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be info, warn or error, got '{}'", config.logging.level));
    }

    const auto& mount = config.explorer.mount;
    if (mount.empty() || mount.front() != '/' || mount.back() != '/') {
        errors.push_back(std::format(
            "explorer.mount must start and end with '/', got '{}'", mount));
    }
    if (mount == config.server.health_endpoint + "/") {
        errors.push_back("explorer.mount must not shadow server.health_endpoint");
    }

    if (config.assets.cache_max_age_seconds < 0) {
        errors.push_back("assets.cache_max_age_seconds must be >= 0");
    }

    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < config.documents.size(); ++i) {
        const auto& doc = config.documents[i];
        if (doc.name.empty()) {
            errors.push_back(std::format("documents[{}].name must not be empty", i));
        } else if (!seen.insert(doc.name).second) {
            errors.push_back(std::format("documents[{}].name '{}' is duplicated", i, doc.name));
        }
        if (doc.file.empty()) {
            errors.push_back(std::format("documents[{}].file must not be empty", i));
        }
    }

    return errors;
}

} // namespace apidocs
