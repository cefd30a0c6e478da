#include "explorer/explorer_config.hpp"

namespace apidocs {

namespace {

ExplorerConfig apply_options(const ExplorerOption* first, const ExplorerOption* last) {
    ExplorerConfig config;
    for (const auto* it = first; it != last; ++it) {
        if (*it) (*it)(config);
    }
    if (config.instance_name.empty()) {
        config.instance_name = kDefaultInstanceName;
    }
    return config;
}

} // anonymous namespace

ExplorerConfig make_explorer_config(std::initializer_list<ExplorerOption> options) {
    return apply_options(options.begin(), options.end());
}

ExplorerConfig make_explorer_config(const std::vector<ExplorerOption>& options) {
    return apply_options(options.data(), options.data() + options.size());
}

namespace options {

ExplorerOption url(std::string url) {
    return [url = std::move(url)](ExplorerConfig& c) { c.url = url; };
}

ExplorerOption doc_expansion(std::string expansion) {
    return [expansion = std::move(expansion)](ExplorerConfig& c) { c.doc_expansion = expansion; };
}

ExplorerOption dom_id(std::string id) {
    return [id = std::move(id)](ExplorerConfig& c) { c.dom_id = id; };
}

ExplorerOption instance_name(std::string name) {
    return [name = std::move(name)](ExplorerConfig& c) { c.instance_name = name; };
}

ExplorerOption deep_linking(bool enabled) {
    return [enabled](ExplorerConfig& c) { c.deep_linking = enabled; };
}

ExplorerOption persist_authorization(bool enabled) {
    return [enabled](ExplorerConfig& c) { c.persist_authorization = enabled; };
}

ExplorerOption before_script(std::string js) {
    return [js = std::move(js)](ExplorerConfig& c) { c.before_script = js; };
}

ExplorerOption after_script(std::string js) {
    return [js = std::move(js)](ExplorerConfig& c) { c.after_script = js; };
}

ExplorerOption plugins(std::vector<std::string> plugins) {
    return [plugins = std::move(plugins)](ExplorerConfig& c) { c.plugins = plugins; };
}

ExplorerOption ui_config(std::map<std::string, std::string> props) {
    return [props = std::move(props)](ExplorerConfig& c) { c.ui_config = props; };
}

ExplorerOption asset_server(std::shared_ptr<IAssetServer> server) {
    return [server = std::move(server)](ExplorerConfig& c) { c.asset_server = server; };
}

} // namespace options

} // namespace apidocs
