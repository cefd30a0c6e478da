#include "explorer/document_registry.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <iterator>
#include <mutex>
#include <stdexcept>

namespace apidocs {

std::shared_ptr<DocumentRegistry> DocumentRegistry::instance() {
    static const auto registry = std::make_shared<DocumentRegistry>();
    return registry;
}

void DocumentRegistry::register_document(const std::string& name, Provider provider) {
    if (name.empty()) {
        throw std::invalid_argument("Document name must not be empty");
    }
    if (!provider) {
        throw std::invalid_argument(std::format("Null provider for document '{}'", name));
    }

    std::unique_lock lock(mutex_);
    if (!providers_.emplace(name, std::move(provider)).second) {
        throw std::invalid_argument(
            std::format("Document '{}' is already registered", name));
    }
}

void DocumentRegistry::register_static(const std::string& name, std::string document) {
    register_document(name, [doc = std::move(document)] { return doc; });
}

void DocumentRegistry::register_file(const std::string& name, std::filesystem::path path) {
    register_document(name, [path = std::move(path)] {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw std::runtime_error(std::format("Cannot open {}", path.string()));
        }
        return std::string{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    });
}

bool DocumentRegistry::unregister(const std::string& name) {
    std::unique_lock lock(mutex_);
    return providers_.erase(name) > 0;
}

bool DocumentRegistry::has_document(const std::string& name) const {
    std::shared_lock lock(mutex_);
    return providers_.contains(name);
}

std::vector<std::string> DocumentRegistry::names() const {
    std::vector<std::string> result;
    {
        std::shared_lock lock(mutex_);
        result.reserve(providers_.size());
        for (const auto& [name, _] : providers_) {
            result.push_back(name);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

Result<std::string> DocumentRegistry::read_doc(const std::string& name) const {
    Provider provider;
    {
        std::shared_lock lock(mutex_);
        const auto it = providers_.find(name);
        if (it == providers_.end()) {
            return Result<std::string>::error(ErrorCategory::DOCUMENT_NOT_FOUND,
                std::format("No document registered under '{}'", name));
        }
        provider = it->second;
    }

    // Provider runs unlocked (it may re-enter the registry)
    try {
        return Result<std::string>::ok(provider());
    } catch (const std::exception& e) {
        return Result<std::string>::error(ErrorCategory::DOCUMENT_GENERATION_ERROR,
            std::format("Generating document '{}' failed: {}", name, e.what()));
    }
}

} // namespace apidocs
