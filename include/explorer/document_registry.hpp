#pragma once

#include "core/error.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace apidocs {

/**
 * @brief Source of API description documents, keyed by instance name
 *
 * Implementations must be safe for concurrent read_doc() calls.
 */
class IDocumentRegistry {
public:
    virtual ~IDocumentRegistry() = default;

    [[nodiscard]] virtual Result<std::string> read_doc(const std::string& name) const = 0;
};

/**
 * @brief Registry of document providers
 *
 * Each fetch calls the provider again, so generated documents are always
 * fresh. A provider that throws produces DOCUMENT_GENERATION_ERROR.
 *
 * Usage:
 *   DocumentRegistry::instance()->register_document(
 *       "swagger", [] { return build_openapi_json(); });
 *
 *   auto doc = registry.read_doc("swagger");
 */
class DocumentRegistry : public IDocumentRegistry {
public:
    using Provider = std::function<std::string()>;

    DocumentRegistry() = default;

    /// Process-wide registry used when the handler is given none.
    [[nodiscard]] static std::shared_ptr<DocumentRegistry> instance();

    /// @throws std::invalid_argument on empty name, null provider or duplicate name
    void register_document(const std::string& name, Provider provider);

    /// Fixed document bytes.
    void register_static(const std::string& name, std::string document);

    /// Document read from @p path on every fetch.
    void register_file(const std::string& name, std::filesystem::path path);

    bool unregister(const std::string& name);

    [[nodiscard]] bool has_document(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] Result<std::string> read_doc(const std::string& name) const override;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Provider> providers_;
};

} // namespace apidocs
