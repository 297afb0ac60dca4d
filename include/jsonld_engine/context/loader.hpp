#pragma once

/// @file loader.hpp
/// @brief Document loaders used to retrieve remote contexts

#include "fwd.hpp"
#include <jsonld_engine/core/error.hpp>
#include <jsonld_engine/core/value.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace jsonld_context {

// =============================================================================
// RemoteDocument
// =============================================================================

/// A retrieved document
struct RemoteDocument {
    jsonld_core::Value document;

    /// Final IRI after redirects
    std::string document_url;

    /// Context linked from the response, if any
    std::optional<std::string> context_url;

    std::string content_type = "application/ld+json";
};

// =============================================================================
// DocumentLoader
// =============================================================================

/// Retrieves documents by IRI.
///
/// Failures are reported as LoaderError (NotFound or LoadingFailed).
/// Implementations must return the same outcome for the same IRI within one
/// run and must be safe to call from several threads.
class DocumentLoader {
public:
    virtual ~DocumentLoader() = default;

    /// Load the document identified by an absolute IRI
    [[nodiscard]] virtual jsonld_core::Result<RemoteDocument> load(const std::string& iri) = 0;
};

// =============================================================================
// NoLoader
// =============================================================================

/// Loader that never finds anything
class NoLoader final : public DocumentLoader {
public:
    [[nodiscard]] jsonld_core::Result<RemoteDocument> load(const std::string& iri) override;
};

// =============================================================================
// StaticLoader
// =============================================================================

/// In-memory IRI to document table
class StaticLoader : public DocumentLoader {
public:
    StaticLoader() = default;

    /// Register a document under its IRI
    void insert(const std::string& iri, jsonld_core::Value document);

    /// Make @p from redirect to @p to
    void insert_alias(const std::string& from, const std::string& to);

    /// Check if an IRI (or alias) is registered
    [[nodiscard]] bool contains(const std::string& iri) const;

    /// Number of registered documents
    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] jsonld_core::Result<RemoteDocument> load(const std::string& iri) override;

private:
    mutable std::shared_mutex m_mutex;
    std::map<std::string, jsonld_core::Value> m_documents;
    std::map<std::string, std::string> m_aliases;
};

// =============================================================================
// FileLoader
// =============================================================================

/// Serves IRIs below a prefix from a directory.
///
/// "https://example.org/ctx/a.jsonld" with the mount
/// ("https://example.org/ctx/", "/srv/contexts") reads "/srv/contexts/a.jsonld".
class FileLoader : public DocumentLoader {
public:
    FileLoader() = default;

    /// Map an IRI prefix to a directory. The longest matching prefix wins.
    void mount(const std::string& prefix, const std::filesystem::path& directory);

    /// Map an IRI to a file path, if some mount covers it
    [[nodiscard]] std::optional<std::filesystem::path> resolve_path(const std::string& iri) const;

    [[nodiscard]] jsonld_core::Result<RemoteDocument> load(const std::string& iri) override;

private:
    std::vector<std::pair<std::string, std::filesystem::path>> m_mounts;
};

// =============================================================================
// CachingLoader
// =============================================================================

/// Caches the outcome of another loader per IRI.
///
/// Concurrent requests for the same IRI share one fetch. Requests for distinct
/// IRIs proceed in parallel; the lock is never held while fetching. Failures
/// are cached like successes. An exception thrown by the inner loader reaches
/// every request waiting on that fetch and is not cached.
class CachingLoader : public DocumentLoader {
public:
    explicit CachingLoader(LoaderPtr inner);

    [[nodiscard]] jsonld_core::Result<RemoteDocument> load(const std::string& iri) override;

    /// Number of distinct IRIs cached or in flight
    [[nodiscard]] std::size_t size() const;

    /// Number of requests forwarded to the inner loader
    [[nodiscard]] std::uint64_t fetch_count() const noexcept { return m_fetches.load(); }

    /// Drop every cached outcome
    void clear();

private:
    using Outcome = std::shared_future<jsonld_core::Result<RemoteDocument>>;

    LoaderPtr m_inner;
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Outcome> m_entries;
    std::atomic<std::uint64_t> m_fetches{0};
};

} // namespace jsonld_context
