/// @file loader.cpp
/// @brief Document loader implementations

#include <jsonld_engine/context/loader.hpp>
#include <jsonld_engine/core/log.hpp>

#include <exception>
#include <fstream>
#include <sstream>

namespace jsonld_context {

using jsonld_core::Err;
using jsonld_core::LoaderError;
using jsonld_core::Ok;

// =============================================================================
// NoLoader
// =============================================================================

jsonld_core::Result<RemoteDocument> NoLoader::load(const std::string& iri) {
    return Err<RemoteDocument>(LoaderError::not_found(iri));
}

// =============================================================================
// StaticLoader
// =============================================================================

void StaticLoader::insert(const std::string& iri, jsonld_core::Value document) {
    std::unique_lock lock(m_mutex);
    m_documents[iri] = std::move(document);
}

void StaticLoader::insert_alias(const std::string& from, const std::string& to) {
    std::unique_lock lock(m_mutex);
    m_aliases[from] = to;
}

bool StaticLoader::contains(const std::string& iri) const {
    std::shared_lock lock(m_mutex);
    return m_documents.count(iri) > 0 || m_aliases.count(iri) > 0;
}

std::size_t StaticLoader::size() const {
    std::shared_lock lock(m_mutex);
    return m_documents.size();
}

jsonld_core::Result<RemoteDocument> StaticLoader::load(const std::string& iri) {
    std::shared_lock lock(m_mutex);

    std::string target = iri;
    auto alias = m_aliases.find(iri);
    if (alias != m_aliases.end()) {
        target = alias->second;
    }

    auto it = m_documents.find(target);
    if (it == m_documents.end()) {
        return Err<RemoteDocument>(LoaderError::not_found(iri));
    }

    RemoteDocument doc;
    doc.document = it->second;
    doc.document_url = target;
    return Ok(std::move(doc));
}

// =============================================================================
// FileLoader
// =============================================================================

void FileLoader::mount(const std::string& prefix, const std::filesystem::path& directory) {
    m_mounts.emplace_back(prefix, directory);
}

std::optional<std::filesystem::path> FileLoader::resolve_path(const std::string& iri) const {
    const std::pair<std::string, std::filesystem::path>* best = nullptr;
    for (const auto& mount : m_mounts) {
        if (iri.rfind(mount.first, 0) == 0 && (!best || mount.first.size() > best->first.size())) {
            best = &mount;
        }
    }
    if (!best) {
        return std::nullopt;
    }
    return best->second / iri.substr(best->first.size());
}

jsonld_core::Result<RemoteDocument> FileLoader::load(const std::string& iri) {
    auto path = resolve_path(iri);
    if (!path) {
        return Err<RemoteDocument>(LoaderError::not_found(iri));
    }

    std::ifstream file(*path);
    if (!file.is_open()) {
        jsonld_core::loader_logger()->debug("No file for '{}' at {}", iri, path->string());
        return Err<RemoteDocument>(LoaderError::not_found(iri));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    RemoteDocument doc;
    try {
        doc.document = jsonld_core::Value::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        return Err<RemoteDocument>(LoaderError::loading_failed(iri, std::string("JSON parse error: ") + e.what()));
    }

    doc.document_url = iri;
    return Ok(std::move(doc));
}

// =============================================================================
// CachingLoader
// =============================================================================

CachingLoader::CachingLoader(LoaderPtr inner)
    : m_inner(std::move(inner)) {}

jsonld_core::Result<RemoteDocument> CachingLoader::load(const std::string& iri) {
    std::promise<jsonld_core::Result<RemoteDocument>> promise;
    Outcome outcome;
    bool owner = false;

    {
        std::lock_guard lock(m_mutex);
        auto it = m_entries.find(iri);
        if (it != m_entries.end()) {
            outcome = it->second;
        } else {
            outcome = promise.get_future().share();
            m_entries.emplace(iri, outcome);
            owner = true;
        }
    }

    if (!owner) {
        jsonld_core::loader_logger()->debug("Cache hit: {}", iri);
        return outcome.get();
    }

    jsonld_core::loader_logger()->debug("Cache miss: {}", iri);
    ++m_fetches;
    try {
        promise.set_value(m_inner->load(iri));
    } catch (...) {
        // Waiters rethrow the same exception; the next load retries
        promise.set_exception(std::current_exception());
        {
            std::lock_guard lock(m_mutex);
            m_entries.erase(iri);
        }
        throw;
    }
    return outcome.get();
}

std::size_t CachingLoader::size() const {
    std::lock_guard lock(m_mutex);
    return m_entries.size();
}

void CachingLoader::clear() {
    std::lock_guard lock(m_mutex);
    m_entries.clear();
}

} // namespace jsonld_context
