#pragma once

/// @file processing.hpp
/// @brief Context processing and IRI expansion

#include "fwd.hpp"
#include "active_context.hpp"
#include "loader.hpp"
#include <jsonld_engine/core/error.hpp>
#include <jsonld_engine/core/log.hpp>
#include <jsonld_engine/core/value.hpp>
#include <jsonld_engine/syntax/mode.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace jsonld_context {

// =============================================================================
// ContextProcessingOptions
// =============================================================================

/// Options for one context processing call
struct ContextProcessingOptions {
    jsonld_syntax::ProcessingMode processing_mode = jsonld_syntax::ProcessingMode::JsonLd11;

    /// Allow protected terms to be redefined or nullified
    /// (property-scoped contexts)
    bool override_protected = false;

    /// When false the result keeps a pointer to the context to revert to
    /// (type-scoped contexts)
    bool propagate = true;

    /// When false a context already being loaded is skipped instead of
    /// reported as recursive (validation of scoped contexts)
    bool validate_scoped_context = true;

    /// Maximum nesting of remote context references
    std::size_t max_remote_contexts = 32;

    /// Maximum nesting of scoped contexts inside term definitions
    std::size_t max_scoped_depth = 128;

    /// Receives ignored keyword-like terms; may be null
    jsonld_core::WarningSinkPtr warnings;
};

// =============================================================================
// Context Processing
// =============================================================================

/// Apply a local context (a map, an IRI, null or an array of those) to an
/// active context and freeze the result.
///
/// @param active context to derive from (not modified)
/// @param local local context
/// @param base_url base for relative context references
/// @param loader loader for remote contexts
[[nodiscard]] jsonld_core::Result<ContextPtr> process_context(
    const ContextPtr& active,
    const jsonld_core::Value& local,
    const std::optional<std::string>& base_url,
    DocumentLoader& loader,
    const ContextProcessingOptions& options = {});

// =============================================================================
// IRI Expansion
// =============================================================================

/// Expand a value (term, compact IRI, keyword or IRI reference) against a
/// context.
///
/// Resolution order: keyword, term mapped to a keyword, term (when @p vocab),
/// compact IRI with a prefix term, absolute IRI, @vocab concatenation (when
/// @p vocab), base IRI resolution (when @p document_relative).
///
/// @return the expanded IRI, or nullopt if the value maps to null
[[nodiscard]] std::optional<std::string> expand_iri(
    const ContextData& context,
    const std::string& value,
    bool document_relative,
    bool vocab);

[[nodiscard]] inline std::optional<std::string> expand_iri(
    const ActiveContext& context,
    const std::string& value,
    bool document_relative,
    bool vocab) {
    return expand_iri(context.data(), value, document_relative, vocab);
}

} // namespace jsonld_context
