#pragma once

/// @file iri.hpp
/// @brief IRI compaction and term selection

#include "options.hpp"
#include <jsonld_engine/context/active_context.hpp>
#include <jsonld_engine/core/error.hpp>
#include <jsonld_engine/core/value.hpp>

#include <optional>
#include <string>

namespace jsonld_compaction {

/// Select the best term for an IRI given the shape of the value it will hold.
///
/// Container candidates and type/language preferences are derived from
/// @p value (null when there is no value), then looked up in the inverse
/// context.
[[nodiscard]] std::optional<std::string> select_term(
    const jsonld_context::ActiveContext& active,
    const std::string& iri,
    const jsonld_core::Value& value,
    bool reverse,
    jsonld_syntax::ProcessingMode mode);

/// Compact an IRI (or keyword) to a term, a vocab-relative suffix, a compact
/// IRI or a relative IRI.
///
/// @param vocab compact against the vocabulary (terms, @vocab) rather than
///              the base IRI
/// @return the compacted form, or `IRI confused with prefix` when the IRI
///         would be read back as a compact IRI
[[nodiscard]] jsonld_core::Result<std::string> compact_iri(
    const jsonld_context::ActiveContext& active,
    const std::string& iri,
    const jsonld_core::Value& value,
    bool vocab,
    bool reverse,
    const CompactionOptions& options);

/// Compact an IRI with no associated value
[[nodiscard]] inline jsonld_core::Result<std::string> compact_iri(
    const jsonld_context::ActiveContext& active,
    const std::string& iri,
    bool vocab,
    const CompactionOptions& options) {
    return compact_iri(active, iri, jsonld_core::Value(), vocab, false, options);
}

/// Alias of a keyword in the active context, or the keyword itself
[[nodiscard]] std::string compact_keyword(
    const jsonld_context::ActiveContext& active,
    const std::string& keyword,
    jsonld_syntax::ProcessingMode mode);

} // namespace jsonld_compaction
