#pragma once

/// @file options.hpp
/// @brief Compaction options

#include <jsonld_engine/core/log.hpp>
#include <jsonld_engine/syntax/mode.hpp>

#include <cstddef>

namespace jsonld_compaction {

/// Compaction configuration
struct CompactionOptions {
    jsonld_syntax::ProcessingMode processing_mode = jsonld_syntax::ProcessingMode::JsonLd11;

    /// Replace single-element arrays with their element where the container
    /// allows it
    bool compact_arrays = true;

    /// Make document-relative IRIs relative to the base IRI
    bool compact_to_relative = true;

    /// Process expanded properties in lexicographic order
    bool ordered = false;

    /// Maximum nesting of maps and arrays
    std::size_t max_depth = 512;

    /// Maximum nesting of remote context references in scoped contexts
    std::size_t max_remote_contexts = 32;

    /// Receives ignored keyword-like terms in scoped contexts; may be null
    jsonld_core::WarningSinkPtr warnings;
};

} // namespace jsonld_compaction
