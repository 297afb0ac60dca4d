#pragma once

/// @file options.hpp
/// @brief Processor options

#include <jsonld_engine/compaction/options.hpp>
#include <jsonld_engine/context/loader.hpp>
#include <jsonld_engine/context/processing.hpp>
#include <jsonld_engine/core/error.hpp>
#include <jsonld_engine/core/value.hpp>
#include <jsonld_engine/expansion/options.hpp>
#include <jsonld_engine/syntax/mode.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace jsonld_api {

/// Options shared by every processor entry point.
///
/// The engine-specific option structs are derived from this one so that a
/// single configuration drives context processing, expansion and compaction.
struct JsonLdOptions {
    /// Base IRI of the document; defaults to the document's own URL
    std::optional<std::string> base;

    /// Context applied before the document's own (a map, an IRI or an array)
    std::optional<jsonld_core::Value> expand_context;

    jsonld_syntax::ProcessingMode processing_mode = jsonld_syntax::ProcessingMode::JsonLd11;

    bool ordered = false;
    bool compact_arrays = true;
    bool compact_to_relative = true;

    jsonld_expansion::KeyPolicy key_policy = jsonld_expansion::KeyPolicy::Standard;

    std::size_t max_depth = 512;
    std::size_t max_remote_contexts = 32;

    /// Loader for remote documents and contexts; null means nothing is loaded
    jsonld_context::LoaderPtr document_loader;

    /// Receives the warnings of every algorithm run with these options; may
    /// be null
    jsonld_core::WarningSinkPtr warnings;

    /// Parse a fixture-style option map ("base", "expandContext",
    /// "processingMode", "ordered", "compactArrays", "compactToRelative",
    /// "keyPolicy"). Unknown entries are ignored.
    [[nodiscard]] static jsonld_core::Result<JsonLdOptions> from_json(const jsonld_core::Value& options);

    [[nodiscard]] jsonld_expansion::ExpansionOptions expansion() const;
    [[nodiscard]] jsonld_compaction::CompactionOptions compaction() const;
    [[nodiscard]] jsonld_context::ContextProcessingOptions context() const;

    /// The configured loader, or a shared NoLoader
    [[nodiscard]] jsonld_context::DocumentLoader& loader() const;
};

} // namespace jsonld_api
