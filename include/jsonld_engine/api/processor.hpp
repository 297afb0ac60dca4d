#pragma once

/// @file processor.hpp
/// @brief Processor entry points
///
/// Each call is independent and synchronous. Contexts produced by
/// process_context() are immutable and can be shared between threads.

#include "options.hpp"
#include <jsonld_engine/context/active_context.hpp>
#include <jsonld_engine/core/error.hpp>
#include <jsonld_engine/core/value.hpp>

namespace jsonld_api {

/// Expand a document.
///
/// A string document is treated as an IRI and retrieved through the
/// configured loader; its URL then serves as the default base.
/// @return an array of node objects
[[nodiscard]] jsonld_core::Result<jsonld_core::Value> expand(
    const jsonld_core::Value& document,
    const JsonLdOptions& options = {});

/// Expand a document, then compact it against a context.
///
/// @param context a context value, an IRI, or a map holding "@context"
/// @return a map; a non-empty context is written as its first entry
[[nodiscard]] jsonld_core::Result<jsonld_core::Value> compact(
    const jsonld_core::Value& document,
    const jsonld_core::Value& context,
    const JsonLdOptions& options = {});

/// Process a context against an empty active context rooted at options.base
[[nodiscard]] jsonld_core::Result<jsonld_context::ContextPtr> process_context(
    const jsonld_core::Value& context,
    const JsonLdOptions& options = {});

} // namespace jsonld_api
