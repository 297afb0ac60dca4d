#pragma once

/// @file compact.hpp
/// @brief Compaction engine
///
/// Rewrites an expanded document against a context: IRIs become terms or
/// compact IRIs, values lose the type and language the term already implies,
/// and container mappings turn arrays into lists, sets and maps keyed by
/// language, index, id or type.

#include "options.hpp"
#include <jsonld_engine/context/active_context.hpp>
#include <jsonld_engine/context/loader.hpp>
#include <jsonld_engine/core/error.hpp>
#include <jsonld_engine/core/value.hpp>

#include <optional>
#include <string>

namespace jsonld_compaction {

/// Active property of a frame; nullopt at the top level
using ActiveProperty = std::optional<std::string>;

// =============================================================================
// Compactor
// =============================================================================

/// One compaction run. Holds the depth counter, so a Compactor must not be
/// shared between concurrent runs.
class Compactor {
public:
    Compactor(jsonld_context::DocumentLoader& loader, CompactionOptions options);

    /// Compact an expanded document. Arrays at the top level are wrapped under
    /// the @graph alias and an empty result becomes an empty map.
    [[nodiscard]] jsonld_core::Result<jsonld_core::Value> compact(
        const jsonld_context::ContextPtr& active,
        const jsonld_core::Value& expanded);

    /// Compact one element of an expanded document
    [[nodiscard]] jsonld_core::Result<jsonld_core::Value> compact_element(
        const jsonld_context::ContextPtr& active,
        const ActiveProperty& active_property,
        const jsonld_core::Value& element);

    [[nodiscard]] const CompactionOptions& options() const noexcept { return m_options; }

private:
    /// Compact one value of an expanded property into @p result, honoring
    /// the selected term's container and nest mapping
    jsonld_core::Result<void> compact_item(
        jsonld_core::Value& result,
        const jsonld_context::ContextPtr& active,
        const std::string& expanded_property,
        const jsonld_core::Value& expanded_item,
        bool inside_reverse);

    /// Map a nested term to the object its values are written into
    jsonld_core::Result<jsonld_core::Value*> nest_target(
        jsonld_core::Value& result,
        const jsonld_context::ActiveContext& active,
        const std::string& property);

    jsonld_core::Result<jsonld_context::ContextPtr> apply_context(
        const jsonld_context::ContextPtr& active,
        const jsonld_core::Value& local,
        const std::optional<std::string>& base_url,
        bool override_protected,
        bool propagate);

    [[nodiscard]] std::string alias(const jsonld_context::ActiveContext& active, const std::string& keyword) const;

    jsonld_context::DocumentLoader& m_loader;
    CompactionOptions m_options;
    std::size_t m_depth = 0;
};

// =============================================================================
// Compaction API
// =============================================================================

/// Compact an expanded document with a fresh Compactor
[[nodiscard]] jsonld_core::Result<jsonld_core::Value> compact(
    const jsonld_core::Value& expanded,
    const jsonld_context::ContextPtr& active,
    jsonld_context::DocumentLoader& loader,
    const CompactionOptions& options = {});

} // namespace jsonld_compaction
