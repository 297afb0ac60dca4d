#pragma once

/// @file expand.hpp
/// @brief Expansion engine
///
/// Rewrites a document into expanded form: every key becomes a keyword or an
/// absolute IRI, every property value becomes an array of node, value, list or
/// graph objects. The active context changes per subtree through embedded,
/// property-scoped and type-scoped contexts.

#include "options.hpp"
#include <jsonld_engine/context/active_context.hpp>
#include <jsonld_engine/context/loader.hpp>
#include <jsonld_engine/core/error.hpp>
#include <jsonld_engine/core/value.hpp>
#include <jsonld_engine/syntax/iri.hpp>

#include <optional>
#include <string>
#include <vector>

namespace jsonld_expansion {

/// Active property of a frame; nullopt at the top level
using ActiveProperty = std::optional<std::string>;

// =============================================================================
// Expander
// =============================================================================

/// One expansion run. Owns the blank node issuer and the depth counter, so an
/// Expander must not be shared between concurrent runs.
class Expander {
public:
    Expander(jsonld_context::DocumentLoader& loader, ExpansionOptions options);

    /// Expand a whole document. The result is always an array.
    [[nodiscard]] jsonld_core::Result<jsonld_core::Value> expand(
        const jsonld_context::ContextPtr& active,
        const jsonld_core::Value& document,
        const std::optional<std::string>& base_url);

    /// Expand one element. Returns null when the element expands to nothing.
    [[nodiscard]] jsonld_core::Result<jsonld_core::Value> expand_element(
        const jsonld_context::ContextPtr& active,
        const ActiveProperty& active_property,
        const jsonld_core::Value& element,
        const std::optional<std::string>& base_url,
        bool from_map = false);

    [[nodiscard]] const ExpansionOptions& options() const noexcept { return m_options; }

private:
    jsonld_core::Result<void> expand_object(
        jsonld_core::Value& result,
        const jsonld_context::ContextPtr& active,
        const jsonld_context::ContextPtr& type_scoped,
        const ActiveProperty& active_property,
        const jsonld_core::Value& element,
        const std::optional<std::string>& input_type,
        const std::optional<std::string>& base_url);

    /// Expand the items of a list object. Arrays among them become nested lists.
    jsonld_core::Result<jsonld_core::Value> expand_list(
        const jsonld_context::ContextPtr& active,
        const ActiveProperty& active_property,
        const jsonld_core::Value& items,
        const std::optional<std::string>& base_url);

    jsonld_core::Result<jsonld_core::Value> expand_language_map(
        const jsonld_context::ActiveContext& active,
        const jsonld_context::TermDefinition& term,
        const jsonld_core::Value& value);

    jsonld_core::Result<jsonld_core::Value> expand_index_map(
        const jsonld_context::ContextPtr& active,
        const std::string& key,
        const jsonld_context::TermDefinition& term,
        const jsonld_core::Value& value,
        const std::optional<std::string>& base_url);

    jsonld_core::Result<jsonld_core::Value> finish_object(
        jsonld_core::Value result,
        const ActiveProperty& active_property);

    jsonld_core::Result<jsonld_context::ContextPtr> apply_context(
        const jsonld_context::ContextPtr& active,
        const jsonld_core::Value& local,
        const std::optional<std::string>& base_url,
        bool override_protected,
        bool propagate);

    /// Resolve a non-keyword key according to the key policy.
    /// Ok(nullopt) means the key is dropped.
    jsonld_core::Result<std::optional<std::string>> resolve_key(
        const std::string& key,
        const std::optional<std::string>& expanded);

    /// Record @p value in the warning sink when it was dropped for looking
    /// like a keyword
    void note_ignored(const std::string& value, const char* position);

    /// Warn about a language tag that is not well-formed
    void check_language(const std::string& tag);

    [[nodiscard]] std::string relabel(const std::string& id);
    [[nodiscard]] std::vector<std::string> keys_of(const jsonld_core::Value& object) const;
    [[nodiscard]] bool legacy() const noexcept;

    jsonld_context::DocumentLoader& m_loader;
    ExpansionOptions m_options;
    jsonld_syntax::BlankNodeIssuer m_issuer;
    std::size_t m_depth = 0;
};

// =============================================================================
// Expansion API
// =============================================================================

/// Expand a document against an active context with a fresh Expander
[[nodiscard]] jsonld_core::Result<jsonld_core::Value> expand(
    const jsonld_core::Value& document,
    const jsonld_context::ContextPtr& active,
    const std::optional<std::string>& base_url,
    jsonld_context::DocumentLoader& loader,
    const ExpansionOptions& options = {});

} // namespace jsonld_expansion
