#pragma once

/// @file active_context.hpp
/// @brief Immutable active context snapshots

#include "fwd.hpp"
#include "term_definition.hpp"
#include "inverse_context.hpp"
#include <jsonld_engine/syntax/container.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace jsonld_context {

// =============================================================================
// ContextData
// =============================================================================

/// Mutable contents of a context under construction.
///
/// Context processing copies the data of the active context, updates the copy
/// and freezes it into a new ActiveContext. The term table holds shared
/// definitions, so the copy shares every term it does not redefine.
struct ContextData {
    std::optional<std::string> original_base_url;
    std::optional<std::string> base_iri;
    std::optional<std::string> vocab;
    std::optional<std::string> default_language;
    std::optional<jsonld_syntax::Direction> default_direction;

    /// Context to revert to when entering a node (non-propagated contexts)
    ContextPtr previous;

    std::map<std::string, TermPtr> terms;

    /// Look up a term definition
    [[nodiscard]] const TermDefinition* find(const std::string& term) const {
        auto it = terms.find(term);
        return it != terms.end() ? it->second.get() : nullptr;
    }

    /// True if any term is protected
    [[nodiscard]] bool has_protected_terms() const;
};

// =============================================================================
// ActiveContext
// =============================================================================

/// Frozen context snapshot. Shared through ContextPtr and never modified.
class ActiveContext {
public:
    explicit ActiveContext(ContextData data) : m_data(std::move(data)) {}

    ActiveContext(const ActiveContext&) = delete;
    ActiveContext& operator=(const ActiveContext&) = delete;

    /// Create an empty context rooted at a base IRI
    [[nodiscard]] static ContextPtr create(std::optional<std::string> base_iri);

    /// Freeze context data
    [[nodiscard]] static ContextPtr freeze(ContextData data);

    [[nodiscard]] const ContextData& data() const noexcept { return m_data; }

    [[nodiscard]] const std::optional<std::string>& original_base_url() const noexcept { return m_data.original_base_url; }
    [[nodiscard]] const std::optional<std::string>& base_iri() const noexcept { return m_data.base_iri; }
    [[nodiscard]] const std::optional<std::string>& vocab() const noexcept { return m_data.vocab; }
    [[nodiscard]] const std::optional<std::string>& default_language() const noexcept { return m_data.default_language; }
    [[nodiscard]] std::optional<jsonld_syntax::Direction> default_direction() const noexcept { return m_data.default_direction; }
    [[nodiscard]] const ContextPtr& previous_context() const noexcept { return m_data.previous; }
    [[nodiscard]] const std::map<std::string, TermPtr>& terms() const noexcept { return m_data.terms; }

    /// Look up a term definition
    [[nodiscard]] const TermDefinition* find(const std::string& term) const { return m_data.find(term); }

    /// Shared handle to a term definition (nullptr if undefined)
    [[nodiscard]] TermPtr get(const std::string& term) const;

    [[nodiscard]] bool has_protected_terms() const { return m_data.has_protected_terms(); }

    /// Inverse context, built on first use. Safe to call concurrently.
    [[nodiscard]] const InverseContext& inverse() const;

private:
    ContextData m_data;
    mutable std::once_flag m_inverse_once;
    mutable std::unique_ptr<InverseContext> m_inverse;
};

} // namespace jsonld_context
