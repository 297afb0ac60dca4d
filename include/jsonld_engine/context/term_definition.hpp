#pragma once

/// @file term_definition.hpp
/// @brief Resolved meaning of one term

#include "fwd.hpp"
#include <jsonld_engine/core/value.hpp>
#include <jsonld_engine/syntax/container.hpp>

#include <optional>
#include <string>

namespace jsonld_context {

/// Term definition.
///
/// Optional fields distinguish "not set" from an explicit null where the
/// difference matters: a term with `language` holding nullopt-inside-optional
/// was defined with "@language": null and suppresses the default language.
struct TermDefinition {
    /// IRI mapping. nullopt for a term explicitly mapped to null.
    std::optional<std::string> iri;

    bool prefix = false;
    bool is_protected = false;
    bool reverse = false;

    /// Type mapping: an IRI or one of @id, @json, @none, @vocab
    std::optional<std::string> type_mapping;

    std::optional<std::optional<std::string>> language;
    std::optional<std::optional<jsonld_syntax::Direction>> direction;

    jsonld_syntax::Container container;

    /// Property-valued index key
    std::optional<std::string> index;

    std::optional<std::string> nest;

    /// Scoped local context, resolved against base_url when applied
    std::optional<jsonld_core::Value> context;
    std::optional<std::string> base_url;

    /// Check if the term has a non-null IRI mapping
    [[nodiscard]] bool has_iri() const noexcept { return iri.has_value(); }

    /// Compare every field except the protected flag and base URL.
    /// An identical redefinition of a protected term is allowed.
    [[nodiscard]] bool equivalent(const TermDefinition& other) const;
};

} // namespace jsonld_context
