#pragma once

/// @file iri.hpp
/// @brief IRI resolution helpers and blank node labelling

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace jsonld_syntax {

// =============================================================================
// IRI Reference
// =============================================================================

/// Components of an IRI reference (RFC 3986 section 3).
/// Absent components are distinguished from empty ones.
struct IriRef {
    std::optional<std::string> scheme;
    std::optional<std::string> authority;
    std::string path;
    std::optional<std::string> query;
    std::optional<std::string> fragment;

    /// Split a reference into its components. Never fails: anything without a
    /// valid scheme is a relative reference.
    [[nodiscard]] static IriRef parse(std::string_view str);

    /// Recompose (RFC 3986 section 5.3)
    [[nodiscard]] std::string to_string() const;
};

// =============================================================================
// Classification
// =============================================================================

/// True if the string starts with a valid scheme followed by ':'.
/// Blank node identifiers ("_:x") are not absolute IRIs.
[[nodiscard]] bool is_absolute_iri(std::string_view str) noexcept;

/// True for "_:" prefixed labels
[[nodiscard]] inline bool is_blank_node_identifier(std::string_view str) noexcept {
    return str.size() >= 2 && str[0] == '_' && str[1] == ':';
}

/// True if the last character is one of ":/?#[]@"
[[nodiscard]] bool ends_with_gen_delim(std::string_view str) noexcept;

/// Split "prefix:suffix" at the first colon after position 0
[[nodiscard]] std::optional<std::pair<std::string, std::string>> compact_iri_split(std::string_view str);

// =============================================================================
// Resolution
// =============================================================================

/// RFC 3986 section 5.2.4
[[nodiscard]] std::string remove_dot_segments(std::string_view path);

/// Resolve a reference against an absolute base (RFC 3986 section 5.2.2).
/// Returns nullopt if the reference is relative and the base has no scheme.
[[nodiscard]] std::optional<std::string> resolve_iri(std::string_view base, std::string_view reference);

/// Express @p iri relative to @p base when they share scheme and authority.
/// The result resolves back to @p iri against @p base.
[[nodiscard]] std::string relativize_iri(std::string_view base, std::string_view iri);

/// ASCII lowercase (language tags)
[[nodiscard]] std::string lowercase(std::string_view str);

/// True for "-"-separated subtags of 1 to 8 characters, the first alphabetic
/// and the rest alphanumeric ("en", "de-CH-1996")
[[nodiscard]] bool is_well_formed_language_tag(std::string_view tag);

// =============================================================================
// BlankNodeIssuer
// =============================================================================

/// Issues fresh blank node labels "_:b0", "_:b1", ...
///
/// A given input label always maps to the same issued label. One issuer is
/// owned by each expansion run.
class BlankNodeIssuer {
public:
    explicit BlankNodeIssuer(std::string prefix = "_:b") : m_prefix(std::move(prefix)) {}

    /// Issue a label for an existing identifier (stable per identifier)
    [[nodiscard]] std::string issue(const std::string& existing);

    /// Issue a label for an anonymous node
    [[nodiscard]] std::string issue_fresh();

    /// Number of labels issued so far
    [[nodiscard]] std::uint64_t issued() const noexcept { return m_counter; }

private:
    std::string m_prefix;
    std::uint64_t m_counter = 0;
    std::map<std::string, std::string> m_issued;
};

} // namespace jsonld_syntax
