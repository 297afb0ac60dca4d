#pragma once

/// @file keyword.hpp
/// @brief Reserved keys and their placement rules

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace jsonld_syntax {

// =============================================================================
// Keyword
// =============================================================================

/// Reserved keys. A keyword is never a valid term name.
enum class Keyword : std::uint8_t {
    Any,        ///< @any (inverse context only)
    Base,
    Container,
    Context,
    Direction,
    Graph,
    Id,
    Import,
    Included,
    Index,
    Json,
    Language,
    List,
    Nest,
    None,
    Null,       ///< @null (inverse context only)
    Prefix,
    Propagate,
    Protected,
    Reverse,
    Set,
    Type,
    Value,
    Version,
    Vocab,
};

/// Get keyword spelling (including the leading '@')
[[nodiscard]] const char* keyword_name(Keyword kw) noexcept;

/// Look up a keyword by its exact spelling
[[nodiscard]] std::optional<Keyword> keyword_from_string(std::string_view str) noexcept;

/// Check if a string is a keyword.
/// @any and @null are internal markers and are not keywords for this test.
[[nodiscard]] bool is_keyword(std::string_view str) noexcept;

/// Check if a string has the form of a keyword: '@' followed by ALPHA only.
/// Such keys are reserved for future use and are ignored when unknown.
[[nodiscard]] bool looks_like_keyword(std::string_view str) noexcept;

// =============================================================================
// Placement Rules
// =============================================================================

/// Keys permitted in an expanded value object
[[nodiscard]] bool allowed_in_value_object(Keyword kw) noexcept;

/// Keys permitted in an expanded term definition
[[nodiscard]] bool allowed_in_term_definition(Keyword kw) noexcept;

/// Keys of a local context that configure the context itself rather than
/// define a term
[[nodiscard]] bool is_context_global(Keyword kw) noexcept;

/// Keywords that may be repeated in one node through aliases (values are merged)
[[nodiscard]] inline bool is_mergeable(Keyword kw) noexcept {
    return kw == Keyword::Type || kw == Keyword::Included;
}

} // namespace jsonld_syntax
