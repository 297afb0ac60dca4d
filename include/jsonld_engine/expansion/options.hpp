#pragma once

/// @file options.hpp
/// @brief Expansion options

#include <jsonld_engine/core/log.hpp>
#include <jsonld_engine/syntax/mode.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace jsonld_expansion {

// =============================================================================
// KeyPolicy
// =============================================================================

/// What to do with keys that expand to neither a keyword, an IRI nor a blank
/// node identifier
enum class KeyPolicy : std::uint8_t {
    Relaxed,    ///< Keep the key as is
    Standard,   ///< Drop the key unless it contains ':'
    Strict,     ///< Fail with "key expansion failed" unless the key contains ':'
    Strictest,  ///< Always fail with "key expansion failed"
};

/// Get policy name ("relaxed", "standard", "strict", "strictest")
[[nodiscard]] const char* key_policy_name(KeyPolicy policy) noexcept;

/// Parse a policy name
[[nodiscard]] std::optional<KeyPolicy> key_policy_from_string(const std::string& name) noexcept;

// =============================================================================
// ExpansionOptions
// =============================================================================

/// Expansion configuration
struct ExpansionOptions {
    jsonld_syntax::ProcessingMode processing_mode = jsonld_syntax::ProcessingMode::JsonLd11;

    /// Process map entries in lexicographic key order
    bool ordered = false;

    KeyPolicy key_policy = KeyPolicy::Standard;

    /// Maximum nesting of maps and arrays
    std::size_t max_depth = 512;

    /// Maximum nesting of remote context references
    std::size_t max_remote_contexts = 32;

    /// Relabel blank nodes and give anonymous nodes a fresh label
    bool label_blank_nodes = false;

    /// Receives ignored keyword-like terms, keys and IRIs; may be null
    jsonld_core::WarningSinkPtr warnings;
};

} // namespace jsonld_expansion
