#pragma once

/// @file container.hpp
/// @brief Container mappings, base direction and processing mode

#include "mode.hpp"
#include <jsonld_engine/core/error.hpp>
#include <jsonld_engine/core/value.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace jsonld_syntax {

// =============================================================================
// Direction
// =============================================================================

/// Base direction of a string
enum class Direction : std::uint8_t {
    Ltr,
    Rtl,
};

/// Get direction spelling ("ltr" / "rtl")
[[nodiscard]] const char* direction_name(Direction dir) noexcept;

/// Parse "ltr" / "rtl"
[[nodiscard]] std::optional<Direction> direction_from_string(const std::string& str) noexcept;

// =============================================================================
// Container
// =============================================================================

/// Container mapping of a term: a set of container keywords.
///
/// Only the combinations accepted by from_value() can be constructed from
/// documents: a single keyword, @set with one of @index/@id/@type/@language,
/// and @graph with @id or @index (optionally with @set).
class Container {
public:
    enum Flag : std::uint8_t {
        Graph = 1 << 0,
        Id = 1 << 1,
        Index = 1 << 2,
        Language = 1 << 3,
        List = 1 << 4,
        Set = 1 << 5,
        Type = 1 << 6,
    };

    constexpr Container() noexcept = default;
    constexpr explicit Container(std::uint8_t bits) noexcept : m_bits(bits) {}

    /// Parse a container mapping (string or array of strings)
    [[nodiscard]] static jsonld_core::Result<Container> from_value(
        const jsonld_core::Value& value, ProcessingMode mode);

    [[nodiscard]] constexpr bool empty() const noexcept { return m_bits == 0; }
    [[nodiscard]] constexpr bool has(Flag flag) const noexcept { return (m_bits & flag) != 0; }
    [[nodiscard]] constexpr std::uint8_t bits() const noexcept { return m_bits; }

    /// True if the container is exactly the given flags
    [[nodiscard]] constexpr bool is(std::uint8_t flags) const noexcept { return m_bits == flags; }

    void add(Flag flag) noexcept { m_bits = static_cast<std::uint8_t>(m_bits | flag); }

    /// Inverse-context key: the keywords concatenated in lexicographic order
    /// ("@graph@id@set"), or "@none" for an empty container.
    [[nodiscard]] std::string key() const;

    /// Array form of the mapping, for diagnostics and round-tripping
    [[nodiscard]] jsonld_core::Value to_value() const;

    constexpr bool operator==(const Container& other) const noexcept = default;

private:
    std::uint8_t m_bits = 0;
};

} // namespace jsonld_syntax
