#pragma once

/// @file mode.hpp
/// @brief Processing mode

#include <cstdint>
#include <optional>
#include <string>

namespace jsonld_syntax {

/// Processing mode. Features introduced by 1.1 are available unless the mode
/// is JsonLd10.
enum class ProcessingMode : std::uint8_t {
    JsonLd10,
    JsonLd11,
};

/// Get mode name ("json-ld-1.0" / "json-ld-1.1")
[[nodiscard]] const char* processing_mode_name(ProcessingMode mode) noexcept;

/// Parse a mode name
[[nodiscard]] std::optional<ProcessingMode> processing_mode_from_string(const std::string& name) noexcept;

} // namespace jsonld_syntax
