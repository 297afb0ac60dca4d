#pragma once

/// @file value.hpp
/// @brief Value compaction

#include "options.hpp"
#include <jsonld_engine/context/active_context.hpp>
#include <jsonld_engine/core/error.hpp>
#include <jsonld_engine/core/value.hpp>

#include <optional>
#include <string>

namespace jsonld_compaction {

/// Compact a value object or node reference held by a property.
///
/// The result is a scalar when the value's type, language and direction are
/// implied by the term; otherwise a map with aliased keywords.
[[nodiscard]] jsonld_core::Result<jsonld_core::Value> compact_value(
    const jsonld_context::ActiveContext& active,
    const std::optional<std::string>& active_property,
    const jsonld_core::Value& value,
    const CompactionOptions& options);

} // namespace jsonld_compaction
