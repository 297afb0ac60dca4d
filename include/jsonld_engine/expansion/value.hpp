#pragma once

/// @file value.hpp
/// @brief Value expansion

#include <jsonld_engine/context/active_context.hpp>
#include <jsonld_engine/core/value.hpp>

#include <string>

namespace jsonld_expansion {

/// Expand a scalar under a property.
///
/// - @id / @vocab type mappings turn strings into node references
/// - other type mappings produce typed values
/// - strings receive the term's (or the context's default) language and direction
[[nodiscard]] jsonld_core::Value expand_value(
    const jsonld_context::ActiveContext& active,
    const std::string& active_property,
    const jsonld_core::Value& value);

} // namespace jsonld_expansion
