#pragma once

/// @file value.hpp
/// @brief The value tree consumed and produced by the engine
///
/// Values are nlohmann::ordered_json trees: a closed tagged union over null,
/// boolean, number (signed, unsigned or floating, never converted between),
/// string, array and object. Objects keep insertion order, which is observable
/// in compaction output.

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace jsonld_core {

/// Parsed JSON-like value
using Value = nlohmann::ordered_json;

/// Value kind tag
using ValueType = nlohmann::ordered_json::value_t;

// =============================================================================
// Construction Helpers
// =============================================================================

/// Wrap a non-array value into a one-element array (arrays pass through).
/// Null becomes an empty array.
[[nodiscard]] Value as_array(const Value& value);
[[nodiscard]] Value as_array(Value&& value);

/// True for null, boolean, number and string
[[nodiscard]] inline bool is_scalar(const Value& value) noexcept {
    return value.is_string() || value.is_number() || value.is_boolean();
}

/// True if the object has exactly the given keys (and no others)
[[nodiscard]] bool has_only_keys(const Value& object, std::initializer_list<const char*> keys);

/// Add a value to an object entry.
///
/// If @p as_array is set the entry is always an array. Arrays in @p value are
/// spliced in element-wise. An existing non-array entry is promoted to an
/// array before appending.
void add_value(Value& object, const std::string& key, const Value& value, bool as_array);

/// Object keys in lexicographic order
[[nodiscard]] std::vector<std::string> sorted_keys(const Value& object);

/// Object keys in insertion order, or lexicographic order when @p ordered
[[nodiscard]] std::vector<std::string> object_keys(const Value& object, bool ordered);

// =============================================================================
// Comparison
// =============================================================================

/// Structural equality for linked-data trees.
///
/// Arrays compare as multisets, except arrays held by an "@list" entry which
/// compare element by element in order. Numbers compare by value.
[[nodiscard]] bool json_ld_equal(const Value& a, const Value& b);

} // namespace jsonld_core
