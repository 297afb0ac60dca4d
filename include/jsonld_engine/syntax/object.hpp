#pragma once

/// @file object.hpp
/// @brief Shape predicates for expanded objects

#include <jsonld_engine/core/value.hpp>

namespace jsonld_syntax {

/// Map holding @value
[[nodiscard]] bool is_value_object(const jsonld_core::Value& value);

/// Map holding @list
[[nodiscard]] bool is_list_object(const jsonld_core::Value& value);

/// Map holding @graph and nothing but @id, @index and @context
[[nodiscard]] bool is_graph_object(const jsonld_core::Value& value);

/// Graph object without @id
[[nodiscard]] bool is_simple_graph_object(const jsonld_core::Value& value);

/// Map that is none of value, list, set or graph object
[[nodiscard]] bool is_node_object(const jsonld_core::Value& value);

/// Map holding only @id
[[nodiscard]] bool is_node_reference(const jsonld_core::Value& value);

} // namespace jsonld_syntax
