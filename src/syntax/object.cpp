/// @file object.cpp
/// @brief Shape predicates for expanded objects

#include <jsonld_engine/syntax/object.hpp>

namespace jsonld_syntax {

bool is_value_object(const jsonld_core::Value& value) {
    return value.is_object() && value.contains("@value");
}

bool is_list_object(const jsonld_core::Value& value) {
    return value.is_object() && value.contains("@list");
}

bool is_graph_object(const jsonld_core::Value& value) {
    if (!value.is_object() || !value.contains("@graph")) {
        return false;
    }
    for (auto it = value.begin(); it != value.end(); ++it) {
        const std::string& key = it.key();
        if (key != "@graph" && key != "@id" && key != "@index" && key != "@context") {
            return false;
        }
    }
    return true;
}

bool is_simple_graph_object(const jsonld_core::Value& value) {
    return is_graph_object(value) && !value.contains("@id");
}

bool is_node_object(const jsonld_core::Value& value) {
    return value.is_object()
        && !value.contains("@value")
        && !value.contains("@list")
        && !value.contains("@set")
        && !is_graph_object(value);
}

bool is_node_reference(const jsonld_core::Value& value) {
    return value.is_object() && value.size() == 1 && value.contains("@id");
}

} // namespace jsonld_syntax
