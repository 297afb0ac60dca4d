/// @file term_definition.cpp
/// @brief Term definition comparison

#include <jsonld_engine/context/term_definition.hpp>

namespace jsonld_context {

bool TermDefinition::equivalent(const TermDefinition& other) const {
    if (context.has_value() != other.context.has_value()) {
        return false;
    }
    if (context && *context != *other.context) {
        return false;
    }
    return iri == other.iri
        && prefix == other.prefix
        && reverse == other.reverse
        && type_mapping == other.type_mapping
        && language == other.language
        && direction == other.direction
        && container == other.container
        && index == other.index
        && nest == other.nest;
}

} // namespace jsonld_context
