/// @file value.cpp
/// @brief Value expansion

#include <jsonld_engine/expansion/value.hpp>
#include <jsonld_engine/context/processing.hpp>

namespace jsonld_expansion {

using jsonld_core::Value;

jsonld_core::Value expand_value(
    const jsonld_context::ActiveContext& active,
    const std::string& active_property,
    const Value& value) {

    const jsonld_context::TermDefinition* term = active.find(active_property);
    const std::optional<std::string> type_mapping = term ? term->type_mapping : std::nullopt;

    if (type_mapping && value.is_string() && (*type_mapping == "@id" || *type_mapping == "@vocab")) {
        const bool vocab = *type_mapping == "@vocab";
        auto id = jsonld_context::expand_iri(active, value.get<std::string>(), true, vocab);
        Value result = Value::object();
        result["@id"] = id ? Value(*id) : Value(nullptr);
        return result;
    }

    Value result = Value::object();
    result["@value"] = value;

    if (type_mapping && *type_mapping != "@id" && *type_mapping != "@vocab" && *type_mapping != "@none") {
        result["@type"] = *type_mapping;
        return result;
    }

    if (value.is_string()) {
        std::optional<std::string> language = active.default_language();
        if (term && term->language) {
            language = *term->language;
        }

        std::optional<jsonld_syntax::Direction> direction = active.default_direction();
        if (term && term->direction) {
            direction = *term->direction;
        }

        if (language) {
            result["@language"] = *language;
        }
        if (direction) {
            result["@direction"] = jsonld_syntax::direction_name(*direction);
        }
    }

    return result;
}

} // namespace jsonld_expansion
