/// @file value.cpp
/// @brief Value compaction

#include <jsonld_engine/compaction/value.hpp>
#include <jsonld_engine/compaction/iri.hpp>
#include <jsonld_engine/syntax/iri.hpp>

namespace jsonld_compaction {

using jsonld_core::Err;
using jsonld_core::Ok;
using jsonld_core::Result;
using jsonld_core::Value;
using jsonld_syntax::Container;

namespace {

bool same_language(const Value& value, const std::optional<std::string>& language) {
    auto it = value.find("@language");
    if (it == value.end() || it->is_null()) {
        return !language;
    }
    return language && jsonld_syntax::lowercase(it->get<std::string>()) == jsonld_syntax::lowercase(*language);
}

bool same_direction(const Value& value, const std::optional<jsonld_syntax::Direction>& direction) {
    auto it = value.find("@direction");
    if (it == value.end() || it->is_null()) {
        return !direction;
    }
    return direction && it->get<std::string>() == jsonld_syntax::direction_name(*direction);
}

} // anonymous namespace

Result<Value> compact_value(
    const jsonld_context::ActiveContext& active,
    const std::optional<std::string>& active_property,
    const Value& value,
    const CompactionOptions& options) {

    const jsonld_context::TermDefinition* term = active_property ? active.find(*active_property) : nullptr;
    const std::optional<std::string> type_mapping = term ? term->type_mapping : std::nullopt;
    const Container container = term ? term->container : Container{};

    std::optional<std::string> language = active.default_language();
    if (term && term->language) {
        language = *term->language;
    }
    std::optional<jsonld_syntax::Direction> direction = active.default_direction();
    if (term && term->direction) {
        direction = *term->direction;
    }

    // An @index the container does not absorb must survive in the output
    const bool preserve_index = value.contains("@index") && !container.has(Container::Index);

    if (value.contains("@id") && !value.contains("@value")) {
        const bool reference = value.size() == 1 || (value.size() == 2 && value.contains("@index"));
        if (reference && value["@id"].is_string() && !preserve_index
            && type_mapping && (*type_mapping == "@id" || *type_mapping == "@vocab")) {
            auto id = compact_iri(active, value["@id"].get<std::string>(), *type_mapping == "@vocab", options);
            if (!id) {
                return Err<Value>(std::move(id.error()));
            }
            return Ok(Value(std::move(*id)));
        }
    } else if (value.contains("@type") && type_mapping && value["@type"] == *type_mapping) {
        if (!preserve_index) {
            return Ok(value["@value"]);
        }
    } else if ((type_mapping && *type_mapping == "@none") || value.contains("@type")) {
        // Typed values not implied by the term stay as maps
    } else if (!value["@value"].is_string()) {
        if (!preserve_index) {
            return Ok(value["@value"]);
        }
    } else if (same_language(value, language) && same_direction(value, direction)) {
        if (!preserve_index) {
            return Ok(value["@value"]);
        }
    }

    Value result = Value::object();
    for (auto it = value.begin(); it != value.end(); ++it) {
        auto key = compact_iri(active, it.key(), true, options);
        if (!key) {
            return Err<Value>(std::move(key.error()));
        }

        if (it.key() == "@type" && it->is_string()) {
            auto type = compact_iri(active, it->get<std::string>(), true, options);
            if (!type) {
                return Err<Value>(std::move(type.error()));
            }
            result[*key] = std::move(*type);
        } else if (it.key() == "@id" && it->is_string()) {
            auto id = compact_iri(active, it->get<std::string>(), false, options);
            if (!id) {
                return Err<Value>(std::move(id.error()));
            }
            result[*key] = std::move(*id);
        } else {
            result[*key] = it.value();
        }
    }
    return Ok(std::move(result));
}

} // namespace jsonld_compaction
