/// @file expand.cpp
/// @brief Expansion engine

#include <jsonld_engine/expansion/expand.hpp>
#include <jsonld_engine/expansion/value.hpp>
#include <jsonld_engine/context/processing.hpp>
#include <jsonld_engine/core/log.hpp>
#include <jsonld_engine/syntax/keyword.hpp>
#include <jsonld_engine/syntax/object.hpp>

#include <algorithm>

namespace jsonld_expansion {

using jsonld_context::ContextPtr;
using jsonld_context::TermDefinition;
using jsonld_context::TermPtr;
using jsonld_core::Err;
using jsonld_core::Error;
using jsonld_core::ErrorCode;
using jsonld_core::Ok;
using jsonld_core::Result;
using jsonld_core::Value;
using jsonld_syntax::Container;

namespace {

/// Tracks recursion depth for the lifetime of one frame
class DepthGuard {
public:
    explicit DepthGuard(std::size_t& depth) : m_depth(depth) { ++m_depth; }
    ~DepthGuard() { --m_depth; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    std::size_t& m_depth;
};

bool is_keyword_value(const std::optional<std::string>& expanded, const char* keyword) {
    return expanded && *expanded == keyword;
}

bool is_graph_property(const ActiveProperty& property) {
    return !property || *property == "@graph";
}

Value wrap(const char* key, Value value) {
    Value result = Value::object();
    result[key] = std::move(value);
    return result;
}

} // anonymous namespace

// =============================================================================
// Expander
// =============================================================================

Expander::Expander(jsonld_context::DocumentLoader& loader, ExpansionOptions options)
    : m_loader(loader)
    , m_options(options) {}

bool Expander::legacy() const noexcept {
    return m_options.processing_mode == jsonld_syntax::ProcessingMode::JsonLd10;
}

std::vector<std::string> Expander::keys_of(const Value& object) const {
    return jsonld_core::object_keys(object, m_options.ordered);
}

void Expander::note_ignored(const std::string& value, const char* position) {
    // IRI expansion has already logged it
    if (m_options.warnings && jsonld_syntax::looks_like_keyword(value)) {
        m_options.warnings->report(jsonld_core::WarningKind::KeywordLikeValue,
            std::string("Ignoring ") + position + " '" + value + "' that has the form of a keyword");
    }
}

void Expander::check_language(const std::string& tag) {
    if (!jsonld_syntax::is_well_formed_language_tag(tag)) {
        jsonld_core::report_warning(jsonld_core::expansion_logger(), m_options.warnings,
            jsonld_core::WarningKind::MalformedLanguageTag, "Language tag '" + tag + "' is not well-formed");
    }
}

std::string Expander::relabel(const std::string& id) {
    if (m_options.label_blank_nodes && jsonld_syntax::is_blank_node_identifier(id)) {
        return m_issuer.issue(id);
    }
    return id;
}

Result<ContextPtr> Expander::apply_context(
    const ContextPtr& active,
    const Value& local,
    const std::optional<std::string>& base_url,
    bool override_protected,
    bool propagate) {

    jsonld_context::ContextProcessingOptions options;
    options.processing_mode = m_options.processing_mode;
    options.override_protected = override_protected;
    options.propagate = propagate;
    options.max_remote_contexts = m_options.max_remote_contexts;
    options.warnings = m_options.warnings;

    jsonld_core::expansion_logger()->trace("Applying {} context", propagate ? "scoped" : "type-scoped");
    return jsonld_context::process_context(active, local, base_url, m_loader, options);
}

Result<std::optional<std::string>> Expander::resolve_key(
    const std::string& key, const std::optional<std::string>& expanded) {

    using Resolved = std::optional<std::string>;

    if (expanded && (jsonld_syntax::is_absolute_iri(*expanded) || jsonld_syntax::is_blank_node_identifier(*expanded))) {
        return Ok(Resolved(expanded));
    }

    // Null-mapped terms and keyword-like keys were already reported by IRI
    // expansion
    if (!expanded) {
        note_ignored(key, "key");
        return Ok(Resolved());
    }

    const bool has_colon = expanded->find(':') != std::string::npos;

    switch (m_options.key_policy) {
        case KeyPolicy::Relaxed:
            return Ok(Resolved(expanded));
        case KeyPolicy::Standard:
            if (has_colon) {
                return Ok(Resolved(expanded));
            }
            jsonld_core::expansion_logger()->debug("Dropping key '{}' that does not expand to an IRI", key);
            return Ok(Resolved());
        case KeyPolicy::Strict:
            if (has_colon) {
                return Ok(Resolved(expanded));
            }
            break;
        case KeyPolicy::Strictest:
        default:
            break;
    }

    Error err(ErrorCode::KeyExpansionFailed, "Key '" + key + "' does not expand to an IRI");
    err.with_context("key", key);
    return Err<Resolved>(std::move(err));
}

Result<Value> Expander::expand(
    const ContextPtr& active,
    const Value& document,
    const std::optional<std::string>& base_url) {

    jsonld_core::LogScope scope("expand", jsonld_core::expansion_logger());

    auto expanded = expand_element(active, std::nullopt, document, base_url);
    if (!expanded) {
        return expanded;
    }

    Value top = std::move(*expanded);
    if (top.is_object() && top.size() == 1 && top.contains("@graph")) {
        top = std::move(top["@graph"]);
    }

    Value result = Value::array();
    for (auto& item : jsonld_core::as_array(std::move(top))) {
        if (!item.is_object() || item.empty()
            || jsonld_syntax::is_value_object(item) || jsonld_syntax::is_list_object(item)) {
            continue;
        }
        result.push_back(std::move(item));
    }

    return Ok(std::move(result));
}

Result<Value> Expander::expand_element(
    const ContextPtr& active,
    const ActiveProperty& active_property,
    const Value& element,
    const std::optional<std::string>& base_url,
    bool from_map) {

    DepthGuard guard(m_depth);
    if (m_depth > m_options.max_depth) {
        return Err<Value>(ErrorCode::MaximumDepthExceeded,
            "Document nesting exceeds " + std::to_string(m_options.max_depth) + " levels");
    }

    if (element.is_null()) {
        return Ok(Value());
    }

    const TermPtr property_term = active_property ? active->get(*active_property) : nullptr;

    // Scalars
    if (!element.is_array() && !element.is_object()) {
        if (is_graph_property(active_property)) {
            return Ok(Value());
        }

        ContextPtr current = active;
        if (property_term && property_term->context) {
            auto scoped = apply_context(current, *property_term->context, property_term->base_url, true, true);
            if (!scoped) {
                return Err<Value>(std::move(scoped.error()));
            }
            current = std::move(*scoped);
        }

        Value value = expand_value(*current, *active_property, element);
        if (auto id = value.find("@id"); id != value.end() && id->is_string()) {
            *id = relabel(id->get<std::string>());
        }
        return Ok(std::move(value));
    }

    // Arrays
    if (element.is_array()) {
        const bool list_container = property_term && property_term->container.has(Container::List);

        Value result = Value::array();
        for (const auto& item : element) {
            auto expanded = expand_element(active, active_property, item, base_url, from_map);
            if (!expanded) {
                return expanded;
            }

            Value& value = *expanded;
            if (list_container && value.is_array()) {
                if (legacy()) {
                    return Err<Value>(ErrorCode::ListOfLists, "Nested lists are not allowed in json-ld-1.0 mode");
                }
                value = wrap("@list", std::move(value));
            }

            if (value.is_array()) {
                for (auto& inner : value) {
                    result.push_back(std::move(inner));
                }
            } else if (!value.is_null()) {
                result.push_back(std::move(value));
            }
        }
        return Ok(std::move(result));
    }

    // Maps
    ContextPtr current = active;

    if (current->previous_context() && !from_map) {
        bool keep = false;
        for (auto it = element.begin(); it != element.end() && !keep; ++it) {
            auto expanded = jsonld_context::expand_iri(*current, it.key(), false, true);
            keep = is_keyword_value(expanded, "@value")
                || (element.size() == 1 && is_keyword_value(expanded, "@id"));
        }
        if (!keep) {
            current = current->previous_context();
        }
    }

    if (property_term && property_term->context) {
        auto scoped = apply_context(current, *property_term->context, property_term->base_url, true, true);
        if (!scoped) {
            return Err<Value>(std::move(scoped.error()));
        }
        current = std::move(*scoped);
    }

    if (auto it = element.find("@context"); it != element.end()) {
        auto embedded = apply_context(current, *it, base_url, false, true);
        if (!embedded) {
            return Err<Value>(std::move(embedded.error()));
        }
        current = std::move(*embedded);
    }

    const ContextPtr type_scoped = current;
    std::optional<std::string> input_type;
    bool type_key_seen = false;

    for (const auto& key : jsonld_core::sorted_keys(element)) {
        auto expanded = jsonld_context::expand_iri(*current, key, false, true);
        if (!is_keyword_value(expanded, "@type")) {
            continue;
        }

        const Value types = jsonld_core::as_array(element.at(key));

        std::vector<std::string> terms;
        for (const auto& type : types) {
            if (type.is_string()) {
                terms.push_back(type.get<std::string>());
            }
        }
        std::sort(terms.begin(), terms.end());

        for (const auto& term : terms) {
            const TermDefinition* def = type_scoped->find(term);
            if (def && def->context) {
                auto scoped = apply_context(current, *def->context, def->base_url, false, false);
                if (!scoped) {
                    return Err<Value>(std::move(scoped.error()));
                }
                current = std::move(*scoped);
            }
        }

        if (!type_key_seen) {
            type_key_seen = true;
            if (!types.empty() && types.back().is_string()) {
                input_type = jsonld_context::expand_iri(*current, types.back().get<std::string>(), false, true);
            }
        }
    }

    Value result = Value::object();
    auto expanded = expand_object(result, current, type_scoped, active_property, element, input_type, base_url);
    if (!expanded) {
        return Err<Value>(std::move(expanded.error()));
    }

    return finish_object(std::move(result), active_property);
}

Result<Value> Expander::expand_list(
    const ContextPtr& active,
    const ActiveProperty& active_property,
    const Value& items,
    const std::optional<std::string>& base_url) {

    DepthGuard guard(m_depth);
    if (m_depth > m_options.max_depth) {
        return Err<Value>(ErrorCode::MaximumDepthExceeded,
            "Document nesting exceeds " + std::to_string(m_options.max_depth) + " levels");
    }

    Value result = Value::array();
    for (const auto& item : jsonld_core::as_array(items)) {
        if (item.is_array()) {
            if (legacy()) {
                return Err<Value>(ErrorCode::ListOfLists, "Nested lists are not allowed in json-ld-1.0 mode");
            }
            auto inner = expand_list(active, active_property, item, base_url);
            if (!inner) {
                return inner;
            }
            result.push_back(wrap("@list", std::move(*inner)));
            continue;
        }

        auto expanded = expand_element(active, active_property, item, base_url);
        if (!expanded) {
            return expanded;
        }
        if (expanded->is_array()) {
            for (auto& inner : *expanded) {
                result.push_back(std::move(inner));
            }
        } else if (!expanded->is_null()) {
            result.push_back(std::move(*expanded));
        }
    }
    return Ok(std::move(result));
}

// =============================================================================
// Result Validation
// =============================================================================

Result<Value> Expander::finish_object(Value result, const ActiveProperty& active_property) {
    if (result.contains("@value")) {
        for (auto it = result.begin(); it != result.end(); ++it) {
            auto kw = jsonld_syntax::keyword_from_string(it.key());
            if (!kw || !jsonld_syntax::allowed_in_value_object(*kw)) {
                return Err<Value>(ErrorCode::InvalidValueObject,
                    "Value object has unexpected entry '" + it.key() + "'");
            }
        }

        if (result.contains("@type") && (result.contains("@language") || result.contains("@direction"))) {
            return Err<Value>(ErrorCode::InvalidValueObject,
                "Value object cannot have both @type and @language or @direction");
        }

        const bool json_literal = result.contains("@type") && result["@type"] == "@json";
        if (!json_literal) {
            const Value& value = result["@value"];
            if (value.is_null() || (value.is_array() && value.empty())) {
                return Ok(Value());
            }
            if (!jsonld_core::is_scalar(value)) {
                return Err<Value>(ErrorCode::InvalidValueObjectValue, "@value must be a scalar, got: " + value.dump());
            }
            if (!value.is_string() && result.contains("@language")) {
                return Err<Value>(ErrorCode::InvalidLanguageTaggedValue,
                    "Only strings can carry a language, got: " + value.dump());
            }
            if (result.contains("@type")) {
                const Value& type = result["@type"];
                if (!type.is_string() || !jsonld_syntax::is_absolute_iri(type.get<std::string>())) {
                    return Err<Value>(ErrorCode::InvalidTypedValue, "Value type must be an IRI, got: " + type.dump());
                }
            }
        }
    } else if (result.contains("@type") && !result["@type"].is_array()) {
        result["@type"] = jsonld_core::as_array(result["@type"]);
    } else if (result.contains("@set") || result.contains("@list")) {
        if (result.size() > 2 || (result.size() == 2 && !result.contains("@index"))) {
            return Err<Value>(ErrorCode::InvalidSetOrListObject,
                "Set and list objects may only carry @index besides their content");
        }
        if (result.contains("@set")) {
            Value content = std::move(result["@set"]);
            return Ok(std::move(content));
        }
    }

    if (result.size() == 1 && result.contains("@language")) {
        return Ok(Value());
    }

    if (is_graph_property(active_property)) {
        if (result.empty() || result.contains("@value") || result.contains("@list")) {
            return Ok(Value());
        }
    }

    if (m_options.label_blank_nodes && !(active_property && *active_property == "@reverse")
        && jsonld_syntax::is_node_object(result) && !result.contains("@id")) {
        result["@id"] = m_issuer.issue_fresh();
    }

    return Ok(std::move(result));
}

// =============================================================================
// Map Entries
// =============================================================================

Result<void> Expander::expand_object(
    Value& result,
    const ContextPtr& active,
    const ContextPtr& type_scoped,
    const ActiveProperty& active_property,
    const Value& element,
    const std::optional<std::string>& input_type,
    const std::optional<std::string>& base_url) {

    std::vector<std::string> nests;

    for (const auto& key : keys_of(element)) {
        if (key == "@context") {
            continue;
        }

        const Value& value = element.at(key);
        const auto expanded_key = jsonld_context::expand_iri(*active, key, false, true);

        std::string property;
        if (expanded_key && jsonld_syntax::is_keyword(*expanded_key)) {
            property = *expanded_key;
        } else {
            auto resolved = resolve_key(key, expanded_key);
            if (!resolved) {
                return Err(std::move(resolved.error()));
            }
            if (!*resolved) {
                continue;
            }
            property = std::move(**resolved);
        }

        // Keyword entries
        if (jsonld_syntax::is_keyword(property)) {
            if (active_property && *active_property == "@reverse") {
                return Err(ErrorCode::InvalidReversePropertyMap,
                    "Keyword '" + property + "' is not allowed in a @reverse map");
            }
            if (result.contains(property) && property != "@included" && property != "@type") {
                return Err(ErrorCode::CollidingKeywords, "Keyword '" + property + "' appears more than once");
            }

            Value expanded_value;

            if (property == "@id") {
                if (!value.is_string()) {
                    return Err(ErrorCode::InvalidIdValue, "@id must be a string, got: " + value.dump());
                }
                auto id = jsonld_context::expand_iri(*active, value.get<std::string>(), true, false);
                if (!id) {
                    note_ignored(value.get<std::string>(), "@id");
                }
                expanded_value = id ? Value(relabel(*id)) : Value(nullptr);
            } else if (property == "@type") {
                bool valid = value.is_string() || value.is_array();
                if (value.is_array()) {
                    valid = std::all_of(value.begin(), value.end(), [](const Value& v) { return v.is_string(); });
                }
                if (!valid) {
                    return Err(ErrorCode::InvalidTypeValue, "@type must be a string or an array of strings, got: " + value.dump());
                }

                Value types = Value::array();
                for (const auto& type : jsonld_core::as_array(value)) {
                    auto iri = jsonld_context::expand_iri(*type_scoped, type.get<std::string>(), true, true);
                    if (iri) {
                        types.push_back(relabel(*iri));
                    } else {
                        note_ignored(type.get<std::string>(), "@type");
                    }
                }

                if (result.contains("@type")) {
                    Value combined = jsonld_core::as_array(result["@type"]);
                    for (auto& type : types) {
                        combined.push_back(std::move(type));
                    }
                    expanded_value = std::move(combined);
                } else if (value.is_string()) {
                    if (types.empty()) {
                        continue;
                    }
                    expanded_value = std::move(types[0]);
                } else {
                    expanded_value = std::move(types);
                }
            } else if (property == "@graph") {
                auto graph = expand_element(active, std::string("@graph"), value, base_url);
                if (!graph) {
                    return Err(std::move(graph.error()));
                }
                expanded_value = jsonld_core::as_array(std::move(*graph));
            } else if (property == "@included") {
                if (legacy()) {
                    continue;
                }
                auto included = expand_element(active, std::nullopt, value, base_url);
                if (!included) {
                    return Err(std::move(included.error()));
                }
                expanded_value = jsonld_core::as_array(std::move(*included));
                for (const auto& item : expanded_value) {
                    if (!jsonld_syntax::is_node_object(item)) {
                        return Err(ErrorCode::InvalidIncludedValue, "@included values must be node objects");
                    }
                }
                if (result.contains("@included")) {
                    Value combined = result["@included"];
                    for (auto& item : expanded_value) {
                        combined.push_back(std::move(item));
                    }
                    expanded_value = std::move(combined);
                }
            } else if (property == "@value") {
                const bool json_literal = !legacy() && input_type && *input_type == "@json";
                if (!json_literal && !value.is_null() && !jsonld_core::is_scalar(value)) {
                    return Err(ErrorCode::InvalidValueObjectValue, "@value must be a scalar or null, got: " + value.dump());
                }
                result["@value"] = value;
                continue;
            } else if (property == "@language") {
                if (!value.is_string()) {
                    return Err(ErrorCode::InvalidLanguageTaggedString, "@language must be a string, got: " + value.dump());
                }
                check_language(value.get<std::string>());
                expanded_value = value;
            } else if (property == "@direction") {
                if (legacy()) {
                    continue;
                }
                if (!value.is_string() || !jsonld_syntax::direction_from_string(value.get<std::string>())) {
                    return Err(ErrorCode::InvalidBaseDirection, "@direction must be \"ltr\" or \"rtl\", got: " + value.dump());
                }
                expanded_value = value;
            } else if (property == "@index") {
                if (!value.is_string()) {
                    return Err(ErrorCode::InvalidIndexValue, "@index must be a string, got: " + value.dump());
                }
                expanded_value = value;
            } else if (property == "@list") {
                if (is_graph_property(active_property)) {
                    continue;
                }
                auto list = expand_list(active, active_property, value, base_url);
                if (!list) {
                    return Err(std::move(list.error()));
                }
                expanded_value = std::move(*list);
                if (legacy()) {
                    for (const auto& item : expanded_value) {
                        if (jsonld_syntax::is_list_object(item)) {
                            return Err(ErrorCode::ListOfLists, "Nested lists are not allowed in json-ld-1.0 mode");
                        }
                    }
                }
            } else if (property == "@set") {
                auto set = expand_element(active, active_property, value, base_url);
                if (!set) {
                    return Err(std::move(set.error()));
                }
                expanded_value = std::move(*set);
            } else if (property == "@reverse") {
                if (!value.is_object()) {
                    return Err(ErrorCode::InvalidReverseValue, "@reverse must be a map, got: " + value.dump());
                }
                auto reversed = expand_element(active, std::string("@reverse"), value, base_url);
                if (!reversed) {
                    return Err(std::move(reversed.error()));
                }
                const Value& reverse_value = *reversed;
                if (!reverse_value.is_object()) {
                    continue;
                }

                if (auto inner = reverse_value.find("@reverse"); inner != reverse_value.end()) {
                    for (auto it = inner->begin(); it != inner->end(); ++it) {
                        jsonld_core::add_value(result, it.key(), it.value(), true);
                    }
                }

                for (auto it = reverse_value.begin(); it != reverse_value.end(); ++it) {
                    if (it.key() == "@reverse") {
                        continue;
                    }
                    if (!result.contains("@reverse")) {
                        result["@reverse"] = Value::object();
                    }
                    for (const auto& item : it.value()) {
                        if (jsonld_syntax::is_value_object(item) || jsonld_syntax::is_list_object(item)) {
                            return Err(ErrorCode::InvalidReversePropertyValue,
                                "Reverse property '" + it.key() + "' cannot hold values or lists");
                        }
                        jsonld_core::add_value(result["@reverse"], it.key(), item, true);
                    }
                }
                continue;
            } else if (property == "@nest") {
                nests.push_back(key);
                continue;
            } else {
                continue;
            }

            if (!expanded_value.is_null()) {
                result[property] = std::move(expanded_value);
            }
            continue;
        }

        // Property entries
        const TermPtr term = active->get(key);
        const Container container = term ? term->container : Container{};
        Value expanded_value;

        if (term && term->type_mapping && *term->type_mapping == "@json") {
            expanded_value = Value::object();
            expanded_value["@value"] = value;
            expanded_value["@type"] = "@json";
        } else if (container.has(Container::Language) && value.is_object()) {
            auto map = expand_language_map(*active, *term, value);
            if (!map) {
                return Err(std::move(map.error()));
            }
            expanded_value = std::move(*map);
        } else if ((container.has(Container::Index) || container.has(Container::Type) || container.has(Container::Id))
                   && value.is_object()) {
            auto map = expand_index_map(active, key, *term, value, base_url);
            if (!map) {
                return Err(std::move(map.error()));
            }
            expanded_value = std::move(*map);
        } else {
            auto expanded = expand_element(active, key, value, base_url);
            if (!expanded) {
                return Err(std::move(expanded.error()));
            }
            expanded_value = std::move(*expanded);
        }

        if (expanded_value.is_null()) {
            continue;
        }

        if (container.has(Container::List) && !jsonld_syntax::is_list_object(expanded_value)) {
            expanded_value = wrap("@list", jsonld_core::as_array(std::move(expanded_value)));
        }

        if (container.has(Container::Graph) && !container.has(Container::Id) && !container.has(Container::Index)) {
            Value graphs = Value::array();
            for (auto& item : jsonld_core::as_array(std::move(expanded_value))) {
                graphs.push_back(wrap("@graph", jsonld_core::as_array(std::move(item))));
            }
            expanded_value = std::move(graphs);
        }

        if (term && term->reverse) {
            if (!result.contains("@reverse")) {
                result["@reverse"] = Value::object();
            }
            for (const auto& item : jsonld_core::as_array(expanded_value)) {
                if (jsonld_syntax::is_value_object(item) || jsonld_syntax::is_list_object(item)) {
                    return Err(ErrorCode::InvalidReversePropertyValue,
                        "Reverse property '" + key + "' cannot hold values or lists");
                }
                jsonld_core::add_value(result["@reverse"], property, item, true);
            }
        } else {
            jsonld_core::add_value(result, property, expanded_value, true);
        }
    }

    // Nested entries are expanded into the same node, in key order
    std::sort(nests.begin(), nests.end());
    for (const auto& nesting_key : nests) {
        for (const auto& nested : jsonld_core::as_array(element.at(nesting_key))) {
            if (!nested.is_object()) {
                return Err(ErrorCode::InvalidNestValue, "@nest values must be maps, got: " + nested.dump());
            }
            for (auto it = nested.begin(); it != nested.end(); ++it) {
                auto expanded = jsonld_context::expand_iri(*active, it.key(), false, true);
                if (is_keyword_value(expanded, "@value")) {
                    return Err(ErrorCode::InvalidNestValue, "@nest values cannot be value objects");
                }
            }
            auto merged = expand_object(result, active, type_scoped, active_property, nested, input_type, base_url);
            if (!merged) {
                return merged;
            }
        }
    }

    return Ok();
}

// =============================================================================
// Container Maps
// =============================================================================

Result<Value> Expander::expand_language_map(
    const jsonld_context::ActiveContext& active,
    const TermDefinition& term,
    const Value& value) {

    std::optional<jsonld_syntax::Direction> direction = active.default_direction();
    if (term.direction) {
        direction = *term.direction;
    }

    Value result = Value::array();
    for (const auto& language : keys_of(value)) {
        const auto expanded_language = jsonld_context::expand_iri(active, language, false, true);
        const bool none = language == "@none" || is_keyword_value(expanded_language, "@none");
        if (!none) {
            check_language(language);
        }

        for (const auto& item : jsonld_core::as_array(value.at(language))) {
            if (item.is_null()) {
                continue;
            }
            if (!item.is_string()) {
                return Err<Value>(ErrorCode::InvalidLanguageMapValue,
                    "Language map values must be strings, got: " + item.dump());
            }

            Value entry = Value::object();
            entry["@value"] = item;
            if (!none) {
                entry["@language"] = language;
            }
            if (direction) {
                entry["@direction"] = jsonld_syntax::direction_name(*direction);
            }
            result.push_back(std::move(entry));
        }
    }
    return Ok(std::move(result));
}

Result<Value> Expander::expand_index_map(
    const ContextPtr& active,
    const std::string& key,
    const TermDefinition& term,
    const Value& value,
    const std::optional<std::string>& base_url) {

    const Container& container = term.container;
    const std::string index_key = term.index.value_or("@index");

    Value result = Value::array();
    for (const auto& index : keys_of(value)) {
        // Type maps expand their values outside any non-propagated context
        ContextPtr map_context = active;
        if (container.has(Container::Type)) {
            if (active->previous_context()) {
                map_context = active->previous_context();
            }
            const TermDefinition* index_term = active->find(index);
            if (index_term && index_term->context) {
                auto scoped = apply_context(map_context, *index_term->context, index_term->base_url, false, true);
                if (!scoped) {
                    return Err<Value>(std::move(scoped.error()));
                }
                map_context = std::move(*scoped);
            }
        }

        const auto expanded_index = jsonld_context::expand_iri(*active, index, false, true);
        const bool none = is_keyword_value(expanded_index, "@none");

        auto expanded = expand_element(map_context, key, jsonld_core::as_array(value.at(index)), base_url, true);
        if (!expanded) {
            return expanded;
        }

        for (auto& item : jsonld_core::as_array(std::move(*expanded))) {
            if (container.has(Container::Graph) && !jsonld_syntax::is_graph_object(item)) {
                item = wrap("@graph", jsonld_core::as_array(std::move(item)));
            }

            if (container.has(Container::Index) && index_key != "@index" && !none) {
                if (jsonld_syntax::is_value_object(item)) {
                    return Err<Value>(ErrorCode::InvalidValueObject,
                        "Property-valued index '" + index_key + "' cannot be added to a value object");
                }
                auto property = jsonld_context::expand_iri(*active, index_key, false, true);
                if (property) {
                    Value values = Value::array();
                    values.push_back(expand_value(*active, index_key, Value(index)));
                    if (auto existing = item.find(*property); existing != item.end()) {
                        for (auto& v : jsonld_core::as_array(std::move(*existing))) {
                            values.push_back(std::move(v));
                        }
                    }
                    item[*property] = std::move(values);
                }
            } else if (container.has(Container::Index) && !item.contains("@index") && !none) {
                item["@index"] = index;
            } else if (container.has(Container::Id) && !item.contains("@id") && !none) {
                // A key that expands to nothing, such as a keyword-like one, leaves the node without @id
                if (auto id = jsonld_context::expand_iri(*active, index, true, false)) {
                    item["@id"] = relabel(*id);
                } else {
                    note_ignored(index, "@id map key");
                }
            } else if (container.has(Container::Type) && !none && expanded_index) {
                Value types = Value::array();
                types.push_back(*expanded_index);
                if (auto existing = item.find("@type"); existing != item.end()) {
                    for (auto& t : jsonld_core::as_array(std::move(*existing))) {
                        types.push_back(std::move(t));
                    }
                }
                item["@type"] = std::move(types);
            }

            result.push_back(std::move(item));
        }
    }
    return Ok(std::move(result));
}

// =============================================================================
// Expansion API
// =============================================================================

Result<Value> expand(
    const Value& document,
    const ContextPtr& active,
    const std::optional<std::string>& base_url,
    jsonld_context::DocumentLoader& loader,
    const ExpansionOptions& options) {

    Expander expander(loader, options);
    return expander.expand(active, document, base_url);
}

} // namespace jsonld_expansion
