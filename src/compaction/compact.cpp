/// @file compact.cpp
/// @brief Compaction engine

#include <jsonld_engine/compaction/compact.hpp>
#include <jsonld_engine/compaction/iri.hpp>
#include <jsonld_engine/compaction/value.hpp>
#include <jsonld_engine/context/processing.hpp>
#include <jsonld_engine/core/log.hpp>
#include <jsonld_engine/syntax/object.hpp>

#include <algorithm>
#include <vector>

namespace jsonld_compaction {

using jsonld_context::ContextPtr;
using jsonld_context::TermDefinition;
using jsonld_core::Err;
using jsonld_core::ErrorCode;
using jsonld_core::Ok;
using jsonld_core::Result;
using jsonld_core::Value;
using jsonld_syntax::Container;

namespace {

class DepthGuard {
public:
    explicit DepthGuard(std::size_t& depth) : m_depth(depth) { ++m_depth; }
    ~DepthGuard() { --m_depth; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    std::size_t& m_depth;
};

Value& map_object(Value& target, const std::string& property) {
    Value& map = target[property];
    if (!map.is_object()) {
        map = Value::object();
    }
    return map;
}

/// Take the first value of @p key out of a compacted item.
/// The remaining values stay; the entry is removed when none remain.
std::optional<std::string> take_first(Value& item, const std::string& key) {
    if (!item.is_object()) {
        return std::nullopt;
    }
    auto it = item.find(key);
    if (it == item.end()) {
        return std::nullopt;
    }

    Value values = jsonld_core::as_array(*it);
    if (values.empty() || !values[0].is_string()) {
        return std::nullopt;
    }

    std::string first = values[0].get<std::string>();
    if (values.size() == 1) {
        item.erase(key);
    } else if (values.size() == 2) {
        *it = values[1];
    } else {
        values.erase(values.begin());
        *it = std::move(values);
    }
    return first;
}

} // anonymous namespace

// =============================================================================
// Compactor
// =============================================================================

Compactor::Compactor(jsonld_context::DocumentLoader& loader, CompactionOptions options)
    : m_loader(loader)
    , m_options(options) {}

std::string Compactor::alias(const jsonld_context::ActiveContext& active, const std::string& keyword) const {
    return compact_keyword(active, keyword, m_options.processing_mode);
}

Result<ContextPtr> Compactor::apply_context(
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

    jsonld_core::compaction_logger()->trace("Applying {} context", propagate ? "scoped" : "type-scoped");
    return jsonld_context::process_context(active, local, base_url, m_loader, options);
}

Result<Value*> Compactor::nest_target(
    Value& result,
    const jsonld_context::ActiveContext& active,
    const std::string& property) {

    const TermDefinition* term = active.find(property);
    if (!term || !term->nest) {
        return Ok(&result);
    }

    const std::string& nest = *term->nest;
    if (nest != "@nest") {
        auto expanded = jsonld_context::expand_iri(active, nest, false, true);
        if (!expanded || *expanded != "@nest") {
            return Err<Value*>(ErrorCode::InvalidNestValue,
                "Nest value '" + nest + "' of term '" + property + "' is not @nest or an alias of it");
        }
    }

    return Ok(&map_object(result, nest));
}

Result<Value> Compactor::compact(const ContextPtr& active, const Value& expanded) {
    jsonld_core::LogScope scope("compact", jsonld_core::compaction_logger());

    auto compacted = compact_element(active, std::nullopt, expanded);
    if (!compacted) {
        return compacted;
    }

    Value result = std::move(*compacted);
    if (result.is_null() || (result.is_array() && result.empty())) {
        return Ok(Value::object());
    }
    if (result.is_array()) {
        Value wrapped = Value::object();
        wrapped[alias(*active, "@graph")] = std::move(result);
        return Ok(std::move(wrapped));
    }
    return Ok(std::move(result));
}

Result<Value> Compactor::compact_element(
    const ContextPtr& active,
    const ActiveProperty& active_property,
    const Value& element) {

    DepthGuard guard(m_depth);
    if (m_depth > m_options.max_depth) {
        return Err<Value>(ErrorCode::MaximumDepthExceeded,
            "Document nesting exceeds " + std::to_string(m_options.max_depth) + " levels");
    }

    if (!element.is_array() && !element.is_object()) {
        return Ok(Value(element));
    }

    const TermDefinition* property_term = active_property ? active->find(*active_property) : nullptr;

    if (element.is_array()) {
        Value result = Value::array();
        for (const auto& item : element) {
            auto compacted = compact_element(active, active_property, item);
            if (!compacted) {
                return compacted;
            }
            if (!compacted->is_null()) {
                result.push_back(std::move(*compacted));
            }
        }

        const bool keep_array = result.size() != 1 || !m_options.compact_arrays
            || (active_property && (*active_property == "@graph" || *active_property == "@set"))
            || (property_term && (property_term->container.has(Container::List) || property_term->container.has(Container::Set)));
        if (keep_array) {
            return Ok(std::move(result));
        }
        Value single = std::move(result[0]);
        return Ok(std::move(single));
    }

    // Maps
    const ContextPtr type_scoped = active;
    ContextPtr current = active;

    const bool reference = element.contains("@id")
        && (element.size() == 1 || (element.size() == 2 && element.contains("@index")));
    const bool value_like = element.contains("@value") || reference;

    // Only value objects and bare {"@id": ...} maps keep a non-propagated context
    const bool keeps_context = element.contains("@value") || (element.size() == 1 && element.contains("@id"));
    if (current->previous_context() && !keeps_context) {
        current = current->previous_context();
    }

    if (property_term && property_term->context) {
        auto scoped = apply_context(current, *property_term->context, property_term->base_url, true, true);
        if (!scoped) {
            return Err<Value>(std::move(scoped.error()));
        }
        current = std::move(*scoped);
    }

    // Shared ownership; current is replaced by type-scoped contexts below
    const jsonld_context::TermPtr term = active_property ? current->get(*active_property) : nullptr;

    if (value_like) {
        auto compacted = compact_value(*current, active_property, element, m_options);
        if (!compacted) {
            return compacted;
        }
        const bool json = term && term->type_mapping && *term->type_mapping == "@json";
        if (jsonld_core::is_scalar(*compacted) || json) {
            return compacted;
        }
    }

    if (jsonld_syntax::is_list_object(element) && term && term->container.has(Container::List)) {
        return compact_element(current, active_property, element["@list"]);
    }

    const bool inside_reverse = active_property && *active_property == "@reverse";
    Value result = Value::object();

    // Type-scoped contexts apply to the node's own properties
    if (auto types = element.find("@type"); types != element.end() && !element.contains("@value")) {
        std::vector<std::string> compacted_types;
        for (const auto& type : jsonld_core::as_array(*types)) {
            if (!type.is_string()) {
                continue;
            }
            auto compacted = compact_iri(*current, type.get<std::string>(), true, m_options);
            if (!compacted) {
                return Err<Value>(std::move(compacted.error()));
            }
            compacted_types.push_back(std::move(*compacted));
        }
        std::sort(compacted_types.begin(), compacted_types.end());

        for (const auto& type_term : compacted_types) {
            const TermDefinition* def = type_scoped->find(type_term);
            if (def && def->context) {
                auto scoped = apply_context(current, *def->context, def->base_url, false, false);
                if (!scoped) {
                    return Err<Value>(std::move(scoped.error()));
                }
                current = std::move(*scoped);
            }
        }
    }

    for (const auto& expanded_property : jsonld_core::object_keys(element, m_options.ordered)) {
        const Value& expanded_value = element.at(expanded_property);

        if (expanded_property == "@id") {
            if (!expanded_value.is_string()) {
                continue;
            }
            auto id = compact_iri(*current, expanded_value.get<std::string>(), false, m_options);
            if (!id) {
                return Err<Value>(std::move(id.error()));
            }
            result[alias(*current, "@id")] = std::move(*id);
            continue;
        }

        if (expanded_property == "@type") {
            Value compacted_value = Value::array();
            for (const auto& type : jsonld_core::as_array(expanded_value)) {
                if (!type.is_string()) {
                    continue;
                }
                auto compacted = compact_iri(*type_scoped, type.get<std::string>(), true, m_options);
                if (!compacted) {
                    return Err<Value>(std::move(compacted.error()));
                }
                compacted_value.push_back(std::move(*compacted));
            }
            if (compacted_value.size() == 1) {
                compacted_value = std::move(compacted_value[0]);
            }

            const std::string type_alias = alias(*current, "@type");
            const TermDefinition* alias_term = current->find(type_alias);
            const bool as_array = !m_options.compact_arrays
                || (m_options.processing_mode != jsonld_syntax::ProcessingMode::JsonLd10
                    && alias_term && alias_term->container.has(Container::Set));
            jsonld_core::add_value(result, type_alias, compacted_value, as_array);
            continue;
        }

        if (expanded_property == "@reverse") {
            auto compacted = compact_element(current, std::string("@reverse"), expanded_value);
            if (!compacted) {
                return compacted;
            }

            Value remaining = Value::object();
            for (auto it = compacted->begin(); it != compacted->end(); ++it) {
                const TermDefinition* def = current->find(it.key());
                if (def && def->reverse) {
                    const bool as_array = def->container.has(Container::Set) || !m_options.compact_arrays;
                    jsonld_core::add_value(result, it.key(), it.value(), as_array);
                } else {
                    remaining[it.key()] = it.value();
                }
            }

            if (!remaining.empty()) {
                result[alias(*current, "@reverse")] = std::move(remaining);
            }
            continue;
        }

        if (expanded_property == "@preserve") {
            continue;
        }

        if (expanded_property == "@index" && term && term->container.has(Container::Index)) {
            continue;
        }

        if (expanded_property == "@direction" || expanded_property == "@index"
            || expanded_property == "@language" || expanded_property == "@value") {
            result[alias(*current, expanded_property)] = expanded_value;
            continue;
        }

        if (expanded_value.is_array() && expanded_value.empty()) {
            auto property = compact_iri(*current, expanded_property, expanded_value, true, inside_reverse, m_options);
            if (!property) {
                return Err<Value>(std::move(property.error()));
            }
            auto target = nest_target(result, *current, *property);
            if (!target) {
                return Err<Value>(std::move(target.error()));
            }
            jsonld_core::add_value(**target, *property, Value::array(), true);
            continue;
        }

        for (const auto& item : jsonld_core::as_array(expanded_value)) {
            auto compacted = compact_item(result, current, expanded_property, item, inside_reverse);
            if (!compacted) {
                return Err<Value>(std::move(compacted.error()));
            }
        }
    }

    return Ok(std::move(result));
}

// =============================================================================
// Property Values
// =============================================================================

Result<void> Compactor::compact_item(
    Value& result,
    const ContextPtr& active,
    const std::string& expanded_property,
    const Value& expanded_item,
    bool inside_reverse) {

    auto property_result = compact_iri(*active, expanded_property, expanded_item, true, inside_reverse, m_options);
    if (!property_result) {
        return Err(std::move(property_result.error()));
    }
    const std::string property = std::move(*property_result);

    auto target_result = nest_target(result, *active, property);
    if (!target_result) {
        return Err(std::move(target_result.error()));
    }
    Value& target = **target_result;

    const TermDefinition* term = active->find(property);
    const Container container = term ? term->container : Container{};
    const bool as_array = container.has(Container::Set) || property == "@graph" || property == "@list"
        || !m_options.compact_arrays;

    const bool list = jsonld_syntax::is_list_object(expanded_item);
    const bool graph = jsonld_syntax::is_graph_object(expanded_item);
    const Value& inner = list ? expanded_item["@list"] : graph ? expanded_item["@graph"] : expanded_item;

    auto compacted_result = compact_element(active, property, inner);
    if (!compacted_result) {
        return Err(std::move(compacted_result.error()));
    }
    Value compacted = std::move(*compacted_result);

    if (list) {
        compacted = jsonld_core::as_array(std::move(compacted));
        if (container.has(Container::List)) {
            target[property] = std::move(compacted);
            return Ok();
        }

        Value wrapped = Value::object();
        wrapped[alias(*active, "@list")] = std::move(compacted);
        if (auto index = expanded_item.find("@index"); index != expanded_item.end()) {
            wrapped[alias(*active, "@index")] = *index;
        }
        jsonld_core::add_value(target, property, wrapped, as_array);
        return Ok();
    }

    if (graph) {
        if (container.has(Container::Graph) && container.has(Container::Id)) {
            std::string key;
            if (auto id = expanded_item.find("@id"); id != expanded_item.end() && id->is_string()) {
                auto compacted_id = compact_iri(*active, id->get<std::string>(), false, m_options);
                if (!compacted_id) {
                    return Err(std::move(compacted_id.error()));
                }
                key = std::move(*compacted_id);
            } else {
                key = alias(*active, "@none");
            }
            jsonld_core::add_value(map_object(target, property), key, compacted, as_array);
        } else if (container.has(Container::Graph) && container.has(Container::Index)
                   && jsonld_syntax::is_simple_graph_object(expanded_item)) {
            std::string key = expanded_item.contains("@index")
                ? expanded_item["@index"].get<std::string>()
                : alias(*active, "@none");
            jsonld_core::add_value(map_object(target, property), key, compacted, as_array);
        } else if (container.has(Container::Graph) && jsonld_syntax::is_simple_graph_object(expanded_item)) {
            // Several nodes in one simple graph would read back as several graphs
            if (compacted.is_array() && compacted.size() > 1) {
                Value included = Value::object();
                included[alias(*active, "@included")] = std::move(compacted);
                compacted = std::move(included);
            }
            jsonld_core::add_value(target, property, compacted, as_array);
        } else {
            Value wrapped = Value::object();
            wrapped[alias(*active, "@graph")] = std::move(compacted);
            if (auto id = expanded_item.find("@id"); id != expanded_item.end() && id->is_string()) {
                auto compacted_id = compact_iri(*active, id->get<std::string>(), false, m_options);
                if (!compacted_id) {
                    return Err(std::move(compacted_id.error()));
                }
                wrapped[alias(*active, "@id")] = std::move(*compacted_id);
            }
            if (auto index = expanded_item.find("@index"); index != expanded_item.end()) {
                wrapped[alias(*active, "@index")] = *index;
            }
            jsonld_core::add_value(target, property, wrapped, as_array);
        }
        return Ok();
    }

    const bool map_container = !container.has(Container::Graph)
        && (container.has(Container::Language) || container.has(Container::Index)
            || container.has(Container::Id) || container.has(Container::Type));
    if (!map_container) {
        jsonld_core::add_value(target, property, compacted, as_array);
        return Ok();
    }

    std::optional<std::string> map_key;

    if (container.has(Container::Language)) {
        if (auto value = expanded_item.find("@value"); value != expanded_item.end()) {
            compacted = *value;
        }
        if (auto language = expanded_item.find("@language"); language != expanded_item.end()) {
            map_key = language->get<std::string>();
        }
    } else if (container.has(Container::Index)) {
        const std::string index_key = term->index.value_or("@index");
        if (index_key == "@index") {
            if (auto index = expanded_item.find("@index"); index != expanded_item.end() && index->is_string()) {
                map_key = index->get<std::string>();
            }
        } else {
            auto index_iri = jsonld_context::expand_iri(*active, index_key, false, true);
            auto container_key = compact_iri(*active, index_iri.value_or(index_key), true, m_options);
            if (!container_key) {
                return Err(std::move(container_key.error()));
            }
            map_key = take_first(compacted, *container_key);
        }
    } else if (container.has(Container::Id)) {
        const std::string id_alias = alias(*active, "@id");
        if (compacted.is_object()) {
            if (auto id = compacted.find(id_alias); id != compacted.end() && id->is_string()) {
                map_key = id->get<std::string>();
                compacted.erase(id_alias);
            }
        }
    } else {
        const std::string type_alias = alias(*active, "@type");
        map_key = take_first(compacted, type_alias);

        // A node left with nothing but its @id compacts like a reference
        if (compacted.is_object() && compacted.size() == 1 && expanded_item.contains("@id")) {
            auto only = jsonld_context::expand_iri(*active, compacted.begin().key(), false, true);
            if (only && *only == "@id") {
                Value reference = Value::object();
                reference["@id"] = expanded_item["@id"];
                auto collapsed = compact_element(active, property, reference);
                if (!collapsed) {
                    return Err(std::move(collapsed.error()));
                }
                compacted = std::move(*collapsed);
            }
        }
    }

    if (!map_key) {
        map_key = alias(*active, "@none");
    }

    jsonld_core::add_value(map_object(target, property), *map_key, compacted, as_array);
    return Ok();
}

// =============================================================================
// Compaction API
// =============================================================================

Result<Value> compact(
    const Value& expanded,
    const ContextPtr& active,
    jsonld_context::DocumentLoader& loader,
    const CompactionOptions& options) {

    Compactor compactor(loader, options);
    return compactor.compact(active, expanded);
}

} // namespace jsonld_compaction
