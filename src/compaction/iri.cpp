/// @file iri.cpp
/// @brief IRI compaction and term selection

#include <jsonld_engine/compaction/iri.hpp>
#include <jsonld_engine/core/log.hpp>
#include <jsonld_engine/syntax/iri.hpp>
#include <jsonld_engine/syntax/object.hpp>

#include <algorithm>
#include <vector>

namespace jsonld_compaction {

using jsonld_core::Err;
using jsonld_core::ErrorCode;
using jsonld_core::Ok;
using jsonld_core::Result;
using jsonld_core::Value;

namespace {

std::string language_direction(const Value& value) {
    std::string result;
    if (auto lang = value.find("@language"); lang != value.end() && lang->is_string()) {
        result = jsonld_syntax::lowercase(lang->get<std::string>());
    }
    return result + "_" + value["@direction"].get<std::string>();
}

std::string default_language_key(const jsonld_context::ActiveContext& active) {
    const auto& language = active.default_language();
    if (active.default_direction()) {
        return (language ? jsonld_syntax::lowercase(*language) : std::string())
            + "_" + jsonld_syntax::direction_name(*active.default_direction());
    }
    return language ? jsonld_syntax::lowercase(*language) : std::string("@none");
}

/// Language and type shared by every item of a list ("@none" when mixed)
std::pair<std::string, std::string> list_commonality(const Value& list, const std::string& default_language) {
    std::optional<std::string> common_language;
    std::optional<std::string> common_type;

    if (list.empty()) {
        common_language = default_language;
    }

    for (const auto& item : list) {
        std::string item_language = "@none";
        std::string item_type = "@none";
        const bool is_value = item.contains("@value");

        if (is_value) {
            if (item.contains("@direction")) {
                item_language = language_direction(item);
            } else if (auto lang = item.find("@language"); lang != item.end()) {
                item_language = jsonld_syntax::lowercase(lang->get<std::string>());
            } else if (auto type = item.find("@type"); type != item.end()) {
                item_type = type->get<std::string>();
            } else {
                item_language = "@null";
            }
        } else {
            item_type = "@id";
        }

        if (!common_language) {
            common_language = item_language;
        } else if (*common_language != item_language && is_value) {
            common_language = "@none";
        }

        if (!common_type) {
            common_type = item_type;
        } else if (*common_type != item_type) {
            common_type = "@none";
        }

        if (*common_language == "@none" && *common_type == "@none") {
            break;
        }
    }

    return {common_language.value_or("@none"), common_type.value_or("@none")};
}

} // anonymous namespace

// =============================================================================
// Term Selection
// =============================================================================

std::optional<std::string> select_term(
    const jsonld_context::ActiveContext& active,
    const std::string& iri,
    const Value& value,
    bool reverse,
    jsonld_syntax::ProcessingMode mode) {

    const jsonld_context::InverseContext& inverse = active.inverse();
    if (!inverse.contains(iri)) {
        return std::nullopt;
    }

    std::vector<std::string> containers;
    std::string type_language = "@language";
    std::string type_language_value = "@null";

    const bool is_map = value.is_object();
    const bool has_index = is_map && value.contains("@index");

    if (has_index && !jsonld_syntax::is_graph_object(value)) {
        containers.insert(containers.end(), {"@index", "@index@set"});
    }

    if (reverse) {
        type_language = "@type";
        type_language_value = "@reverse";
        containers.emplace_back("@set");
    } else if (jsonld_syntax::is_list_object(value)) {
        if (!has_index) {
            containers.emplace_back("@list");
        }
        auto [common_language, common_type] = list_commonality(value["@list"], default_language_key(active));
        if (common_type != "@none") {
            type_language = "@type";
            type_language_value = common_type;
        } else {
            type_language_value = common_language;
        }
    } else if (jsonld_syntax::is_graph_object(value)) {
        if (has_index) {
            containers.insert(containers.end(), {"@graph@index", "@graph@index@set"});
        }
        if (value.contains("@id")) {
            containers.insert(containers.end(), {"@graph@id", "@graph@id@set"});
        }
        containers.insert(containers.end(), {"@graph", "@graph@set", "@set"});
        if (!has_index) {
            containers.insert(containers.end(), {"@graph@index", "@graph@index@set"});
        }
        if (!value.contains("@id")) {
            containers.insert(containers.end(), {"@graph@id", "@graph@id@set"});
        }
        containers.insert(containers.end(), {"@index", "@index@set"});
        type_language = "@type";
        type_language_value = "@id";
    } else {
        if (jsonld_syntax::is_value_object(value)) {
            if (value.contains("@direction") && !has_index) {
                type_language_value = language_direction(value);
                containers.insert(containers.end(), {"@language", "@language@set"});
            } else if (value.contains("@language") && !has_index) {
                type_language_value = jsonld_syntax::lowercase(value["@language"].get<std::string>());
                containers.insert(containers.end(), {"@language", "@language@set"});
            } else if (value.contains("@type")) {
                type_language = "@type";
                type_language_value = value["@type"].get<std::string>();
            }
        } else {
            type_language = "@type";
            type_language_value = "@id";
            containers.insert(containers.end(), {"@id", "@id@set", "@type", "@set@type"});
        }
        containers.emplace_back("@set");
    }

    containers.emplace_back("@none");

    if (mode != jsonld_syntax::ProcessingMode::JsonLd10) {
        if (!has_index) {
            containers.insert(containers.end(), {"@index", "@index@set"});
        }
        if (jsonld_syntax::is_value_object(value) && value.size() == 1) {
            containers.insert(containers.end(), {"@language", "@language@set"});
        }
    }

    std::vector<std::string> preferred;
    if (type_language_value == "@reverse") {
        preferred.emplace_back("@reverse");
    }

    if ((type_language_value == "@id" || type_language_value == "@reverse") && is_map && value.contains("@id")
        && value["@id"].is_string()) {
        const std::string& id = value["@id"].get_ref<const std::string&>();
        auto term = select_term(active, id, Value(), false, mode);
        const jsonld_context::TermDefinition* def = term ? active.find(*term) : nullptr;
        if (def && def->iri == id) {
            preferred.insert(preferred.end(), {"@vocab", "@id", "@none"});
        } else {
            preferred.insert(preferred.end(), {"@id", "@vocab", "@none"});
        }
    } else {
        preferred.push_back(type_language_value);
        preferred.emplace_back("@none");
        if (jsonld_syntax::is_list_object(value) && value["@list"].empty()) {
            type_language = "@any";
        }
    }
    preferred.emplace_back("@any");

    // Direction-only fallbacks for language-and-direction preferences
    const std::size_t count = preferred.size();
    for (std::size_t i = 0; i < count; ++i) {
        std::size_t underscore = preferred[i].find('_');
        if (underscore != std::string::npos) {
            preferred.push_back(preferred[i].substr(underscore));
        }
    }

    const std::string* term = inverse.select_term(iri, containers, type_language, preferred);
    if (!term) {
        return std::nullopt;
    }
    return *term;
}

// =============================================================================
// IRI Compaction
// =============================================================================

Result<std::string> compact_iri(
    const jsonld_context::ActiveContext& active,
    const std::string& iri,
    const Value& value,
    bool vocab,
    bool reverse,
    const CompactionOptions& options) {

    if (vocab) {
        if (auto term = select_term(active, iri, value, reverse, options.processing_mode)) {
            return Ok(std::move(*term));
        }

        const auto& vocab_mapping = active.vocab();
        if (vocab_mapping && iri.size() > vocab_mapping->size() && iri.compare(0, vocab_mapping->size(), *vocab_mapping) == 0) {
            std::string suffix = iri.substr(vocab_mapping->size());
            if (!active.find(suffix)) {
                return Ok(std::move(suffix));
            }
        }
    }

    // Shortest, then least, compact IRI over all prefix terms
    std::optional<std::string> compact;
    for (const auto& [name, term] : active.terms()) {
        if (!term || !term->iri || !term->prefix || *term->iri == iri
            || iri.compare(0, term->iri->size(), *term->iri) != 0) {
            continue;
        }

        std::string candidate = name + ":" + iri.substr(term->iri->size());
        const bool shorter = !compact || candidate.size() < compact->size()
            || (candidate.size() == compact->size() && candidate < *compact);
        if (!shorter) {
            continue;
        }

        const jsonld_context::TermDefinition* existing = active.find(candidate);
        if (!existing || (value.is_null() && existing->iri == iri)) {
            compact = std::move(candidate);
        }
    }

    if (compact) {
        return Ok(std::move(*compact));
    }

    if (auto split = jsonld_syntax::compact_iri_split(iri)) {
        const jsonld_context::TermDefinition* prefix = active.find(split->first);
        if (prefix && prefix->prefix && split->second.rfind("//", 0) != 0) {
            jsonld_core::compaction_logger()->debug("IRI '{}' would be read back through prefix '{}'", iri, split->first);
            return Err<std::string>(ErrorCode::IriConfusedWithPrefix,
                "IRI '" + iri + "' is confused with the prefix '" + split->first + "'");
        }
    }

    if (!vocab && options.compact_to_relative && active.base_iri()) {
        return Ok(jsonld_syntax::relativize_iri(*active.base_iri(), iri));
    }

    return Ok(std::string(iri));
}

std::string compact_keyword(
    const jsonld_context::ActiveContext& active,
    const std::string& keyword,
    jsonld_syntax::ProcessingMode mode) {

    return select_term(active, keyword, Value(), false, mode).value_or(keyword);
}

} // namespace jsonld_compaction
