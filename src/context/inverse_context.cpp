/// @file inverse_context.cpp
/// @brief Inverse context creation and term selection

#include <jsonld_engine/context/inverse_context.hpp>
#include <jsonld_engine/context/active_context.hpp>
#include <jsonld_engine/syntax/iri.hpp>

#include <algorithm>

namespace jsonld_context {

namespace {

std::string direction_suffix(jsonld_syntax::Direction dir) {
    return std::string("_") + jsonld_syntax::direction_name(dir);
}

} // anonymous namespace

InverseContext InverseContext::build(const ContextData& data) {
    InverseContext result;

    const std::string default_language = data.default_language
        ? jsonld_syntax::lowercase(*data.default_language)
        : std::string("@none");

    std::vector<const std::string*> names;
    names.reserve(data.terms.size());
    for (const auto& [name, term] : data.terms) {
        names.push_back(&name);
    }
    std::sort(names.begin(), names.end(), [](const std::string* a, const std::string* b) {
        if (a->size() != b->size()) {
            return a->size() < b->size();
        }
        return *a < *b;
    });

    for (const std::string* name : names) {
        const TermDefinition* def = data.find(*name);
        if (!def || !def->iri) {
            continue;
        }

        const std::string container = def->container.key();
        auto& container_map = result.m_entries[*def->iri];

        auto [slot, inserted] = container_map.try_emplace(container);
        InverseEntry& entry = slot->second;
        if (inserted) {
            entry.any.emplace("@none", *name);
        }

        if (def->reverse) {
            entry.type.emplace("@reverse", *name);
        } else if (def->type_mapping && *def->type_mapping == "@none") {
            entry.language.emplace("@any", *name);
            entry.type.emplace("@any", *name);
        } else if (def->type_mapping) {
            entry.type.emplace(*def->type_mapping, *name);
        } else if (def->language && def->direction) {
            const auto& lang = *def->language;
            const auto& dir = *def->direction;
            std::string lang_dir;
            if (lang && dir) {
                lang_dir = jsonld_syntax::lowercase(*lang) + direction_suffix(*dir);
            } else if (lang) {
                lang_dir = jsonld_syntax::lowercase(*lang);
            } else if (dir) {
                lang_dir = direction_suffix(*dir);
            } else {
                lang_dir = "@null";
            }
            entry.language.emplace(lang_dir, *name);
        } else if (def->language) {
            const auto& lang = *def->language;
            entry.language.emplace(lang ? jsonld_syntax::lowercase(*lang) : std::string("@null"), *name);
        } else if (def->direction) {
            const auto& dir = *def->direction;
            entry.language.emplace(dir ? direction_suffix(*dir) : std::string("@none"), *name);
        } else if (data.default_direction) {
            std::string lang_dir = (data.default_language ? jsonld_syntax::lowercase(*data.default_language) : std::string())
                + direction_suffix(*data.default_direction);
            entry.language.emplace(lang_dir, *name);
            entry.language.emplace("@none", *name);
            entry.type.emplace("@none", *name);
        } else {
            entry.language.emplace(default_language, *name);
            entry.language.emplace("@none", *name);
            entry.type.emplace("@none", *name);
        }
    }

    return result;
}

const std::string* InverseContext::select_term(
    const std::string& iri,
    const std::vector<std::string>& containers,
    const std::string& type_language,
    const std::vector<std::string>& preferred) const {

    auto iri_it = m_entries.find(iri);
    if (iri_it == m_entries.end()) {
        return nullptr;
    }

    for (const auto& container : containers) {
        auto container_it = iri_it->second.find(container);
        if (container_it == iri_it->second.end()) {
            continue;
        }

        const InverseEntry& entry = container_it->second;
        const auto& map = type_language == "@language" ? entry.language
                        : type_language == "@type" ? entry.type
                        : entry.any;

        for (const auto& item : preferred) {
            auto term_it = map.find(item);
            if (term_it != map.end()) {
                return &term_it->second;
            }
        }
    }

    return nullptr;
}

} // namespace jsonld_context
