/// @file container.cpp
/// @brief Container mapping parsing, direction and processing mode names

#include <jsonld_engine/syntax/container.hpp>
#include <jsonld_engine/syntax/mode.hpp>

#include <array>

namespace jsonld_syntax {

// =============================================================================
// Processing Mode
// =============================================================================

const char* processing_mode_name(ProcessingMode mode) noexcept {
    switch (mode) {
        case ProcessingMode::JsonLd10: return "json-ld-1.0";
        case ProcessingMode::JsonLd11: return "json-ld-1.1";
        default: return "unknown";
    }
}

std::optional<ProcessingMode> processing_mode_from_string(const std::string& name) noexcept {
    if (name == "json-ld-1.0") return ProcessingMode::JsonLd10;
    if (name == "json-ld-1.1") return ProcessingMode::JsonLd11;
    return std::nullopt;
}

// =============================================================================
// Direction
// =============================================================================

const char* direction_name(Direction dir) noexcept {
    switch (dir) {
        case Direction::Ltr: return "ltr";
        case Direction::Rtl: return "rtl";
        default: return "ltr";
    }
}

std::optional<Direction> direction_from_string(const std::string& str) noexcept {
    if (str == "ltr") return Direction::Ltr;
    if (str == "rtl") return Direction::Rtl;
    return std::nullopt;
}

// =============================================================================
// Container
// =============================================================================

namespace {

struct FlagName {
    Container::Flag flag;
    const char* name;
};

// Lexicographic order of the spellings
constexpr std::array<FlagName, 7> k_flags = {{
    {Container::Graph, "@graph"},
    {Container::Id, "@id"},
    {Container::Index, "@index"},
    {Container::Language, "@language"},
    {Container::List, "@list"},
    {Container::Set, "@set"},
    {Container::Type, "@type"},
}};

std::optional<Container::Flag> flag_from_string(const std::string& str) {
    for (const auto& entry : k_flags) {
        if (str == entry.name) {
            return entry.flag;
        }
    }
    return std::nullopt;
}

jsonld_core::Error invalid_container(const jsonld_core::Value& value) {
    return jsonld_core::Error(jsonld_core::ErrorCode::InvalidContainerMapping,
        "Invalid container mapping: " + value.dump());
}

/// Check a multi-keyword combination
bool is_valid_combination(Container c) {
    using C = Container;
    const std::uint8_t bits = c.bits();
    const std::uint8_t without_set = static_cast<std::uint8_t>(bits & ~C::Set);

    if (c.has(C::Graph)) {
        // @graph, optionally with exactly one of @id / @index, optionally @set
        std::uint8_t rest = static_cast<std::uint8_t>(without_set & ~C::Graph);
        return rest == 0 || rest == C::Id || rest == C::Index;
    }

    if (c.has(C::Set)) {
        // @set alone or with exactly one of @index/@id/@type/@language
        return without_set == 0 || without_set == C::Index || without_set == C::Id
            || without_set == C::Type || without_set == C::Language;
    }

    // Without @graph or @set only a single keyword is valid
    return (bits & (bits - 1)) == 0;
}

} // anonymous namespace

jsonld_core::Result<Container> Container::from_value(
    const jsonld_core::Value& value, ProcessingMode mode) {

    if (value.is_null()) {
        return jsonld_core::Ok(Container{});
    }

    Container result;

    if (value.is_string()) {
        auto flag = flag_from_string(value.get<std::string>());
        if (!flag) {
            return jsonld_core::Err<Container>(invalid_container(value));
        }
        if (mode == ProcessingMode::JsonLd10
            && (*flag == Graph || *flag == Id || *flag == Type)) {
            return jsonld_core::Err<Container>(invalid_container(value));
        }
        result.add(*flag);
        return jsonld_core::Ok(result);
    }

    if (!value.is_array() || mode == ProcessingMode::JsonLd10) {
        return jsonld_core::Err<Container>(invalid_container(value));
    }

    for (const auto& item : value) {
        if (!item.is_string()) {
            return jsonld_core::Err<Container>(invalid_container(value));
        }
        auto flag = flag_from_string(item.get<std::string>());
        if (!flag || result.has(*flag)) {
            return jsonld_core::Err<Container>(invalid_container(value));
        }
        result.add(*flag);
    }

    if (!is_valid_combination(result)) {
        return jsonld_core::Err<Container>(invalid_container(value));
    }

    return jsonld_core::Ok(result);
}

std::string Container::key() const {
    if (empty()) {
        return "@none";
    }
    std::string key;
    for (const auto& entry : k_flags) {
        if (has(entry.flag)) {
            key += entry.name;
        }
    }
    return key;
}

jsonld_core::Value Container::to_value() const {
    jsonld_core::Value result = jsonld_core::Value::array();
    for (const auto& entry : k_flags) {
        if (has(entry.flag)) {
            result.push_back(entry.name);
        }
    }
    return result;
}

} // namespace jsonld_syntax
