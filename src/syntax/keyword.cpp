/// @file keyword.cpp
/// @brief Keyword table

#include <jsonld_engine/syntax/keyword.hpp>

#include <array>
#include <cctype>

namespace jsonld_syntax {

namespace {

struct KeywordEntry {
    Keyword keyword;
    std::string_view name;
};

// Sorted by spelling for binary search
constexpr std::array<KeywordEntry, 25> k_keywords = {{
    {Keyword::Any, "@any"},
    {Keyword::Base, "@base"},
    {Keyword::Container, "@container"},
    {Keyword::Context, "@context"},
    {Keyword::Direction, "@direction"},
    {Keyword::Graph, "@graph"},
    {Keyword::Id, "@id"},
    {Keyword::Import, "@import"},
    {Keyword::Included, "@included"},
    {Keyword::Index, "@index"},
    {Keyword::Json, "@json"},
    {Keyword::Language, "@language"},
    {Keyword::List, "@list"},
    {Keyword::Nest, "@nest"},
    {Keyword::None, "@none"},
    {Keyword::Null, "@null"},
    {Keyword::Prefix, "@prefix"},
    {Keyword::Propagate, "@propagate"},
    {Keyword::Protected, "@protected"},
    {Keyword::Reverse, "@reverse"},
    {Keyword::Set, "@set"},
    {Keyword::Type, "@type"},
    {Keyword::Value, "@value"},
    {Keyword::Version, "@version"},
    {Keyword::Vocab, "@vocab"},
}};

} // anonymous namespace

const char* keyword_name(Keyword kw) noexcept {
    for (const auto& entry : k_keywords) {
        if (entry.keyword == kw) {
            return entry.name.data();
        }
    }
    return "@unknown";
}

std::optional<Keyword> keyword_from_string(std::string_view str) noexcept {
    if (str.size() < 2 || str[0] != '@') {
        return std::nullopt;
    }

    std::size_t lo = 0;
    std::size_t hi = k_keywords.size();
    while (lo < hi) {
        std::size_t mid = (lo + hi) / 2;
        int cmp = k_keywords[mid].name.compare(str);
        if (cmp == 0) {
            return k_keywords[mid].keyword;
        }
        if (cmp < 0) {
            lo = mid + 1;
        } else {
            hi = mid;
        }
    }
    return std::nullopt;
}

bool is_keyword(std::string_view str) noexcept {
    auto kw = keyword_from_string(str);
    return kw.has_value() && *kw != Keyword::Any && *kw != Keyword::Null;
}

bool looks_like_keyword(std::string_view str) noexcept {
    if (str.size() < 2 || str[0] != '@') {
        return false;
    }
    for (std::size_t i = 1; i < str.size(); ++i) {
        if (!std::isalpha(static_cast<unsigned char>(str[i]))) {
            return false;
        }
    }
    return true;
}

bool allowed_in_value_object(Keyword kw) noexcept {
    switch (kw) {
        case Keyword::Direction:
        case Keyword::Index:
        case Keyword::Language:
        case Keyword::Type:
        case Keyword::Value:
            return true;
        default:
            return false;
    }
}

bool allowed_in_term_definition(Keyword kw) noexcept {
    switch (kw) {
        case Keyword::Id:
        case Keyword::Reverse:
        case Keyword::Container:
        case Keyword::Context:
        case Keyword::Direction:
        case Keyword::Index:
        case Keyword::Language:
        case Keyword::Nest:
        case Keyword::Prefix:
        case Keyword::Protected:
        case Keyword::Type:
            return true;
        default:
            return false;
    }
}

bool is_context_global(Keyword kw) noexcept {
    switch (kw) {
        case Keyword::Base:
        case Keyword::Direction:
        case Keyword::Import:
        case Keyword::Language:
        case Keyword::Propagate:
        case Keyword::Protected:
        case Keyword::Version:
        case Keyword::Vocab:
            return true;
        default:
            return false;
    }
}

} // namespace jsonld_syntax
