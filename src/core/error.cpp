/// @file error.cpp
/// @brief Error handling implementation for jsonld_core
///
/// The Result type is header-only. This file provides:
/// - The canonical code name table (both directions)
/// - Error formatting utilities
/// - Explicit template instantiations for common Result types

#include <jsonld_engine/core/error.hpp>
#include <array>
#include <sstream>
#include <unordered_map>

namespace jsonld_core {

// =============================================================================
// Code Names
// =============================================================================

namespace {

struct CodeName {
    ErrorCode code;
    const char* name;
};

constexpr std::array<CodeName, 53> k_code_names = {{
    {ErrorCode::CollidingKeywords, "colliding keywords"},
    {ErrorCode::ConflictingIndexes, "conflicting indexes"},
    {ErrorCode::ContextOverflow, "context overflow"},
    {ErrorCode::CyclicIriMapping, "cyclic IRI mapping"},
    {ErrorCode::InvalidIdValue, "invalid @id value"},
    {ErrorCode::InvalidImportValue, "invalid @import value"},
    {ErrorCode::InvalidIncludedValue, "invalid @included value"},
    {ErrorCode::InvalidIndexValue, "invalid @index value"},
    {ErrorCode::InvalidNestValue, "invalid @nest value"},
    {ErrorCode::InvalidPrefixValue, "invalid @prefix value"},
    {ErrorCode::InvalidPropagateValue, "invalid @propagate value"},
    {ErrorCode::InvalidProtectedValue, "invalid @protected value"},
    {ErrorCode::InvalidReverseValue, "invalid @reverse value"},
    {ErrorCode::InvalidVersionValue, "invalid @version value"},
    {ErrorCode::InvalidBaseDirection, "invalid base direction"},
    {ErrorCode::InvalidBaseIri, "invalid base IRI"},
    {ErrorCode::InvalidContainerMapping, "invalid container mapping"},
    {ErrorCode::InvalidContextEntry, "invalid context entry"},
    {ErrorCode::InvalidContextIri, "invalid context IRI"},
    {ErrorCode::InvalidContextNullification, "invalid context nullification"},
    {ErrorCode::InvalidDefaultLanguage, "invalid default language"},
    {ErrorCode::InvalidIriMapping, "invalid IRI mapping"},
    {ErrorCode::InvalidJsonLiteral, "invalid JSON literal"},
    {ErrorCode::InvalidKeywordAlias, "invalid keyword alias"},
    {ErrorCode::InvalidLanguageMapValue, "invalid language map value"},
    {ErrorCode::InvalidLanguageMapping, "invalid language mapping"},
    {ErrorCode::InvalidLanguageTaggedString, "invalid language-tagged string"},
    {ErrorCode::InvalidLanguageTaggedValue, "invalid language-tagged value"},
    {ErrorCode::InvalidLocalContext, "invalid local context"},
    {ErrorCode::InvalidRemoteContext, "invalid remote context"},
    {ErrorCode::InvalidReverseProperty, "invalid reverse property"},
    {ErrorCode::InvalidReversePropertyMap, "invalid reverse property map"},
    {ErrorCode::InvalidReversePropertyValue, "invalid reverse property value"},
    {ErrorCode::InvalidScopedContext, "invalid scoped context"},
    {ErrorCode::InvalidSetOrListObject, "invalid set or list object"},
    {ErrorCode::InvalidTermDefinition, "invalid term definition"},
    {ErrorCode::InvalidTypeMapping, "invalid type mapping"},
    {ErrorCode::InvalidTypeValue, "invalid type value"},
    {ErrorCode::InvalidTypedValue, "invalid typed value"},
    {ErrorCode::InvalidValueObject, "invalid value object"},
    {ErrorCode::InvalidValueObjectValue, "invalid value object value"},
    {ErrorCode::InvalidVocabMapping, "invalid vocab mapping"},
    {ErrorCode::IriConfusedWithPrefix, "IRI confused with prefix"},
    {ErrorCode::KeywordRedefinition, "keyword redefinition"},
    {ErrorCode::ListOfLists, "list of lists"},
    {ErrorCode::LoadingDocumentFailed, "loading document failed"},
    {ErrorCode::LoadingRemoteContextFailed, "loading remote context failed"},
    {ErrorCode::ProcessingModeConflict, "processing mode conflict"},
    {ErrorCode::ProtectedTermRedefinition, "protected term redefinition"},
    {ErrorCode::RecursiveContextInclusion, "recursive context inclusion"},
    {ErrorCode::KeyExpansionFailed, "key expansion failed"},
    {ErrorCode::MaximumDepthExceeded, "maximum depth exceeded"},
    {ErrorCode::InvalidArgument, "invalid argument"},
}};

} // anonymous namespace

const char* error_code_name(ErrorCode code) noexcept {
    for (const auto& entry : k_code_names) {
        if (entry.code == code) {
            return entry.name;
        }
    }
    return "unknown";
}

std::optional<ErrorCode> error_code_from_name(const std::string& name) {
    static const std::unordered_map<std::string, ErrorCode> by_name = [] {
        std::unordered_map<std::string, ErrorCode> map;
        for (const auto& entry : k_code_names) {
            map.emplace(entry.name, entry.code);
        }
        return map;
    }();

    auto it = by_name.find(name);
    if (it == by_name.end()) {
        return std::nullopt;
    }
    return it->second;
}

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

/// Format loader error with full context
std::string format_loader_error(const LoaderError& err) {
    std::ostringstream oss;
    oss << "[LoaderError] " << err.message;
    switch (err.kind) {
        case LoaderError::Kind::NotFound: oss << " (not found)"; break;
        case LoaderError::Kind::LoadingFailed: oss << " (loading failed)"; break;
    }
    return oss.str();
}

} // namespace detail

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, LoaderError>) {
            oss << detail::format_loader_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " (" << key << ": " << value << ")";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::string, Error>;

} // namespace jsonld_core
