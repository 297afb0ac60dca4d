/// @file processing.cpp
/// @brief Context processing, term definition creation and IRI expansion

#include <jsonld_engine/context/processing.hpp>
#include <jsonld_engine/core/log.hpp>
#include <jsonld_engine/syntax/container.hpp>
#include <jsonld_engine/syntax/iri.hpp>
#include <jsonld_engine/syntax/keyword.hpp>

#include <algorithm>
#include <map>
#include <vector>

namespace jsonld_context {

using jsonld_core::Err;
using jsonld_core::Error;
using jsonld_core::ErrorCode;
using jsonld_core::Ok;
using jsonld_core::Result;
using jsonld_core::Value;
using jsonld_core::WarningKind;
using jsonld_syntax::Container;
using jsonld_syntax::ProcessingMode;

namespace {

using ExpandedIri = std::optional<std::string>;

bool is_iri_or_blank(const std::string& value) {
    return jsonld_syntax::is_absolute_iri(value) || jsonld_syntax::is_blank_node_identifier(value);
}

Error term_error(ErrorCode code, const std::string& term, const std::string& detail) {
    Error err(code, detail + " (term '" + term + "')");
    err.with_context("term", term);
    return err;
}

std::optional<std::string> resolve_reference(const std::string& reference, const std::optional<std::string>& base_url) {
    if (base_url) {
        if (auto resolved = jsonld_syntax::resolve_iri(*base_url, reference)) {
            return resolved;
        }
    }
    if (jsonld_syntax::is_absolute_iri(reference)) {
        return reference;
    }
    return std::nullopt;
}

// =============================================================================
// Processor
// =============================================================================

/// Local context being applied: its entries and the definition state of
/// each term (false while being defined, true once defined)
struct LocalScope {
    const Value& local;
    std::map<std::string, bool> defined;
    const std::optional<std::string>& base_url;
    bool protected_default = false;
};

class Processor {
public:
    Processor(DocumentLoader& loader, const ContextProcessingOptions& options, std::vector<std::string>& stack,
              std::size_t depth = 0)
        : m_loader(loader)
        , m_options(options)
        , m_stack(stack)
        , m_depth(depth) {}

    Result<ContextPtr> process(const ContextPtr& active, const Value& local, const std::optional<std::string>& base_url);

private:
    [[nodiscard]] bool legacy() const noexcept {
        return m_options.processing_mode == ProcessingMode::JsonLd10;
    }

    Result<void> include_remote(ContextData& result, const std::string& reference, const std::optional<std::string>& base_url);
    Result<RemoteDocument> fetch_context_document(const std::string& iri);
    Result<void> process_map(ContextData& result, const Value& input, const std::optional<std::string>& base_url);

    Result<void> define_term(ContextData& active, LocalScope& scope, const std::string& term);
    Result<void> store_term(ContextData& active, LocalScope& scope, const std::string& term,
                            TermDefinition def, const TermPtr& previous);
    Result<ExpandedIri> expand_iri(ContextData& active, LocalScope& scope, const std::string& value,
                                   bool document_relative, bool vocab);

    DocumentLoader& m_loader;
    const ContextProcessingOptions& m_options;
    std::vector<std::string>& m_stack;
    std::size_t m_depth;
};

Result<ContextPtr> Processor::process(
    const ContextPtr& active, const Value& local, const std::optional<std::string>& base_url) {

    ContextData result = active->data();

    bool propagate = m_options.propagate;
    if (local.is_object()) {
        auto it = local.find("@propagate");
        if (it != local.end() && it->is_boolean()) {
            propagate = it->get<bool>();
        }
    }
    if (!propagate && !result.previous) {
        result.previous = active;
    }

    Value contexts = Value::array();
    if (local.is_array()) {
        contexts = local;
    } else {
        contexts.push_back(local);
    }

    for (const auto& context : contexts) {
        if (context.is_null()) {
            if (!m_options.override_protected && result.has_protected_terms()) {
                return Err<ContextPtr>(ErrorCode::InvalidContextNullification,
                    "Cannot nullify a context that defines protected terms");
            }
            ContextData fresh;
            fresh.original_base_url = active->original_base_url();
            fresh.base_iri = active->original_base_url();
            if (!propagate) {
                fresh.previous = result.previous;
            }
            result = std::move(fresh);
            continue;
        }

        if (context.is_string()) {
            auto included = include_remote(result, context.get<std::string>(), base_url);
            if (!included) {
                return Err<ContextPtr>(std::move(included.error()));
            }
            continue;
        }

        if (!context.is_object()) {
            return Err<ContextPtr>(ErrorCode::InvalidLocalContext,
                "Local context must be a map, a string or null, got: " + context.dump());
        }

        auto processed = process_map(result, context, base_url);
        if (!processed) {
            return Err<ContextPtr>(std::move(processed.error()));
        }
    }

    return Ok(ActiveContext::freeze(std::move(result)));
}

Result<void> Processor::include_remote(
    ContextData& result, const std::string& reference, const std::optional<std::string>& base_url) {

    auto iri = resolve_reference(reference, base_url);
    if (!iri) {
        Error err(ErrorCode::InvalidContextIri, "Cannot resolve context reference '" + reference + "'");
        err.with_context("iri", reference);
        return Err(std::move(err));
    }

    if (std::find(m_stack.begin(), m_stack.end(), *iri) != m_stack.end()) {
        if (!m_options.validate_scoped_context) {
            jsonld_core::context_logger()->trace("Skipping context '{}' already being processed", *iri);
            return Ok();
        }
        Error err(ErrorCode::RecursiveContextInclusion, "Context '" + *iri + "' includes itself");
        err.with_context("iri", *iri);
        return Err(std::move(err));
    }

    if (m_stack.size() >= m_options.max_remote_contexts) {
        Error err(ErrorCode::ContextOverflow,
            "More than " + std::to_string(m_options.max_remote_contexts) + " nested remote contexts");
        err.with_context("iri", *iri);
        return Err(std::move(err));
    }

    auto document = fetch_context_document(*iri);
    if (!document) {
        return Err(std::move(document.error()));
    }

    m_stack.push_back(*iri);
    auto processed = process(ActiveContext::freeze(result), document->document.at("@context"), document->document_url);
    m_stack.pop_back();

    if (!processed) {
        return Err(std::move(processed.error()));
    }

    result = (*processed)->data();
    return Ok();
}

Result<RemoteDocument> Processor::fetch_context_document(const std::string& iri) {
    jsonld_core::context_logger()->debug("Loading remote context '{}'", iri);

    auto loaded = m_loader.load(iri);
    if (!loaded) {
        Error err = loaded.error();
        err.with_code(ErrorCode::LoadingRemoteContextFailed).with_context("iri", iri);
        return Err<RemoteDocument>(std::move(err));
    }

    if (!loaded->document.is_object() || !loaded->document.contains("@context")) {
        Error err(ErrorCode::InvalidRemoteContext, "Remote document '" + iri + "' has no top-level @context");
        err.with_context("iri", iri);
        return Err<RemoteDocument>(std::move(err));
    }

    return loaded;
}

Result<void> Processor::process_map(
    ContextData& result, const Value& input, const std::optional<std::string>& base_url) {

    Value context = input;

    if (auto it = context.find("@version"); it != context.end()) {
        if (!it->is_number_float() || it->get<double>() != 1.1) {
            return Err(ErrorCode::InvalidVersionValue, "@version must be 1.1, got: " + it->dump());
        }
        if (legacy()) {
            return Err(ErrorCode::ProcessingModeConflict, "@version 1.1 used in json-ld-1.0 mode");
        }
    }

    if (auto it = context.find("@import"); it != context.end()) {
        if (legacy()) {
            return Err(ErrorCode::InvalidContextEntry, "@import is not supported in json-ld-1.0 mode");
        }
        if (!it->is_string()) {
            return Err(ErrorCode::InvalidImportValue, "@import must be a string, got: " + it->dump());
        }
        auto iri = resolve_reference(it->get<std::string>(), base_url);
        if (!iri) {
            return Err(ErrorCode::InvalidImportValue, "Cannot resolve @import '" + it->get<std::string>() + "'");
        }

        auto document = fetch_context_document(*iri);
        if (!document) {
            return Err(std::move(document.error()));
        }

        const Value& imported = document->document.at("@context");
        if (!imported.is_object()) {
            return Err(ErrorCode::InvalidRemoteContext, "Imported context '" + *iri + "' is not a map");
        }
        if (imported.contains("@import")) {
            return Err(ErrorCode::InvalidContextEntry, "Imported context '" + *iri + "' contains @import");
        }

        Value merged = imported;
        for (auto entry = context.begin(); entry != context.end(); ++entry) {
            merged[entry.key()] = entry.value();
        }
        context = std::move(merged);
    }

    if (auto it = context.find("@base"); it != context.end() && m_stack.empty()) {
        if (it->is_null()) {
            result.base_iri.reset();
        } else if (!it->is_string()) {
            return Err(ErrorCode::InvalidBaseIri, "@base must be a string or null, got: " + it->dump());
        } else {
            const std::string value = it->get<std::string>();
            if (jsonld_syntax::is_absolute_iri(value)) {
                result.base_iri = value;
            } else if (result.base_iri) {
                auto resolved = jsonld_syntax::resolve_iri(*result.base_iri, value);
                if (!resolved) {
                    return Err(ErrorCode::InvalidBaseIri, "Cannot resolve @base '" + value + "'");
                }
                result.base_iri = std::move(resolved);
            } else {
                return Err(ErrorCode::InvalidBaseIri, "Relative @base '" + value + "' without a base IRI");
            }
        }
    }

    if (auto it = context.find("@vocab"); it != context.end()) {
        if (it->is_null()) {
            result.vocab.reset();
        } else if (!it->is_string()) {
            return Err(ErrorCode::InvalidVocabMapping, "@vocab must be a string or null, got: " + it->dump());
        } else {
            const std::string value = it->get<std::string>();
            if (legacy() && !is_iri_or_blank(value)) {
                return Err(ErrorCode::InvalidVocabMapping, "Relative @vocab '" + value + "' in json-ld-1.0 mode");
            }
            auto expanded = jsonld_context::expand_iri(result, value, true, true);
            if (!expanded || !is_iri_or_blank(*expanded)) {
                return Err(ErrorCode::InvalidVocabMapping, "@vocab '" + value + "' is not an IRI or blank node");
            }
            result.vocab = std::move(expanded);
        }
    }

    if (auto it = context.find("@language"); it != context.end()) {
        if (it->is_null()) {
            result.default_language.reset();
        } else if (it->is_string()) {
            result.default_language = jsonld_syntax::lowercase(it->get<std::string>());
        } else {
            return Err(ErrorCode::InvalidDefaultLanguage, "@language must be a string or null, got: " + it->dump());
        }
    }

    if (auto it = context.find("@direction"); it != context.end()) {
        if (legacy()) {
            return Err(ErrorCode::InvalidContextEntry, "@direction is not supported in json-ld-1.0 mode");
        }
        if (it->is_null()) {
            result.default_direction.reset();
        } else {
            auto dir = it->is_string() ? jsonld_syntax::direction_from_string(it->get<std::string>()) : std::nullopt;
            if (!dir) {
                return Err(ErrorCode::InvalidBaseDirection, "@direction must be \"ltr\", \"rtl\" or null, got: " + it->dump());
            }
            result.default_direction = dir;
        }
    }

    if (auto it = context.find("@propagate"); it != context.end()) {
        if (legacy()) {
            return Err(ErrorCode::InvalidContextEntry, "@propagate is not supported in json-ld-1.0 mode");
        }
        if (!it->is_boolean()) {
            return Err(ErrorCode::InvalidPropagateValue, "@propagate must be a boolean, got: " + it->dump());
        }
    }

    bool protected_default = false;
    if (auto it = context.find("@protected"); it != context.end()) {
        if (!it->is_boolean()) {
            return Err(ErrorCode::InvalidProtectedValue, "@protected must be a boolean, got: " + it->dump());
        }
        protected_default = it->get<bool>();
    }

    LocalScope scope{context, {}, base_url, protected_default};
    for (auto entry = context.begin(); entry != context.end(); ++entry) {
        auto kw = jsonld_syntax::keyword_from_string(entry.key());
        if (kw && jsonld_syntax::is_context_global(*kw)) {
            continue;
        }
        auto defined = define_term(result, scope, entry.key());
        if (!defined) {
            return defined;
        }
    }

    return Ok();
}

// =============================================================================
// Create Term Definition
// =============================================================================

Result<void> Processor::define_term(ContextData& active, LocalScope& scope, const std::string& term) {
    auto state = scope.defined.find(term);
    if (state != scope.defined.end()) {
        if (state->second) {
            return Ok();
        }
        return Err(term_error(ErrorCode::CyclicIriMapping, term, "Term depends on itself"));
    }

    if (term.empty()) {
        return Err(ErrorCode::InvalidTermDefinition, "Empty term");
    }

    scope.defined[term] = false;

    const Value& raw = scope.local.at(term);

    if (term == "@type") {
        if (legacy()) {
            return Err(term_error(ErrorCode::KeywordRedefinition, term, "Keywords cannot be redefined"));
        }
        bool valid = raw.is_object();
        if (valid) {
            for (auto entry = raw.begin(); entry != raw.end(); ++entry) {
                if (entry.key() == "@container") {
                    valid = valid && *entry == "@set";
                } else if (entry.key() != "@protected") {
                    valid = false;
                }
            }
        }
        if (!valid) {
            return Err(term_error(ErrorCode::KeywordRedefinition, term,
                "@type may only define @container: @set and @protected"));
        }
    } else if (jsonld_syntax::is_keyword(term)) {
        return Err(term_error(ErrorCode::KeywordRedefinition, term, "Keywords cannot be redefined"));
    } else if (jsonld_syntax::looks_like_keyword(term)) {
        jsonld_core::report_warning(jsonld_core::context_logger(), m_options.warnings, WarningKind::KeywordLikeTerm,
            "Ignoring term '" + term + "' that has the form of a keyword");
        scope.defined[term] = true;
        return Ok();
    }

    TermPtr previous;
    if (auto it = active.terms.find(term); it != active.terms.end()) {
        previous = it->second;
        active.terms.erase(it);
    }

    Value value;
    bool simple_term = false;
    if (raw.is_null()) {
        value = Value::object();
        value["@id"] = nullptr;
    } else if (raw.is_string()) {
        value = Value::object();
        value["@id"] = raw;
        simple_term = true;
    } else if (raw.is_object()) {
        value = raw;
    } else {
        return Err(term_error(ErrorCode::InvalidTermDefinition, term,
            "Definition must be a string, a map or null, got: " + raw.dump()));
    }

    TermDefinition def;

    if (auto it = value.find("@protected"); it != value.end()) {
        if (legacy()) {
            return Err(term_error(ErrorCode::InvalidTermDefinition, term, "@protected is not supported in json-ld-1.0 mode"));
        }
        if (!it->is_boolean()) {
            return Err(term_error(ErrorCode::InvalidProtectedValue, term, "@protected must be a boolean"));
        }
        def.is_protected = it->get<bool>();
    } else {
        def.is_protected = scope.protected_default;
    }

    if (auto it = value.find("@type"); it != value.end()) {
        if (!it->is_string()) {
            return Err(term_error(ErrorCode::InvalidTypeMapping, term, "@type must be a string, got: " + it->dump()));
        }
        auto expanded = expand_iri(active, scope, it->get<std::string>(), false, true);
        if (!expanded) {
            return Err(std::move(expanded.error()));
        }
        const ExpandedIri& type = *expanded;
        if (!type) {
            return Err(term_error(ErrorCode::InvalidTypeMapping, term, "@type maps to null"));
        }
        if (legacy() && (*type == "@json" || *type == "@none")) {
            return Err(term_error(ErrorCode::InvalidTypeMapping, term, *type + " type mapping in json-ld-1.0 mode"));
        }
        if (*type != "@id" && *type != "@json" && *type != "@none" && *type != "@vocab"
            && !jsonld_syntax::is_absolute_iri(*type)) {
            return Err(term_error(ErrorCode::InvalidTypeMapping, term, "Invalid type mapping '" + *type + "'"));
        }
        def.type_mapping = *type;
    }

    if (auto it = value.find("@reverse"); it != value.end()) {
        if (value.contains("@id") || value.contains("@nest")) {
            return Err(term_error(ErrorCode::InvalidReverseProperty, term, "@reverse cannot be combined with @id or @nest"));
        }
        if (!it->is_string()) {
            return Err(term_error(ErrorCode::InvalidIriMapping, term, "@reverse must be a string"));
        }
        const std::string reverse = it->get<std::string>();
        if (jsonld_syntax::looks_like_keyword(reverse)) {
            jsonld_core::report_warning(jsonld_core::context_logger(), m_options.warnings, WarningKind::KeywordLikeTerm,
                "Ignoring term '" + term + "' with keyword-like @reverse '" + reverse + "'");
            scope.defined[term] = true;
            return Ok();
        }
        auto expanded = expand_iri(active, scope, reverse, false, true);
        if (!expanded) {
            return Err(std::move(expanded.error()));
        }
        if (!*expanded || !is_iri_or_blank(**expanded)) {
            return Err(term_error(ErrorCode::InvalidIriMapping, term, "@reverse '" + reverse + "' is not an IRI"));
        }
        def.iri = **expanded;

        if (auto c = value.find("@container"); c != value.end()) {
            if (!c->is_null() && *c != "@set" && *c != "@index") {
                return Err(term_error(ErrorCode::InvalidReverseProperty, term,
                    "Reverse properties only allow @set or @index containers"));
            }
            auto container = Container::from_value(*c, m_options.processing_mode);
            if (!container) {
                return Err(std::move(container.error()));
            }
            def.container = *container;
        }

        def.reverse = true;
        return store_term(active, scope, term, std::move(def), previous);
    }

    const std::size_t inner_colon = term.find(':', 1);
    const bool has_colon = term.find(':') != std::string::npos;
    const bool has_slash = term.find('/') != std::string::npos;

    auto id = value.find("@id");
    if (id != value.end() && !(id->is_string() && id->get<std::string>() == term)) {
        if (!id->is_null()) {
            if (!id->is_string()) {
                return Err(term_error(ErrorCode::InvalidIriMapping, term, "@id must be a string or null"));
            }
            const std::string id_value = id->get<std::string>();
            if (!jsonld_syntax::is_keyword(id_value) && jsonld_syntax::looks_like_keyword(id_value)) {
                jsonld_core::report_warning(jsonld_core::context_logger(), m_options.warnings, WarningKind::KeywordLikeTerm,
                    "Ignoring term '" + term + "' with keyword-like @id '" + id_value + "'");
                scope.defined[term] = true;
                return Ok();
            }
            auto expanded = expand_iri(active, scope, id_value, false, true);
            if (!expanded) {
                return Err(std::move(expanded.error()));
            }
            if (!*expanded || (!jsonld_syntax::is_keyword(**expanded) && !is_iri_or_blank(**expanded))) {
                return Err(term_error(ErrorCode::InvalidIriMapping, term, "@id '" + id_value + "' is not an IRI"));
            }
            if (**expanded == "@context") {
                return Err(term_error(ErrorCode::InvalidKeywordAlias, term, "@context cannot be aliased"));
            }
            def.iri = **expanded;

            if ((inner_colon != std::string::npos && inner_colon != term.size() - 1) || has_slash) {
                scope.defined[term] = true;
                auto term_iri = expand_iri(active, scope, term, false, true);
                if (!term_iri) {
                    return Err(std::move(term_iri.error()));
                }
                if (*term_iri != def.iri) {
                    return Err(term_error(ErrorCode::InvalidIriMapping, term,
                        "IRI-like term must expand to its own @id"));
                }
            }

            if (!has_colon && !has_slash && simple_term
                && (jsonld_syntax::ends_with_gen_delim(*def.iri) || jsonld_syntax::is_blank_node_identifier(*def.iri))) {
                def.prefix = true;
            }
        }
    } else if (inner_colon != std::string::npos) {
        const std::string prefix = term.substr(0, inner_colon);
        const std::string suffix = term.substr(inner_colon + 1);
        if (scope.local.contains(prefix)) {
            auto defined = define_term(active, scope, prefix);
            if (!defined) {
                return defined;
            }
        }
        const TermDefinition* prefix_def = active.find(prefix);
        if (prefix_def && prefix_def->iri) {
            def.iri = *prefix_def->iri + suffix;
        } else {
            def.iri = term;
        }
    } else if (has_slash) {
        auto expanded = expand_iri(active, scope, term, false, true);
        if (!expanded) {
            return Err(std::move(expanded.error()));
        }
        if (!*expanded || !jsonld_syntax::is_absolute_iri(**expanded)) {
            return Err(term_error(ErrorCode::InvalidIriMapping, term, "Relative IRI term does not expand to an IRI"));
        }
        def.iri = **expanded;
    } else if (term == "@type") {
        def.iri = "@type";
    } else if (active.vocab) {
        def.iri = *active.vocab + term;
    } else {
        return Err(term_error(ErrorCode::InvalidIriMapping, term, "No @id and no @vocab to derive an IRI from"));
    }

    if (auto it = value.find("@container"); it != value.end()) {
        auto container = Container::from_value(*it, m_options.processing_mode);
        if (!container) {
            Error err = container.error();
            err.with_context("term", term);
            return Err(std::move(err));
        }
        def.container = *container;

        if (def.container.has(Container::Type)) {
            if (!def.type_mapping) {
                def.type_mapping = "@id";
            } else if (*def.type_mapping != "@id" && *def.type_mapping != "@vocab") {
                return Err(term_error(ErrorCode::InvalidTypeMapping, term,
                    "@type containers require an @id or @vocab type mapping"));
            }
        }
    }

    if (auto it = value.find("@index"); it != value.end()) {
        if (legacy() || !def.container.has(Container::Index)) {
            return Err(term_error(ErrorCode::InvalidTermDefinition, term, "@index requires an @index container"));
        }
        if (!it->is_string()) {
            return Err(term_error(ErrorCode::InvalidTermDefinition, term, "@index must be a string"));
        }
        const std::string index = it->get<std::string>();
        auto expanded = expand_iri(active, scope, index, false, true);
        if (!expanded) {
            return Err(std::move(expanded.error()));
        }
        if (!*expanded || !jsonld_syntax::is_absolute_iri(**expanded)) {
            return Err(term_error(ErrorCode::InvalidTermDefinition, term, "@index '" + index + "' is not an IRI"));
        }
        def.index = index;
    }

    if (auto it = value.find("@context"); it != value.end()) {
        if (legacy()) {
            return Err(term_error(ErrorCode::InvalidTermDefinition, term, "Scoped contexts are not supported in json-ld-1.0 mode"));
        }

        if (m_depth >= m_options.max_scoped_depth) {
            return Err(term_error(ErrorCode::ContextOverflow, term,
                "Scoped contexts nest deeper than " + std::to_string(m_options.max_scoped_depth) + " levels"));
        }

        ContextProcessingOptions validation = m_options;
        validation.override_protected = true;
        validation.propagate = true;
        validation.validate_scoped_context = false;
        // Reported when the scoped context is applied
        validation.warnings = nullptr;
        std::vector<std::string> stack = m_stack;

        Processor validator(m_loader, validation, stack, m_depth + 1);
        auto checked = validator.process(ActiveContext::freeze(active), *it, scope.base_url);
        if (!checked && checked.error().code() == ErrorCode::ContextOverflow) {
            return Err(std::move(checked.error()));
        }
        if (!checked) {
            return Err(term_error(ErrorCode::InvalidScopedContext, term,
                "Invalid scoped context: " + checked.error().message()));
        }

        def.context = *it;
        def.base_url = scope.base_url;
    }

    if (auto it = value.find("@language"); it != value.end() && !value.contains("@type")) {
        if (it->is_null()) {
            def.language.emplace(std::nullopt);
        } else if (it->is_string()) {
            def.language.emplace(jsonld_syntax::lowercase(it->get<std::string>()));
        } else {
            return Err(term_error(ErrorCode::InvalidLanguageMapping, term, "@language must be a string or null"));
        }
    }

    if (auto it = value.find("@direction"); it != value.end() && !value.contains("@type")) {
        if (it->is_null()) {
            def.direction.emplace(std::nullopt);
        } else {
            auto dir = it->is_string() ? jsonld_syntax::direction_from_string(it->get<std::string>()) : std::nullopt;
            if (!dir) {
                return Err(term_error(ErrorCode::InvalidBaseDirection, term, "@direction must be \"ltr\", \"rtl\" or null"));
            }
            def.direction.emplace(*dir);
        }
    }

    if (auto it = value.find("@nest"); it != value.end()) {
        if (legacy()) {
            return Err(term_error(ErrorCode::InvalidTermDefinition, term, "@nest is not supported in json-ld-1.0 mode"));
        }
        if (!it->is_string() || (jsonld_syntax::is_keyword(it->get<std::string>()) && *it != "@nest")) {
            return Err(term_error(ErrorCode::InvalidNestValue, term, "@nest must be a term or @nest"));
        }
        def.nest = it->get<std::string>();
    }

    if (auto it = value.find("@prefix"); it != value.end()) {
        if (legacy() || has_colon || has_slash) {
            return Err(term_error(ErrorCode::InvalidTermDefinition, term, "@prefix is not allowed here"));
        }
        if (!it->is_boolean()) {
            return Err(term_error(ErrorCode::InvalidPrefixValue, term, "@prefix must be a boolean"));
        }
        def.prefix = it->get<bool>();
        if (def.prefix && def.iri && jsonld_syntax::is_keyword(*def.iri)) {
            return Err(term_error(ErrorCode::InvalidTermDefinition, term, "A keyword alias cannot be a prefix"));
        }
    }

    for (auto entry = value.begin(); entry != value.end(); ++entry) {
        auto kw = jsonld_syntax::keyword_from_string(entry.key());
        if (!kw || !jsonld_syntax::allowed_in_term_definition(*kw)) {
            return Err(term_error(ErrorCode::InvalidTermDefinition, term, "Unexpected entry '" + entry.key() + "'"));
        }
    }

    return store_term(active, scope, term, std::move(def), previous);
}

Result<void> Processor::store_term(
    ContextData& active, LocalScope& scope, const std::string& term,
    TermDefinition def, const TermPtr& previous) {

    if (!m_options.override_protected && previous && previous->is_protected) {
        if (!def.equivalent(*previous)) {
            return Err(term_error(ErrorCode::ProtectedTermRedefinition, term, "Protected term cannot be redefined"));
        }
        active.terms[term] = previous;
    } else {
        active.terms[term] = std::make_shared<const TermDefinition>(std::move(def));
    }

    scope.defined[term] = true;
    jsonld_core::context_logger()->trace("Defined term '{}' -> {}", term,
        active.terms[term]->iri.value_or("null"));
    return Ok();
}

Result<ExpandedIri> Processor::expand_iri(
    ContextData& active, LocalScope& scope, const std::string& value,
    bool document_relative, bool vocab) {

    auto needs_definition = [&scope](const std::string& name) {
        if (!scope.local.contains(name)) {
            return false;
        }
        auto state = scope.defined.find(name);
        return state == scope.defined.end() || !state->second;
    };

    if (!jsonld_syntax::is_keyword(value) && !jsonld_syntax::looks_like_keyword(value)) {
        if (needs_definition(value)) {
            auto defined = define_term(active, scope, value);
            if (!defined) {
                return Err<ExpandedIri>(std::move(defined.error()));
            }
        }

        const TermDefinition* term = active.find(value);
        const bool resolved_by_term = term && (vocab || (term->iri && jsonld_syntax::is_keyword(*term->iri)));

        if (!resolved_by_term) {
            if (auto split = jsonld_syntax::compact_iri_split(value)) {
                const auto& [prefix, suffix] = *split;
                if (prefix != "_" && suffix.rfind("//", 0) != 0 && needs_definition(prefix)) {
                    auto defined = define_term(active, scope, prefix);
                    if (!defined) {
                        return Err<ExpandedIri>(std::move(defined.error()));
                    }
                }
            }
        }
    }

    return Ok(jsonld_context::expand_iri(active, value, document_relative, vocab));
}

} // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

Result<ContextPtr> process_context(
    const ContextPtr& active,
    const Value& local,
    const std::optional<std::string>& base_url,
    DocumentLoader& loader,
    const ContextProcessingOptions& options) {

    std::vector<std::string> stack;
    Processor processor(loader, options, stack);
    return processor.process(active, local, base_url);
}

std::optional<std::string> expand_iri(
    const ContextData& context,
    const std::string& value,
    bool document_relative,
    bool vocab) {

    if (jsonld_syntax::is_keyword(value)) {
        return value;
    }
    if (jsonld_syntax::looks_like_keyword(value)) {
        jsonld_core::context_logger()->warn("Ignoring value '{}' that has the form of a keyword", value);
        return std::nullopt;
    }

    const TermDefinition* term = context.find(value);
    if (term && term->iri && jsonld_syntax::is_keyword(*term->iri)) {
        return term->iri;
    }
    if (vocab && term) {
        return term->iri;
    }

    if (auto split = jsonld_syntax::compact_iri_split(value)) {
        const auto& [prefix, suffix] = *split;
        if (prefix == "_" || suffix.rfind("//", 0) == 0) {
            return value;
        }
        const TermDefinition* prefix_def = context.find(prefix);
        if (prefix_def && prefix_def->iri && prefix_def->prefix) {
            return *prefix_def->iri + suffix;
        }
        if (jsonld_syntax::is_absolute_iri(value)) {
            return value;
        }
    }

    if (vocab && context.vocab) {
        return *context.vocab + value;
    }

    if (document_relative && context.base_iri) {
        if (auto resolved = jsonld_syntax::resolve_iri(*context.base_iri, value)) {
            return resolved;
        }
    }

    return value;
}

} // namespace jsonld_context
