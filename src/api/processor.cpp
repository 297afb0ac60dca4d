/// @file processor.cpp
/// @brief Processor entry points

#include <jsonld_engine/api/processor.hpp>
#include <jsonld_engine/compaction/compact.hpp>
#include <jsonld_engine/context/processing.hpp>
#include <jsonld_engine/core/log.hpp>
#include <jsonld_engine/expansion/expand.hpp>

namespace jsonld_api {

using jsonld_context::ContextPtr;
using jsonld_core::Err;
using jsonld_core::Ok;
using jsonld_core::Result;
using jsonld_core::Value;

namespace {

/// A document together with the base IRI it is processed against
struct Input {
    Value document;
    std::optional<std::string> base;
    std::optional<std::string> context_url;
};

Result<Input> resolve_input(const Value& document, const JsonLdOptions& options) {
    if (!document.is_string()) {
        return Ok(Input{document, options.base, std::nullopt});
    }

    auto remote = options.loader().load(document.get<std::string>());
    if (!remote) {
        return Err<Input>(std::move(remote.error()));
    }

    Input input;
    input.document = std::move(remote->document);
    input.base = options.base ? options.base : std::optional<std::string>(remote->document_url);
    input.context_url = remote->context_url;
    return Ok(std::move(input));
}

/// Strip the "@context" wrapper of a context document
const Value& context_value(const Value& context) {
    if (context.is_object()) {
        if (auto it = context.find("@context"); it != context.end()) {
            return *it;
        }
    }
    return context;
}

bool is_empty_context(const Value& context) {
    return context.is_null() || ((context.is_object() || context.is_array()) && context.empty());
}

} // anonymous namespace

Result<ContextPtr> process_context(const Value& context, const JsonLdOptions& options) {
    ContextPtr active = jsonld_context::ActiveContext::create(options.base);
    return jsonld_context::process_context(active, context_value(context), options.base, options.loader(),
        options.context());
}

Result<Value> expand(const Value& document, const JsonLdOptions& options) {
    auto input = resolve_input(document, options);
    if (!input) {
        return Err<Value>(std::move(input.error()));
    }

    ContextPtr active = jsonld_context::ActiveContext::create(input->base);

    if (options.expand_context) {
        auto processed = jsonld_context::process_context(active, context_value(*options.expand_context),
            input->base, options.loader(), options.context());
        if (!processed) {
            return Err<Value>(std::move(processed.error()));
        }
        active = std::move(*processed);
    }

    // A context linked from the document's response applies before its own
    if (input->context_url) {
        auto processed = jsonld_context::process_context(active, Value(*input->context_url),
            input->base, options.loader(), options.context());
        if (!processed) {
            return Err<Value>(std::move(processed.error()));
        }
        active = std::move(*processed);
    }

    jsonld_expansion::Expander expander(options.loader(), options.expansion());
    return expander.expand(active, input->document, input->base);
}

Result<Value> compact(const Value& document, const Value& context, const JsonLdOptions& options) {
    JsonLdOptions expand_options = options;
    expand_options.ordered = false;

    auto expanded = expand(document, expand_options);
    if (!expanded) {
        return expanded;
    }

    const Value& local = context_value(context);
    ContextPtr active = jsonld_context::ActiveContext::create(options.base);
    auto processed = jsonld_context::process_context(active, local, options.base, options.loader(),
        options.context());
    if (!processed) {
        return Err<Value>(std::move(processed.error()));
    }

    jsonld_compaction::Compactor compactor(options.loader(), options.compaction());
    auto compacted = compactor.compact(*processed, *expanded);
    if (!compacted) {
        return compacted;
    }

    if (is_empty_context(local)) {
        return compacted;
    }

    Value result = Value::object();
    result["@context"] = local;
    for (auto it = compacted->begin(); it != compacted->end(); ++it) {
        result[it.key()] = std::move(it.value());
    }
    return Ok(std::move(result));
}

} // namespace jsonld_api
