/// @file options.cpp
/// @brief Processor options

#include <jsonld_engine/api/options.hpp>
#include <jsonld_engine/core/log.hpp>

namespace jsonld_api {

using jsonld_core::Err;
using jsonld_core::ErrorCode;
using jsonld_core::Ok;
using jsonld_core::Result;
using jsonld_core::Value;

namespace {

Result<bool> read_flag(const Value& options, const char* key, bool fallback) {
    auto it = options.find(key);
    if (it == options.end()) {
        return Ok(fallback);
    }
    if (!it->is_boolean()) {
        return Err<bool>(ErrorCode::InvalidArgument,
            std::string("Option '") + key + "' must be a boolean, got: " + it->dump());
    }
    return Ok(it->get<bool>());
}

} // anonymous namespace

Result<JsonLdOptions> JsonLdOptions::from_json(const Value& options) {
    JsonLdOptions result;

    if (options.is_null()) {
        return Ok(std::move(result));
    }
    if (!options.is_object()) {
        return Err<JsonLdOptions>(ErrorCode::InvalidArgument, "Options must be a map, got: " + options.dump());
    }

    for (auto it = options.begin(); it != options.end(); ++it) {
        const std::string& key = it.key();
        const Value& value = it.value();

        if (key == "base") {
            if (!value.is_string()) {
                return Err<JsonLdOptions>(ErrorCode::InvalidArgument, "Option 'base' must be a string");
            }
            result.base = value.get<std::string>();
        } else if (key == "expandContext") {
            if (!value.is_string() && !value.is_object() && !value.is_array()) {
                return Err<JsonLdOptions>(ErrorCode::InvalidArgument,
                    "Option 'expandContext' must be an IRI, a map or an array");
            }
            result.expand_context = value;
        } else if (key == "processingMode") {
            auto mode = value.is_string()
                ? jsonld_syntax::processing_mode_from_string(value.get<std::string>())
                : std::nullopt;
            if (!mode) {
                return Err<JsonLdOptions>(ErrorCode::InvalidArgument, "Unknown processing mode: " + value.dump());
            }
            result.processing_mode = *mode;
        } else if (key == "keyPolicy") {
            auto policy = value.is_string()
                ? jsonld_expansion::key_policy_from_string(value.get<std::string>())
                : std::nullopt;
            if (!policy) {
                return Err<JsonLdOptions>(ErrorCode::InvalidArgument, "Unknown key policy: " + value.dump());
            }
            result.key_policy = *policy;
        } else if (key != "ordered" && key != "compactArrays" && key != "compactToRelative") {
            JSONLD_LOG_DEBUG("Ignoring option '{}'", key);
        }
    }

    auto ordered = read_flag(options, "ordered", result.ordered);
    if (!ordered) {
        return Err<JsonLdOptions>(std::move(ordered.error()));
    }
    auto compact_arrays = read_flag(options, "compactArrays", result.compact_arrays);
    if (!compact_arrays) {
        return Err<JsonLdOptions>(std::move(compact_arrays.error()));
    }
    auto compact_to_relative = read_flag(options, "compactToRelative", result.compact_to_relative);
    if (!compact_to_relative) {
        return Err<JsonLdOptions>(std::move(compact_to_relative.error()));
    }

    result.ordered = *ordered;
    result.compact_arrays = *compact_arrays;
    result.compact_to_relative = *compact_to_relative;
    return Ok(std::move(result));
}

jsonld_expansion::ExpansionOptions JsonLdOptions::expansion() const {
    jsonld_expansion::ExpansionOptions options;
    options.processing_mode = processing_mode;
    options.ordered = ordered;
    options.key_policy = key_policy;
    options.max_depth = max_depth;
    options.max_remote_contexts = max_remote_contexts;
    options.warnings = warnings;
    return options;
}

jsonld_compaction::CompactionOptions JsonLdOptions::compaction() const {
    jsonld_compaction::CompactionOptions options;
    options.processing_mode = processing_mode;
    options.compact_arrays = compact_arrays;
    options.compact_to_relative = compact_to_relative;
    options.ordered = ordered;
    options.max_depth = max_depth;
    options.max_remote_contexts = max_remote_contexts;
    options.warnings = warnings;
    return options;
}

jsonld_context::ContextProcessingOptions JsonLdOptions::context() const {
    jsonld_context::ContextProcessingOptions options;
    options.processing_mode = processing_mode;
    options.max_remote_contexts = max_remote_contexts;
    options.warnings = warnings;
    return options;
}

jsonld_context::DocumentLoader& JsonLdOptions::loader() const {
    static jsonld_context::NoLoader no_loader;
    if (document_loader) {
        return *document_loader;
    }
    return no_loader;
}

} // namespace jsonld_api
