/// @file fixture.cpp
/// @brief Conformance fixtures

#include <jsonld_engine/api/fixture.hpp>
#include <jsonld_engine/api/processor.hpp>
#include <jsonld_engine/core/log.hpp>
#include <jsonld_engine/syntax/iri.hpp>

namespace jsonld_api {

using jsonld_core::Err;
using jsonld_core::Error;
using jsonld_core::ErrorCode;
using jsonld_core::Ok;
using jsonld_core::Result;
using jsonld_core::Value;

namespace {

bool has_type(const Value& entry, const std::string& type) {
    auto it = entry.find("@type");
    if (it == entry.end()) {
        return false;
    }
    for (const auto& t : jsonld_core::as_array(*it)) {
        if (t.is_string() && t.get<std::string>() == type) {
            return true;
        }
    }
    return false;
}

Result<std::string> resolve(const std::string& manifest_base, const Value& reference) {
    if (!reference.is_string()) {
        return Err<std::string>(ErrorCode::InvalidArgument, "Fixture reference must be a string, got: " + reference.dump());
    }
    auto iri = jsonld_syntax::resolve_iri(manifest_base, reference.get<std::string>());
    if (!iri) {
        return Err<std::string>(ErrorCode::InvalidArgument,
            "Cannot resolve '" + reference.get<std::string>() + "' against '" + manifest_base + "'");
    }
    return Ok(std::move(*iri));
}

Result<jsonld_context::RemoteDocument> fetch(
    jsonld_context::DocumentLoader& loader,
    const std::string& manifest_base,
    const Value& reference) {

    auto iri = resolve(manifest_base, reference);
    if (!iri) {
        return Err<jsonld_context::RemoteDocument>(std::move(iri.error()));
    }
    return loader.load(*iri);
}

} // anonymous namespace

const char* fixture_kind_name(FixtureKind kind) noexcept {
    switch (kind) {
        case FixtureKind::Expand: return "expand";
        case FixtureKind::Compact: return "compact";
    }
    return "unknown";
}

// =============================================================================
// Fixture
// =============================================================================

Result<Fixture> Fixture::from_json(
    const Value& entry,
    const jsonld_context::LoaderPtr& loader,
    const std::string& manifest_base) {

    if (!entry.is_object()) {
        return Err<Fixture>(ErrorCode::InvalidArgument, "Fixture entry must be a map");
    }
    if (!loader) {
        return Err<Fixture>(ErrorCode::InvalidArgument, "Fixture entries need a document loader");
    }

    Fixture fixture;
    fixture.id = entry.value("@id", std::string());
    fixture.name = entry.value("name", std::string());

    if (has_type(entry, "jld:ExpandTest")) {
        fixture.kind = FixtureKind::Expand;
    } else if (has_type(entry, "jld:CompactTest")) {
        fixture.kind = FixtureKind::Compact;
    } else {
        return Err<Fixture>(ErrorCode::InvalidArgument, "Fixture '" + fixture.id + "' is neither an expand nor a compact test");
    }

    auto options = JsonLdOptions::from_json(entry.contains("option") ? entry["option"] : Value());
    if (!options) {
        return Err<Fixture>(std::move(options.error().with_context("fixture", fixture.id)));
    }
    fixture.options = std::move(*options);
    fixture.options.document_loader = loader;

    if (fixture.options.expand_context && fixture.options.expand_context->is_string()) {
        auto iri = resolve(manifest_base, *fixture.options.expand_context);
        if (!iri) {
            return Err<Fixture>(std::move(iri.error()));
        }
        fixture.options.expand_context = Value(*iri);
    }

    auto input = fetch(*loader, manifest_base, entry.contains("input") ? entry["input"] : Value());
    if (!input) {
        return Err<Fixture>(std::move(input.error().with_context("fixture", fixture.id)));
    }
    fixture.input = std::move(input->document);
    if (!fixture.options.base) {
        fixture.options.base = input->document_url;
    }

    if (fixture.kind == FixtureKind::Compact) {
        auto context = fetch(*loader, manifest_base, entry.contains("context") ? entry["context"] : Value());
        if (!context) {
            return Err<Fixture>(std::move(context.error().with_context("fixture", fixture.id)));
        }
        fixture.context = std::move(context->document);
    }

    if (auto code = entry.find("expectErrorCode"); code != entry.end()) {
        auto parsed = code->is_string() ? jsonld_core::error_code_from_name(code->get<std::string>()) : std::nullopt;
        if (!parsed) {
            return Err<Fixture>(ErrorCode::InvalidArgument, "Unknown expected error code: " + code->dump());
        }
        fixture.expected_error = *parsed;
    } else if (auto expect = entry.find("expect"); expect != entry.end()) {
        auto expected = fetch(*loader, manifest_base, *expect);
        if (!expected) {
            return Err<Fixture>(std::move(expected.error().with_context("fixture", fixture.id)));
        }
        fixture.expected = std::move(expected->document);
    } else {
        return Err<Fixture>(ErrorCode::InvalidArgument, "Fixture '" + fixture.id + "' has no expectation");
    }

    return Ok(std::move(fixture));
}

// =============================================================================
// Running
// =============================================================================

FixtureOutcome run_fixture(const Fixture& fixture) {
    JSONLD_LOG_DEBUG("Running {} fixture {}", fixture_kind_name(fixture.kind), fixture.id);

    Result<Value> result = fixture.kind == FixtureKind::Compact
        ? compact(fixture.input, fixture.context.value_or(Value::object()), fixture.options)
        : expand(fixture.input, fixture.options);

    FixtureOutcome outcome;

    if (!result) {
        const Error& error = result.error();
        outcome.error = error;
        if (fixture.expected_error) {
            outcome.passed = error.code() == *fixture.expected_error;
            outcome.message = outcome.passed
                ? std::string("failed as expected with ") + error.code_name()
                : std::string("expected ") + jsonld_core::error_code_name(*fixture.expected_error)
                    + ", got " + error.code_name() + ": " + error.message();
        } else {
            outcome.message = std::string("unexpected error ") + error.code_name() + ": " + error.message();
        }
        return outcome;
    }

    outcome.output = *result;

    if (fixture.expected_error) {
        outcome.message = std::string("expected ") + jsonld_core::error_code_name(*fixture.expected_error)
            + ", got output " + result->dump();
        return outcome;
    }

    if (fixture.expected && jsonld_core::json_ld_equal(*result, *fixture.expected)) {
        outcome.passed = true;
        outcome.message = "output matches";
    } else {
        outcome.message = "output differs: got " + result->dump()
            + ", expected " + fixture.expected.value_or(Value()).dump();
    }
    return outcome;
}

} // namespace jsonld_api
