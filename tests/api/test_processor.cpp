// jsonld_api processor tests

#include <catch2/catch_test_macros.hpp>
#include <jsonld_engine/api/processor.hpp>

#include <memory>
#include <thread>
#include <vector>

using namespace jsonld_api;
using jsonld_context::StaticLoader;
using jsonld_core::ErrorCode;
using jsonld_core::Value;

namespace {

void require_equal(const Value& actual, const char* expected) {
    INFO("actual: " << actual.dump());
    REQUIRE(jsonld_core::json_ld_equal(actual, Value::parse(expected)));
}

} // anonymous namespace

// =============================================================================
// Options
// =============================================================================

TEST_CASE("Processor options", "[api][options]") {
    SECTION("defaults") {
        auto options = JsonLdOptions::from_json(Value());
        REQUIRE(options.is_ok());
        REQUIRE_FALSE(options->base.has_value());
        REQUIRE(options->compact_arrays);
        REQUIRE(options->compact_to_relative);
        REQUIRE_FALSE(options->ordered);
        REQUIRE(options->processing_mode == jsonld_syntax::ProcessingMode::JsonLd11);
    }

    SECTION("fixture-style maps") {
        auto options = JsonLdOptions::from_json(Value::parse(R"({
            "base": "http://example.org/", "processingMode": "json-ld-1.0", "ordered": true,
            "compactArrays": false, "compactToRelative": false, "keyPolicy": "strict",
            "expandContext": {"@vocab": "http://ex/"}, "produceGeneralizedRdf": true
        })"));
        REQUIRE(options.is_ok());
        REQUIRE(options->base == "http://example.org/");
        REQUIRE(options->processing_mode == jsonld_syntax::ProcessingMode::JsonLd10);
        REQUIRE(options->ordered);
        REQUIRE_FALSE(options->compact_arrays);
        REQUIRE_FALSE(options->compact_to_relative);
        REQUIRE(options->key_policy == jsonld_expansion::KeyPolicy::Strict);
        REQUIRE(options->expand_context.has_value());
    }

    SECTION("derived engine options") {
        JsonLdOptions options;
        options.ordered = true;
        options.compact_arrays = false;
        options.max_depth = 7;
        REQUIRE(options.expansion().ordered);
        REQUIRE(options.expansion().max_depth == 7);
        REQUIRE_FALSE(options.compaction().compact_arrays);
        REQUIRE(options.compaction().max_depth == 7);
        REQUIRE(options.context().max_remote_contexts == options.max_remote_contexts);
    }

    SECTION("the warning sink is shared by every engine") {
        JsonLdOptions options;
        options.warnings = std::make_shared<jsonld_core::WarningSink>();
        REQUIRE(options.expansion().warnings == options.warnings);
        REQUIRE(options.compaction().warnings == options.warnings);
        REQUIRE(options.context().warnings == options.warnings);
    }

    SECTION("invalid values") {
        REQUIRE(JsonLdOptions::from_json(Value::parse("[]")).is_err());
        REQUIRE(JsonLdOptions::from_json(Value::parse(R"({"base": 1})")).is_err());
        REQUIRE(JsonLdOptions::from_json(Value::parse(R"({"processingMode": "json-ld-2.0"})")).is_err());
        REQUIRE(JsonLdOptions::from_json(Value::parse(R"({"keyPolicy": "lenient"})")).is_err());
        REQUIRE(JsonLdOptions::from_json(Value::parse(R"({"compactArrays": "no"})")).is_err());
        REQUIRE(JsonLdOptions::from_json(Value::parse(R"({"expandContext": 5})")).is_err());
    }
}

// =============================================================================
// Expand
// =============================================================================

TEST_CASE("Processor expand", "[api][expand]") {
    SECTION("inline documents") {
        JsonLdOptions options;
        options.base = "http://example.org/doc";
        auto result = expand(Value::parse(R"({"@context": {"@vocab": "http://ex/"}, "@id": "a", "p": "v"})"), options);
        REQUIRE(result.is_ok());
        require_equal(*result, R"([{"@id": "http://example.org/a", "http://ex/p": [{"@value": "v"}]}])");
    }

    SECTION("remote documents use their URL as the base") {
        auto loader = std::make_shared<StaticLoader>();
        loader->insert("http://example.org/data/doc.jsonld",
            Value::parse(R"({"@context": {"@vocab": "http://ex/"}, "@id": "a", "p": "v"})"));
        JsonLdOptions options;
        options.document_loader = loader;

        auto result = expand(Value("http://example.org/data/doc.jsonld"), options);
        REQUIRE(result.is_ok());
        require_equal(*result, R"([{"@id": "http://example.org/data/a", "http://ex/p": [{"@value": "v"}]}])");
    }

    SECTION("remote documents need a loader") {
        auto result = expand(Value("http://example.org/data/doc.jsonld"));
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::LoadingDocumentFailed);
    }

    SECTION("expandContext applies before the document context") {
        JsonLdOptions options;
        options.expand_context = Value::parse(R"({"@context": {"name": "http://schema.org/name"}})");
        auto result = expand(Value::parse(R"({"@id": "http://ex/a", "name": "A"})"), options);
        REQUIRE(result.is_ok());
        require_equal(*result, R"([{"@id": "http://ex/a", "http://schema.org/name": [{"@value": "A"}]}])");
    }

    SECTION("warnings reach the caller") {
        JsonLdOptions options;
        options.warnings = std::make_shared<jsonld_core::WarningSink>();
        auto result = expand(Value::parse(R"({"@context": {"@vocab": "http://ex/", "@term": "http://ex/t"},
                                              "@id": "http://ex/a", "@other": "x", "p": "v"})"), options);
        REQUIRE(result.is_ok());
        require_equal(*result, R"([{"@id": "http://ex/a", "http://ex/p": [{"@value": "v"}]}])");

        auto warnings = options.warnings->warnings();
        REQUIRE(warnings.size() == 2);
        REQUIRE(warnings[0].kind == jsonld_core::WarningKind::KeywordLikeTerm);
        REQUIRE(warnings[1].kind == jsonld_core::WarningKind::KeywordLikeValue);
    }

    SECTION("errors propagate") {
        auto result = expand(Value::parse(R"({"@id": 5})"));
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidIdValue);
    }
}

// =============================================================================
// Compact
// =============================================================================

TEST_CASE("Processor compact", "[api][compact]") {
    const Value document = Value::parse(R"({
        "@id": "http://ex/a",
        "http://schema.org/name": "A",
        "http://schema.org/knows": {"@id": "http://ex/b"}
    })");

    SECTION("the context is written first") {
        auto result = compact(document, Value::parse(R"({"@context": {
            "name": "http://schema.org/name",
            "knows": {"@id": "http://schema.org/knows", "@type": "@id"}
        }})"));
        REQUIRE(result.is_ok());
        REQUIRE(result->begin().key() == "@context");
        require_equal(*result, R"({
            "@context": {"name": "http://schema.org/name", "knows": {"@id": "http://schema.org/knows", "@type": "@id"}},
            "@id": "http://ex/a", "name": "A", "knows": "http://ex/b"
        })");
    }

    SECTION("bare context values are accepted") {
        auto result = compact(document, Value::parse(R"({"@vocab": "http://schema.org/"})"));
        REQUIRE(result.is_ok());
        require_equal(*result, R"({
            "@context": {"@vocab": "http://schema.org/"},
            "@id": "http://ex/a", "name": "A", "knows": {"@id": "http://ex/b"}
        })");
    }

    SECTION("empty contexts are omitted") {
        auto result = compact(document, Value::object());
        REQUIRE(result.is_ok());
        REQUIRE_FALSE(result->contains("@context"));
    }

    SECTION("remote contexts") {
        auto loader = std::make_shared<StaticLoader>();
        loader->insert("http://example.org/ctx.jsonld", Value::parse(R"({"@context": {"name": "http://schema.org/name"}})"));
        JsonLdOptions options;
        options.document_loader = loader;

        auto result = compact(document, Value("http://example.org/ctx.jsonld"), options);
        REQUIRE(result.is_ok());
        REQUIRE((*result)["@context"] == "http://example.org/ctx.jsonld");
        REQUIRE((*result)["name"] == "A");
    }

    SECTION("list containers round-trip") {
        const Value context = Value::parse(R"({"@context": {"l": {"@id": "http://ex/l", "@container": "@list"}}})");
        Value input = context;
        input["l"] = Value::parse(R"(["a", "b"])");

        auto expanded = expand(input);
        REQUIRE(expanded.is_ok());
        require_equal(*expanded, R"([{"http://ex/l": [{"@list": [{"@value": "a"}, {"@value": "b"}]}]}])");

        auto result = compact(input, context);
        REQUIRE(result.is_ok());
        REQUIRE((*result)["l"] == Value::parse(R"(["a", "b"])"));
    }

    SECTION("context errors propagate") {
        auto result = compact(document, Value::parse(R"({"@vocab": 5})"));
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidVocabMapping);
    }
}

// =============================================================================
// Contexts
// =============================================================================

TEST_CASE("Processor contexts", "[api][context]") {
    SECTION("processed contexts can be reused across threads") {
        auto ctx = process_context(Value::parse(R"({"@context": {"name": "http://schema.org/name"}})"));
        REQUIRE(ctx.is_ok());
        REQUIRE((*ctx)->find("name") != nullptr);

        std::vector<std::thread> threads;
        std::vector<int> found(4, 0);
        for (std::size_t i = 0; i < found.size(); ++i) {
            threads.emplace_back([&ctx, &found, i]() {
                found[i] = (*ctx)->find("name") != nullptr && (*ctx)->inverse().contains("http://schema.org/name");
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        for (int f : found) {
            REQUIRE(f);
        }
    }

    SECTION("the base option roots the context") {
        JsonLdOptions options;
        options.base = "http://example.org/doc";
        auto ctx = process_context(Value::parse(R"({"@vocab": "terms#"})"), options);
        REQUIRE(ctx.is_ok());
        REQUIRE((*ctx)->vocab() == "http://example.org/terms#");
    }
}
