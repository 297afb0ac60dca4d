// jsonld_compaction IRI compaction tests

#include <catch2/catch_test_macros.hpp>
#include <jsonld_engine/compaction/iri.hpp>
#include <jsonld_engine/context/processing.hpp>

using namespace jsonld_compaction;
using jsonld_context::ActiveContext;
using jsonld_context::ContextPtr;
using jsonld_context::NoLoader;
using jsonld_core::ErrorCode;
using jsonld_core::Value;
using jsonld_syntax::ProcessingMode;

namespace {

const std::string k_base = "http://example.org/dir/doc";

ContextPtr make_context(const char* json) {
    NoLoader loader;
    auto ctx = jsonld_context::process_context(ActiveContext::create(k_base), Value::parse(json), k_base, loader);
    REQUIRE(ctx.is_ok());
    return *ctx;
}

std::string vocab_iri(const ContextPtr& ctx, const std::string& iri) {
    auto result = compact_iri(*ctx, iri, true, CompactionOptions{});
    REQUIRE(result.is_ok());
    return *result;
}

std::string document_iri(const ContextPtr& ctx, const std::string& iri, const CompactionOptions& options = {}) {
    auto result = compact_iri(*ctx, iri, false, options);
    REQUIRE(result.is_ok());
    return *result;
}

} // anonymous namespace

TEST_CASE("Vocabulary IRI compaction", "[compaction][iri]") {
    auto ctx = make_context(R"({
        "@vocab": "http://ex/",
        "name": "http://schema.org/name",
        "ex": "http://ex/",
        "exlong": "http://ex/long/",
        "title": "http://ex/heading"
    })");

    SECTION("terms win") {
        REQUIRE(vocab_iri(ctx, "http://schema.org/name") == "name");
    }

    SECTION("vocabulary suffixes") {
        REQUIRE(vocab_iri(ctx, "http://ex/age") == "age");
    }

    SECTION("suffixes that are terms are not used") {
        REQUIRE(vocab_iri(ctx, "http://ex/title") == "ex:title");
    }

    SECTION("the shortest compact IRI wins") {
        REQUIRE(vocab_iri(ctx, "http://ex/long/x") == "long/x");
        auto no_vocab = make_context(R"({"ex": "http://ex/", "exlong": "http://ex/long/"})");
        REQUIRE(vocab_iri(no_vocab, "http://ex/long/x") == "exlong:x");
    }

    SECTION("unrelated IRIs stay absolute") {
        REQUIRE(vocab_iri(ctx, "http://other.org/x") == "http://other.org/x");
    }
}

TEST_CASE("Document IRI compaction", "[compaction][iri]") {
    auto ctx = make_context("{}");

    SECTION("relative to the base") {
        REQUIRE(document_iri(ctx, "http://example.org/dir/alice") == "alice");
        REQUIRE(document_iri(ctx, "http://example.org/other") == "../other");
        REQUIRE(document_iri(ctx, "http://other.org/x") == "http://other.org/x");
    }

    SECTION("relative compaction disabled") {
        CompactionOptions options;
        options.compact_to_relative = false;
        REQUIRE(document_iri(ctx, "http://example.org/dir/alice", options) == "http://example.org/dir/alice");
    }

    SECTION("blank nodes are untouched") {
        REQUIRE(document_iri(ctx, "_:b0") == "_:b0");
    }

    SECTION("IRIs that read back through a prefix") {
        auto prefixed = make_context(R"({"foo": "http://ex/"})");
        auto result = compact_iri(*prefixed, "foo:bar", false, CompactionOptions{});
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::IriConfusedWithPrefix);
    }
}

TEST_CASE("Keyword compaction", "[compaction][iri][keyword]") {
    auto ctx = make_context(R"({"id": "@id"})");

    REQUIRE(compact_keyword(*ctx, "@id", ProcessingMode::JsonLd11) == "id");
    REQUIRE(compact_keyword(*ctx, "@type", ProcessingMode::JsonLd11) == "@type");
}

TEST_CASE("Term selection by value shape", "[compaction][iri][select]") {
    auto ctx = make_context(R"({
        "date": {"@id": "http://ex/date", "@type": "http://xsd/date"},
        "dateStr": "http://ex/date",
        "tags": {"@id": "http://ex/tags", "@container": "@set"}
    })");

    SECTION("typed values pick the typed term") {
        auto term = select_term(*ctx, "http://ex/date",
            Value::parse(R"({"@value": "2020-01-01", "@type": "http://xsd/date"})"), false, ProcessingMode::JsonLd11);
        REQUIRE(term == "date");
    }

    SECTION("plain values pick the untyped term") {
        auto term = select_term(*ctx, "http://ex/date", Value::parse(R"({"@value": "soon"})"), false,
            ProcessingMode::JsonLd11);
        REQUIRE(term == "dateStr");
    }

    SECTION("set containers accept plain values") {
        auto term = select_term(*ctx, "http://ex/tags", Value::parse(R"({"@value": "a"})"), false,
            ProcessingMode::JsonLd11);
        REQUIRE(term == "tags");
    }

    SECTION("unknown IRIs") {
        REQUIRE_FALSE(select_term(*ctx, "http://ex/unknown", Value(), false, ProcessingMode::JsonLd11).has_value());
    }
}
