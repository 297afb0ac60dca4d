// jsonld_expansion container tests

#include <catch2/catch_test_macros.hpp>
#include <jsonld_engine/expansion/expand.hpp>

using namespace jsonld_expansion;
using jsonld_context::ActiveContext;
using jsonld_context::NoLoader;
using jsonld_core::ErrorCode;
using jsonld_core::Value;

namespace {

const std::string k_base = "http://example.org/doc";

jsonld_core::Result<Value> run(const char* json) {
    NoLoader loader;
    return expand(Value::parse(json), ActiveContext::create(k_base), k_base, loader);
}

void check(const char* input, const char* expected) {
    auto result = run(input);
    INFO(input);
    if (result.is_err()) {
        FAIL(jsonld_core::build_error_chain(result.error()));
    }
    INFO("actual: " << result->dump());
    REQUIRE(jsonld_core::json_ld_equal(*result, Value::parse(expected)));
}

ErrorCode fail(const char* input) {
    auto result = run(input);
    INFO(input);
    REQUIRE(result.is_err());
    return result.error().code();
}

} // anonymous namespace

// =============================================================================
// Lists and Sets
// =============================================================================

TEST_CASE("List containers", "[expansion][container][list]") {
    SECTION("arrays become lists") {
        check(R"({"@context": {"l": {"@id": "http://ex/l", "@container": "@list"}}, "l": [1, 2]})",
              R"([{"http://ex/l": [{"@list": [{"@value": 1}, {"@value": 2}]}]}])");
    }

    SECTION("single values become one-element lists") {
        check(R"({"@context": {"l": {"@id": "http://ex/l", "@container": "@list"}}, "l": "a"})",
              R"([{"http://ex/l": [{"@list": [{"@value": "a"}]}]}])");
    }

    SECTION("list order is significant") {
        auto result = run(R"({"@context": {"l": {"@id": "http://ex/l", "@container": "@list"}}, "l": [1, 2]})");
        REQUIRE(result.is_ok());
        REQUIRE_FALSE(jsonld_core::json_ld_equal(*result,
            Value::parse(R"([{"http://ex/l": [{"@list": [{"@value": 2}, {"@value": 1}]}]}])")));
    }

    SECTION("nested arrays become nested lists") {
        check(R"({"@context": {"l": {"@id": "http://ex/l", "@container": "@list"}}, "l": [[1], 2]})",
              R"([{"http://ex/l": [{"@list": [{"@list": [{"@value": 1}]}, {"@value": 2}]}]}])");
    }

    SECTION("explicit list objects") {
        check(R"({"@context": {"@vocab": "http://ex/"}, "p": {"@list": ["a"]}})",
              R"([{"http://ex/p": [{"@list": [{"@value": "a"}]}]}])");
    }

    SECTION("empty lists are kept") {
        check(R"({"@context": {"@vocab": "http://ex/"}, "p": {"@list": []}})",
              R"([{"http://ex/p": [{"@list": []}]}])");
    }

    SECTION("arrays inside explicit list objects become nested lists") {
        check(R"({"@context": {"@vocab": "http://ex/"}, "p": {"@list": [["a"]]}})",
              R"([{"http://ex/p": [{"@list": [{"@list": [{"@value": "a"}]}]}]}])");
        check(R"({"@context": {"@vocab": "http://ex/"}, "p": {"@list": ["a", ["b", ["c"]], []]}})",
              R"([{"http://ex/p": [{"@list": [
                    {"@value": "a"},
                    {"@list": [{"@value": "b"}, {"@list": [{"@value": "c"}]}]},
                    {"@list": []}]}]}])");
    }
}

TEST_CASE("Set objects", "[expansion][container][set]") {
    SECTION("@set is flattened into the property") {
        check(R"({"@context": {"@vocab": "http://ex/"}, "p": {"@set": ["a", "b"]}})",
              R"([{"http://ex/p": [{"@value": "a"}, {"@value": "b"}]}])");
    }

    SECTION("empty arrays are kept as empty properties") {
        check(R"({"@context": {"@vocab": "http://ex/"}, "@id": "http://ex/a", "p": []})",
              R"([{"@id": "http://ex/a", "http://ex/p": []}])");
    }

    SECTION("set objects only carry @index") {
        REQUIRE(fail(R"({"@context": {"@vocab": "http://ex/"}, "p": {"@set": [1], "q": 2}})")
                == ErrorCode::InvalidSetOrListObject);
    }
}

// =============================================================================
// Maps
// =============================================================================

TEST_CASE("Language maps", "[expansion][container][language]") {
    SECTION("keys become language tags") {
        check(R"({"@context": {"label": {"@id": "http://ex/label", "@container": "@language"}},
                  "label": {"en": "Hi", "de": ["Hallo", "Servus"], "@none": "x"}})",
              R"([{"http://ex/label": [
                    {"@value": "Hi", "@language": "en"},
                    {"@value": "Hallo", "@language": "de"},
                    {"@value": "Servus", "@language": "de"},
                    {"@value": "x"}]}])");
    }

    SECTION("term direction applies to every entry") {
        check(R"({"@context": {"label": {"@id": "http://ex/label", "@container": "@language", "@direction": "ltr"}},
                  "label": {"en": "Hi"}})",
              R"([{"http://ex/label": [{"@value": "Hi", "@language": "en", "@direction": "ltr"}]}])");
    }

    SECTION("null entries are skipped") {
        check(R"({"@context": {"label": {"@id": "http://ex/label", "@container": "@language"}},
                  "@id": "http://ex/a", "label": {"en": null}})",
              R"([{"@id": "http://ex/a", "http://ex/label": []}])");
    }

    SECTION("values must be strings") {
        REQUIRE(fail(R"({"@context": {"label": {"@id": "http://ex/label", "@container": "@language"}},
                         "label": {"en": 5}})")
                == ErrorCode::InvalidLanguageMapValue);
    }
}

TEST_CASE("Index maps", "[expansion][container][index]") {
    SECTION("keys become @index") {
        check(R"({"@context": {"post": {"@id": "http://ex/post", "@container": "@index"}},
                  "post": {"a": {"@id": "http://ex/1"}, "b": "text"}})",
              R"([{"http://ex/post": [{"@id": "http://ex/1", "@index": "a"}, {"@value": "text", "@index": "b"}]}])");
    }

    SECTION("@none keys add no index") {
        check(R"({"@context": {"post": {"@id": "http://ex/post", "@container": "@index"}},
                  "post": {"@none": {"@id": "http://ex/1"}}})",
              R"([{"http://ex/post": [{"@id": "http://ex/1"}]}])");
    }

    SECTION("property-valued indexes") {
        check(R"({"@context": {"@vocab": "http://ex/",
                               "post": {"@id": "http://ex/post", "@container": "@index", "@index": "http://ex/lang"}},
                  "post": {"en": {"@id": "http://ex/p1"}}})",
              R"([{"http://ex/post": [{"@id": "http://ex/p1", "http://ex/lang": [{"@value": "en"}]}]}])");
    }

    SECTION("property-valued indexes cannot annotate values") {
        REQUIRE(fail(R"({"@context": {"post": {"@id": "http://ex/post", "@container": "@index", "@index": "http://ex/lang"}},
                         "post": {"en": "text"}})")
                == ErrorCode::InvalidValueObject);
    }
}

TEST_CASE("Id maps", "[expansion][container][id]") {
    SECTION("keys become node identifiers") {
        check(R"({"@context": {"@vocab": "http://ex/", "members": {"@id": "http://ex/members", "@container": "@id"}},
                  "members": {"http://ex/m1": {"name": "One"}, "m2": {}}})",
              R"([{"http://ex/members": [
                    {"@id": "http://ex/m1", "http://ex/name": [{"@value": "One"}]},
                    {"@id": "http://example.org/m2"}]}])");
    }

    SECTION("keyword-like keys leave the node without an identifier") {
        auto result = run(R"({"@context": {"@vocab": "http://ex/", "members": {"@id": "http://ex/members", "@container": "@id"}},
                              "members": {"@ignored": {"name": "One"}}})");
        REQUIRE(result.is_ok());
        INFO("actual: " << result->dump());
        const Value& member = (*result)[0]["http://ex/members"][0];
        REQUIRE_FALSE(member.contains("@id"));
        REQUIRE(member["http://ex/name"] == Value::parse(R"([{"@value": "One"}])"));
    }
}

TEST_CASE("Type maps", "[expansion][container][type]") {
    SECTION("keys become types and strings become references") {
        check(R"({"@context": {"@vocab": "http://ex/", "byType": {"@id": "http://ex/byType", "@container": "@type"}},
                  "byType": {"Person": {"@id": "http://ex/p1"}, "Org": "http://ex/o1"}})",
              R"([{"http://ex/byType": [
                    {"@id": "http://ex/p1", "@type": ["http://ex/Person"]},
                    {"@id": "http://ex/o1", "@type": ["http://ex/Org"]}]}])");
    }

    SECTION("values expand outside the type-scoped context") {
        check(R"({"@context": {"@vocab": "http://ex/",
                               "T": {"@id": "http://ex/T", "@context": {
                                   "x": "http://other/x",
                                   "m": {"@id": "http://ex/m", "@container": "@type"}}}},
                  "@type": "T", "m": {"K": {"x": "v"}}})",
              R"([{"@type": ["http://ex/T"],
                   "http://ex/m": [{"@type": ["http://ex/K"], "http://ex/x": [{"@value": "v"}]}]}])");
    }

    SECTION("existing types are kept after the map key") {
        check(R"({"@context": {"@vocab": "http://ex/", "byType": {"@id": "http://ex/byType", "@container": "@type"}},
                  "byType": {"Person": {"@id": "http://ex/p1", "@type": "Agent"}}})",
              R"([{"http://ex/byType": [{"@id": "http://ex/p1", "@type": ["http://ex/Person", "http://ex/Agent"]}]}])");
    }
}

// =============================================================================
// Graph Containers
// =============================================================================

TEST_CASE("Graph containers", "[expansion][container][graph]") {
    SECTION("values become simple graphs") {
        check(R"({"@context": {"@vocab": "http://ex/", "g": {"@id": "http://ex/g", "@container": "@graph"}},
                  "g": {"p": "v"}})",
              R"([{"http://ex/g": [{"@graph": [{"http://ex/p": [{"@value": "v"}]}]}]}])");
    }

    SECTION("graph id maps name the graphs") {
        check(R"({"@context": {"@vocab": "http://ex/", "g": {"@id": "http://ex/g", "@container": ["@graph", "@id"]}},
                  "g": {"http://ex/graph1": {"p": "v"}}})",
              R"([{"http://ex/g": [{"@id": "http://ex/graph1", "@graph": [{"http://ex/p": [{"@value": "v"}]}]}]}])");
    }

    SECTION("graph index maps index the graphs") {
        check(R"({"@context": {"@vocab": "http://ex/", "g": {"@id": "http://ex/g", "@container": ["@graph", "@index"]}},
                  "g": {"first": {"p": "v"}}})",
              R"([{"http://ex/g": [{"@index": "first", "@graph": [{"http://ex/p": [{"@value": "v"}]}]}]}])");
    }
}
