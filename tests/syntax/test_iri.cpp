// jsonld_syntax IRI tests

#include <catch2/catch_test_macros.hpp>
#include <jsonld_engine/syntax/iri.hpp>

#include <set>

using namespace jsonld_syntax;

TEST_CASE("IRI classification", "[syntax][iri]") {
    SECTION("absolute IRIs need a scheme") {
        REQUIRE(is_absolute_iri("http://example.org/"));
        REQUIRE(is_absolute_iri("urn:isbn:0451450523"));
        REQUIRE(is_absolute_iri("tag:example.org,2024:x"));
        REQUIRE_FALSE(is_absolute_iri("relative/path"));
        REQUIRE_FALSE(is_absolute_iri("#fragment"));
        REQUIRE_FALSE(is_absolute_iri("1http://x"));
        REQUIRE_FALSE(is_absolute_iri(""));
    }

    SECTION("blank node identifiers") {
        REQUIRE(is_blank_node_identifier("_:b0"));
        REQUIRE_FALSE(is_blank_node_identifier("_b0"));
        REQUIRE_FALSE(is_blank_node_identifier("http://x"));
    }

    SECTION("gen-delim endings") {
        REQUIRE(ends_with_gen_delim("http://ex.org/"));
        REQUIRE(ends_with_gen_delim("http://ex.org/ns#"));
        REQUIRE(ends_with_gen_delim("urn:x:"));
        REQUIRE_FALSE(ends_with_gen_delim("http://ex.org/ns"));
        REQUIRE_FALSE(ends_with_gen_delim(""));
    }

    SECTION("compact IRI split") {
        auto split = compact_iri_split("foaf:name");
        REQUIRE(split.has_value());
        REQUIRE(split->first == "foaf");
        REQUIRE(split->second == "name");

        REQUIRE_FALSE(compact_iri_split("name").has_value());
        REQUIRE_FALSE(compact_iri_split(":name").has_value());
    }
}

TEST_CASE("IRI parsing", "[syntax][iri]") {
    auto ref = IriRef::parse("http://a/b/c/d;p?q#f");
    REQUIRE(ref.scheme == "http");
    REQUIRE(ref.authority == "a");
    REQUIRE(ref.path == "/b/c/d;p");
    REQUIRE(ref.query == "q");
    REQUIRE(ref.fragment == "f");
    REQUIRE(ref.to_string() == "http://a/b/c/d;p?q#f");

    auto relative = IriRef::parse("../g");
    REQUIRE_FALSE(relative.scheme.has_value());
    REQUIRE_FALSE(relative.authority.has_value());
    REQUIRE(relative.path == "../g");
}

TEST_CASE("Dot segment removal", "[syntax][iri]") {
    REQUIRE(remove_dot_segments("/a/b/c/./../../g") == "/a/g");
    REQUIRE(remove_dot_segments("mid/content=5/../6") == "mid/6");
    REQUIRE(remove_dot_segments("/a/b/..") == "/a/");
    REQUIRE(remove_dot_segments("/../g") == "/g");
}

TEST_CASE("Reference resolution", "[syntax][iri]") {
    // RFC 3986 section 5.4
    const std::string base = "http://a/b/c/d;p?q";

    SECTION("normal examples") {
        REQUIRE(resolve_iri(base, "g:h") == "g:h");
        REQUIRE(resolve_iri(base, "g") == "http://a/b/c/g");
        REQUIRE(resolve_iri(base, "./g") == "http://a/b/c/g");
        REQUIRE(resolve_iri(base, "g/") == "http://a/b/c/g/");
        REQUIRE(resolve_iri(base, "/g") == "http://a/g");
        REQUIRE(resolve_iri(base, "//g") == "http://g");
        REQUIRE(resolve_iri(base, "?y") == "http://a/b/c/d;p?y");
        REQUIRE(resolve_iri(base, "g?y") == "http://a/b/c/g?y");
        REQUIRE(resolve_iri(base, "#s") == "http://a/b/c/d;p?q#s");
        REQUIRE(resolve_iri(base, "g#s") == "http://a/b/c/g#s");
        REQUIRE(resolve_iri(base, ";x") == "http://a/b/c/;x");
        REQUIRE(resolve_iri(base, "") == "http://a/b/c/d;p?q");
        REQUIRE(resolve_iri(base, ".") == "http://a/b/c/");
        REQUIRE(resolve_iri(base, "./") == "http://a/b/c/");
        REQUIRE(resolve_iri(base, "..") == "http://a/b/");
        REQUIRE(resolve_iri(base, "../g") == "http://a/b/g");
        REQUIRE(resolve_iri(base, "../..") == "http://a/");
        REQUIRE(resolve_iri(base, "../../g") == "http://a/g");
    }

    SECTION("abnormal examples") {
        REQUIRE(resolve_iri(base, "../../../g") == "http://a/g");
        REQUIRE(resolve_iri(base, "/./g") == "http://a/g");
        REQUIRE(resolve_iri(base, "g.") == "http://a/b/c/g.");
        REQUIRE(resolve_iri(base, "g;x=1/../y") == "http://a/b/c/y");
    }

    SECTION("relative base cannot resolve relative references") {
        REQUIRE_FALSE(resolve_iri("relative/base", "g").has_value());
        REQUIRE(resolve_iri("relative/base", "http://x/y") == "http://x/y");
    }

    SECTION("authority without path") {
        REQUIRE(resolve_iri("http://example.org", "g") == "http://example.org/g");
    }
}

TEST_CASE("IRI relativization", "[syntax][iri]") {
    const std::string base = "http://example.com/a/b/doc.jsonld";

    SECTION("sibling documents") {
        REQUIRE(relativize_iri(base, "http://example.com/a/b/other") == "other");
    }

    SECTION("parent directories") {
        REQUIRE(relativize_iri(base, "http://example.com/a/x") == "../x");
        REQUIRE(relativize_iri(base, "http://example.com/y") == "../../y");
    }

    SECTION("fragments of the base document") {
        REQUIRE(relativize_iri(base, "http://example.com/a/b/doc.jsonld#frag") == "#frag");
    }

    SECTION("the base directory itself") {
        REQUIRE(relativize_iri(base, "http://example.com/a/b/") == "./");
    }

    SECTION("other authorities stay absolute") {
        REQUIRE(relativize_iri(base, "http://other.org/a/b/c") == "http://other.org/a/b/c");
        REQUIRE(relativize_iri(base, "https://example.com/a/b/c") == "https://example.com/a/b/c");
    }

    SECTION("segments that look like schemes are protected") {
        REQUIRE(relativize_iri(base, "http://example.com/a/b/c:d") == "./c:d");
    }

    SECTION("relativized IRIs resolve back") {
        for (const char* iri : {"http://example.com/a/b/other", "http://example.com/y?q=1",
                                "http://example.com/a/b/c/d#f", "http://example.com/a/x"}) {
            REQUIRE(resolve_iri(base, relativize_iri(base, iri)) == iri);
        }
    }
}

TEST_CASE("Lowercase", "[syntax][iri]") {
    REQUIRE(lowercase("EN-us") == "en-us");
}

TEST_CASE("Language tag well-formedness", "[syntax][iri]") {
    REQUIRE(is_well_formed_language_tag("en"));
    REQUIRE(is_well_formed_language_tag("de-CH-1996"));
    REQUIRE(is_well_formed_language_tag("x-private1"));
    REQUIRE_FALSE(is_well_formed_language_tag(""));
    REQUIRE_FALSE(is_well_formed_language_tag("en_us"));
    REQUIRE_FALSE(is_well_formed_language_tag("en-"));
    REQUIRE_FALSE(is_well_formed_language_tag("1en"));
    REQUIRE_FALSE(is_well_formed_language_tag("en-toolongsubtag"));
}

TEST_CASE("Blank node issuer", "[syntax][iri]") {
    BlankNodeIssuer issuer;

    SECTION("existing labels map stably") {
        std::string a = issuer.issue("_:x");
        std::string b = issuer.issue("_:y");
        REQUIRE(a != b);
        REQUIRE(issuer.issue("_:x") == a);
        REQUIRE(a.rfind("_:b", 0) == 0);
    }

    SECTION("fresh labels are unique") {
        std::set<std::string> labels;
        for (int i = 0; i < 10; ++i) {
            labels.insert(issuer.issue_fresh());
        }
        REQUIRE(labels.size() == 10);
        REQUIRE(issuer.issued() == 10);
    }

    SECTION("custom prefix") {
        BlankNodeIssuer custom("_:n");
        REQUIRE(custom.issue_fresh() == "_:n0");
    }
}
