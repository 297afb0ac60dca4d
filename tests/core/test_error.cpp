// jsonld_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <jsonld_engine/core/error.hpp>
#include <string>
#include <vector>

using namespace jsonld_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from code and message") {
        Error err(ErrorCode::InvalidIdValue, "Bad @id");
        REQUIRE(err.code() == ErrorCode::InvalidIdValue);
        REQUIRE(err.message() == "Bad @id");
        REQUIRE(err.is<std::string>());
    }

    SECTION("default") {
        Error err;
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
    }

    SECTION("with context") {
        Error err = Error(ErrorCode::KeyExpansionFailed, "Key failed").with_context("key", "name");
        auto* ctx = err.get_context("key");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "name");
        REQUIRE(err.get_context("missing") == nullptr);
    }

    SECTION("with code keeps the payload") {
        Error err(LoaderError::not_found("https://example.org/ctx"));
        err.with_code(ErrorCode::LoadingRemoteContextFailed);
        REQUIRE(err.code() == ErrorCode::LoadingRemoteContextFailed);
        REQUIRE(err.is<LoaderError>());
        REQUIRE(err.as<LoaderError>()->iri == "https://example.org/ctx");
    }
}

TEST_CASE("Loader errors", "[core][error]") {
    SECTION("not_found") {
        Error err = LoaderError::not_found("https://example.org/doc");
        REQUIRE(err.code() == ErrorCode::LoadingDocumentFailed);
        REQUIRE(err.message().find("https://example.org/doc") != std::string::npos);
        REQUIRE(err.as<LoaderError>()->kind == LoaderError::Kind::NotFound);
    }

    SECTION("loading_failed") {
        Error err = LoaderError::loading_failed("https://example.org/doc", "parse error");
        REQUIRE(err.as<LoaderError>()->kind == LoaderError::Kind::LoadingFailed);
        REQUIRE(err.message().find("parse error") != std::string::npos);
    }
}

TEST_CASE("Error code names", "[core][error]") {
    SECTION("canonical names") {
        REQUIRE(std::string(error_code_name(ErrorCode::CollidingKeywords)) == "colliding keywords");
        REQUIRE(std::string(error_code_name(ErrorCode::IriConfusedWithPrefix)) == "IRI confused with prefix");
        REQUIRE(std::string(error_code_name(ErrorCode::InvalidIdValue)) == "invalid @id value");
        REQUIRE(std::string(error_code_name(ErrorCode::RecursiveContextInclusion)) == "recursive context inclusion");
        REQUIRE(std::string(error_code_name(ErrorCode::InvalidLanguageTaggedString)) == "invalid language-tagged string");
    }

    SECTION("round trip through names") {
        for (auto code : {ErrorCode::CyclicIriMapping, ErrorCode::InvalidScopedContext, ErrorCode::ListOfLists,
                          ErrorCode::ProtectedTermRedefinition, ErrorCode::MaximumDepthExceeded}) {
            auto parsed = error_code_from_name(error_code_name(code));
            REQUIRE(parsed.has_value());
            REQUIRE(*parsed == code);
        }
    }

    SECTION("unknown name") {
        REQUIRE_FALSE(error_code_from_name("no such error").has_value());
    }

    SECTION("code_name accessor") {
        Error err(ErrorCode::InvalidVocabMapping, "bad vocab");
        REQUIRE(std::string(err.code_name()) == "invalid vocab mapping");
    }
}

TEST_CASE("Error chain formatting", "[core][error]") {
    Error err(ErrorCode::InvalidTermDefinition, "Term 'x' is invalid");
    err.with_context("term", "x");

    std::string chain = build_error_chain(err);
    REQUIRE(chain.find("[invalid term definition]") != std::string::npos);
    REQUIRE(chain.find("Term 'x' is invalid") != std::string::npos);
    REQUIRE(chain.find("(term: x)") != std::string::npos);
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
    }

    SECTION("Err with code and message") {
        Result<int> r = Err<int>(ErrorCode::InvalidArgument, "Something failed");
        REQUIRE(r.is_err());
        REQUIRE_FALSE(r.is_ok());
        REQUIRE(r.error().message() == "Something failed");
    }

    SECTION("Err void") {
        Result<void> r = Err(ErrorCode::InvalidNestValue, "bad nest");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::InvalidNestValue);
    }
}

TEST_CASE("Result value access", "[core][result]") {
    SECTION("value_or on Ok") {
        Result<int> r = Ok(42);
        REQUIRE(r.value_or(0) == 42);
    }

    SECTION("value_or on Err") {
        Result<int> r = Err<int>(ErrorCode::InvalidArgument, "error");
        REQUIRE(r.value_or(0) == 0);
    }

    SECTION("move value out") {
        Result<std::string> r = Ok(std::string("hello"));
        std::string s = std::move(r).value();
        REQUIRE(s == "hello");
    }

    SECTION("dereference") {
        Result<std::vector<int>> r = Ok(std::vector<int>{1, 2, 3});
        REQUIRE(r->size() == 3);
        REQUIRE((*r)[1] == 2);
    }
}

TEST_CASE("Result map operations", "[core][result]") {
    SECTION("map on Ok") {
        Result<int> r = Ok(21);
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == 42);
    }

    SECTION("map on Err keeps the error") {
        Result<int> r = Err<int>(ErrorCode::ListOfLists, "error");
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_err());
        REQUIRE(r2.error().code() == ErrorCode::ListOfLists);
    }

    SECTION("and_then on Ok") {
        Result<int> r = Ok(42);
        auto r2 = r.and_then([](int x) -> Result<std::string> {
            return Ok(std::to_string(x));
        });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == "42");
    }
}
