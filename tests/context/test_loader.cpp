// jsonld_context document loader tests

#include <catch2/catch_test_macros.hpp>
#include <jsonld_engine/context/loader.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace jsonld_context;
using jsonld_core::ErrorCode;
using jsonld_core::LoaderError;
using jsonld_core::Result;
using jsonld_core::Value;

namespace fs = std::filesystem;

namespace {

/// Loader that counts requests and answers slowly
class CountingLoader : public DocumentLoader {
public:
    Result<RemoteDocument> load(const std::string& iri) override {
        ++calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        if (iri.find("missing") != std::string::npos) {
            return jsonld_core::Err<RemoteDocument>(LoaderError::not_found(iri));
        }
        RemoteDocument doc;
        doc.document = Value::parse(R"({"@context": {}})");
        doc.document_url = iri;
        return jsonld_core::Ok(std::move(doc));
    }

    std::atomic<int> calls{0};
};

/// Loader whose every request throws
class ThrowingLoader : public DocumentLoader {
public:
    Result<RemoteDocument> load(const std::string& iri) override {
        ++calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        throw std::runtime_error("transport failure: " + iri);
    }

    std::atomic<int> calls{0};
};

/// Scratch directory removed when the test ends
struct TempDir {
    TempDir() {
        path = fs::temp_directory_path()
            / ("jsonld_engine_loader_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    void write(const std::string& name, const std::string& content) const {
        std::ofstream out(path / name);
        out << content;
    }

    fs::path path;
};

} // anonymous namespace

TEST_CASE("NoLoader", "[context][loader]") {
    NoLoader loader;
    auto result = loader.load("http://example.org/ctx");
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == ErrorCode::LoadingDocumentFailed);
    REQUIRE(result.error().as<LoaderError>()->kind == LoaderError::Kind::NotFound);
}

TEST_CASE("StaticLoader", "[context][loader]") {
    StaticLoader loader;
    loader.insert("http://example.org/a", Value::parse(R"({"@context": {"a": "http://ex/a"}})"));
    loader.insert_alias("http://example.org/old", "http://example.org/a");

    SECTION("registered documents") {
        REQUIRE(loader.size() == 1);
        REQUIRE(loader.contains("http://example.org/a"));
        auto result = loader.load("http://example.org/a");
        REQUIRE(result.is_ok());
        REQUIRE(result->document_url == "http://example.org/a");
        REQUIRE(result->document["@context"]["a"] == "http://ex/a");
        REQUIRE(result->content_type == "application/ld+json");
        REQUIRE_FALSE(result->context_url.has_value());
    }

    SECTION("aliases report the final IRI") {
        REQUIRE(loader.contains("http://example.org/old"));
        auto result = loader.load("http://example.org/old");
        REQUIRE(result.is_ok());
        REQUIRE(result->document_url == "http://example.org/a");
    }

    SECTION("unknown IRIs") {
        auto result = loader.load("http://example.org/b");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<LoaderError>()->iri == "http://example.org/b");
    }
}

TEST_CASE("FileLoader", "[context][loader]") {
    TempDir dir;
    dir.write("person.jsonld", R"({"@context": {"name": "http://schema.org/name"}})");
    dir.write("broken.jsonld", R"({"@context": )");

    FileLoader loader;
    loader.mount("https://example.org/contexts/", dir.path);

    SECTION("path mapping") {
        REQUIRE(loader.resolve_path("https://example.org/contexts/person.jsonld") == dir.path / "person.jsonld");
        REQUIRE_FALSE(loader.resolve_path("https://other.org/person.jsonld").has_value());
    }

    SECTION("longest prefix wins") {
        loader.mount("https://example.org/contexts/v2/", dir.path / "v2");
        REQUIRE(loader.resolve_path("https://example.org/contexts/v2/x.jsonld") == dir.path / "v2" / "x.jsonld");
    }

    SECTION("reads and parses files") {
        auto result = loader.load("https://example.org/contexts/person.jsonld");
        REQUIRE(result.is_ok());
        REQUIRE(result->document_url == "https://example.org/contexts/person.jsonld");
        REQUIRE(result->document["@context"]["name"] == "http://schema.org/name");
    }

    SECTION("missing files are not found") {
        auto result = loader.load("https://example.org/contexts/absent.jsonld");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<LoaderError>()->kind == LoaderError::Kind::NotFound);
    }

    SECTION("unmounted IRIs are not found") {
        auto result = loader.load("https://other.org/person.jsonld");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<LoaderError>()->kind == LoaderError::Kind::NotFound);
    }

    SECTION("malformed JSON fails to load") {
        auto result = loader.load("https://example.org/contexts/broken.jsonld");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<LoaderError>()->kind == LoaderError::Kind::LoadingFailed);
    }
}

TEST_CASE("CachingLoader", "[context][loader][cache]") {
    auto inner = std::make_shared<CountingLoader>();
    CachingLoader cache(inner);

    SECTION("repeated requests are served from the cache") {
        REQUIRE(cache.load("http://example.org/a").is_ok());
        REQUIRE(cache.load("http://example.org/a").is_ok());
        REQUIRE(cache.load("http://example.org/b").is_ok());
        REQUIRE(inner->calls.load() == 2);
        REQUIRE(cache.fetch_count() == 2);
        REQUIRE(cache.size() == 2);
    }

    SECTION("failures are cached") {
        REQUIRE(cache.load("http://example.org/missing").is_err());
        REQUIRE(cache.load("http://example.org/missing").is_err());
        REQUIRE(inner->calls.load() == 1);
    }

    SECTION("clear forgets outcomes") {
        REQUIRE(cache.load("http://example.org/a").is_ok());
        cache.clear();
        REQUIRE(cache.size() == 0);
        REQUIRE(cache.load("http://example.org/a").is_ok());
        REQUIRE(inner->calls.load() == 2);
    }

    SECTION("concurrent requests share one fetch") {
        std::vector<std::thread> threads;
        std::atomic<int> successes{0};
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&cache, &successes]() {
                if (cache.load("http://example.org/shared").is_ok()) {
                    ++successes;
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        REQUIRE(successes.load() == 8);
        REQUIRE(inner->calls.load() == 1);
        REQUIRE(cache.fetch_count() == 1);
    }
}

TEST_CASE("CachingLoader with a throwing inner loader", "[context][loader][cache]") {
    auto inner = std::make_shared<ThrowingLoader>();
    CachingLoader cache(inner);

    SECTION("the exception reaches the caller and is not cached") {
        REQUIRE_THROWS_AS(cache.load("http://example.org/a"), std::runtime_error);
        REQUIRE(cache.size() == 0);
        REQUIRE_THROWS_AS(cache.load("http://example.org/a"), std::runtime_error);
        REQUIRE(inner->calls.load() == 2);
    }

    SECTION("waiting requests see the same exception") {
        std::vector<std::thread> threads;
        std::atomic<int> failures{0};
        for (int i = 0; i < 6; ++i) {
            threads.emplace_back([&cache, &failures]() {
                try {
                    (void)cache.load("http://example.org/shared");
                } catch (const std::runtime_error&) {
                    ++failures;
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        REQUIRE(failures.load() == 6);
        REQUIRE(cache.size() == 0);
    }
}
