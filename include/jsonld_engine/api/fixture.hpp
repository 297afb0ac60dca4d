#pragma once

/// @file fixture.hpp
/// @brief Conformance fixtures
///
/// A fixture is one manifest entry of a conformance suite: an input document,
/// an optional context, options, and either an expected output or an
/// expected error code. Documents referenced by the entry are resolved against
/// the manifest's base IRI and retrieved through a loader.

#include "options.hpp"
#include <jsonld_engine/context/loader.hpp>
#include <jsonld_engine/core/error.hpp>
#include <jsonld_engine/core/value.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace jsonld_api {

/// Algorithm a fixture exercises
enum class FixtureKind : std::uint8_t {
    Expand,
    Compact,
};

/// Get kind name ("expand" / "compact")
[[nodiscard]] const char* fixture_kind_name(FixtureKind kind) noexcept;

/// One conformance test case
struct Fixture {
    std::string id;
    std::string name;
    FixtureKind kind = FixtureKind::Expand;

    jsonld_core::Value input;
    std::optional<jsonld_core::Value> context;

    /// Expected output (positive tests)
    std::optional<jsonld_core::Value> expected;

    /// Expected error (negative tests)
    std::optional<jsonld_core::ErrorCode> expected_error;

    JsonLdOptions options;

    /// Read a manifest entry.
    ///
    /// "input", "context", "expect" and a string "expandContext" option are IRIs
    /// relative to @p manifest_base. The input's URL becomes the default base.
    [[nodiscard]] static jsonld_core::Result<Fixture> from_json(
        const jsonld_core::Value& entry,
        const jsonld_context::LoaderPtr& loader,
        const std::string& manifest_base);
};

/// Result of running a fixture
struct FixtureOutcome {
    bool passed = false;
    std::optional<jsonld_core::Value> output;
    std::optional<jsonld_core::Error> error;
    std::string message;
};

/// Run a fixture and compare the outcome with its expectation
[[nodiscard]] FixtureOutcome run_fixture(const Fixture& fixture);

} // namespace jsonld_api
