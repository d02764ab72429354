// purets/lint/test_runner.hpp - Supported test runners
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

#include <gsl/span>

namespace purets::lint
{

enum class TestRunner : uint8_t {
  Vitest,
  NodeTest,
  DenoTest,
};

inline constexpr std::array<TestRunner, 3> k_all_test_runners = {
  TestRunner::Vitest, TestRunner::NodeTest, TestRunner::DenoTest};

/// Accepts `vitest`, `node-test` and `deno-test` (case-insensitive).
[[nodiscard]] std::optional<TestRunner> parse_test_runner(std::string_view name);

[[nodiscard]] std::string_view to_string(TestRunner runner) noexcept;

/// Substrings identifying an import of this runner's test API.
[[nodiscard]] gsl::span<const std::string_view> import_patterns(TestRunner runner) noexcept;

[[nodiscard]] bool matches_import(TestRunner runner, std::string_view source) noexcept;

/**
 * Top-level registration calls of this runner (`describe`, `it`, ...).
 * Dotted names such as `Deno.test` match a member call.
 */
[[nodiscard]] gsl::span<const std::string_view> test_functions(TestRunner runner) noexcept;

}  // namespace purets::lint
