// purets/lint/test_runner.cpp - Test runner tables
#include "purets/lint/test_runner.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace purets::lint
{

namespace
{

constexpr std::array<std::string_view, 2> k_vitest_imports = {"vitest", "@vitest/"};
constexpr std::array<std::string_view, 2> k_node_test_imports = {"node:test", "node:assert"};
constexpr std::array<std::string_view, 6> k_deno_test_imports = {
  "deno.land/std/testing", "deno.land/std/assert", "@std/expect",
  "@std/assert",           "jsr:@std/expect",      "jsr:@std/assert",
};

constexpr std::array<std::string_view, 5> k_vitest_functions = {
  "describe", "it", "test", "beforeEach", "afterEach"};
constexpr std::array<std::string_view, 5> k_node_test_functions = {
  "describe", "it", "test", "before", "after"};
constexpr std::array<std::string_view, 1> k_deno_test_functions = {"Deno.test"};

template <size_t N>
gsl::span<const std::string_view> as_span(const std::array<std::string_view, N> & a) noexcept
{
  return {a.data(), a.size()};
}

}  // namespace

std::optional<TestRunner> parse_test_runner(std::string_view name)
{
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  for (TestRunner r : k_all_test_runners) {
    if (to_string(r) == lower) return r;
  }
  return std::nullopt;
}

std::string_view to_string(TestRunner runner) noexcept
{
  switch (runner) {
    case TestRunner::Vitest:
      return "vitest";
    case TestRunner::NodeTest:
      return "node-test";
    case TestRunner::DenoTest:
      return "deno-test";
  }
  return "";
}

gsl::span<const std::string_view> import_patterns(TestRunner runner) noexcept
{
  switch (runner) {
    case TestRunner::Vitest:
      return as_span(k_vitest_imports);
    case TestRunner::NodeTest:
      return as_span(k_node_test_imports);
    case TestRunner::DenoTest:
      return as_span(k_deno_test_imports);
  }
  return {};
}

bool matches_import(TestRunner runner, std::string_view source) noexcept
{
  const auto patterns = import_patterns(runner);
  return std::any_of(patterns.begin(), patterns.end(), [source](std::string_view p) {
    return source.find(p) != std::string_view::npos;
  });
}

gsl::span<const std::string_view> test_functions(TestRunner runner) noexcept
{
  switch (runner) {
    case TestRunner::Vitest:
      return as_span(k_vitest_functions);
    case TestRunner::NodeTest:
      return as_span(k_node_test_functions);
    case TestRunner::DenoTest:
      return as_span(k_deno_test_functions);
  }
  return {};
}

}  // namespace purets::lint
