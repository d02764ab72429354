// purets/test_support/parse_helpers.hpp - helpers for unit tests
//
// These helpers provide a single-file parsing pipeline for tests. The
// returned unit owns the source text, the AST arena and the diagnostics.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>

#include "purets/basic/diagnostic.hpp"
#include "purets/basic/source_manager.hpp"
#include "purets/syntax/frontend.hpp"

namespace purets::test_support
{

[[nodiscard]] inline std::unique_ptr<ParsedUnit> parse(
  std::string src, const std::filesystem::path & virtual_path = "test.ts")
{
  return parse_unit(virtual_path, std::move(src));
}

}  // namespace purets::test_support
