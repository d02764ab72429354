// purets/lint/lint_options.cpp - FileTraits derivation
#include "purets/lint/lint_options.hpp"

#include <algorithm>
#include <array>

namespace purets::lint
{

namespace
{

constexpr std::array<std::string_view, 6> k_test_suffixes = {
  "_test.ts", ".test.ts", ".spec.ts", "_test.tsx", ".test.tsx", ".spec.tsx",
};

bool ends_with(std::string_view s, std::string_view suffix)
{
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

}  // namespace

FileTraits FileTraits::from_path(const std::filesystem::path & path, const LintOptions & options)
{
  FileTraits t;
  t.normalized_path = path.generic_string();
  std::replace(t.normalized_path.begin(), t.normalized_path.end(), '\\', '/');

  const size_t slash = t.normalized_path.rfind('/');
  t.file_name =
    slash == std::string::npos ? t.normalized_path : t.normalized_path.substr(slash + 1);
  const size_t dot = t.file_name.rfind('.');
  t.stem = dot == std::string::npos || dot == 0 ? t.file_name : t.file_name.substr(0, dot);

  const std::string anchored = "/" + t.normalized_path;
  const auto under = [&](std::string_view dir) { return anchored.find(dir) != std::string::npos; };

  t.is_error_file = under("/errors/");
  t.is_io_error_file = under("/io/errors/");
  t.is_types_file = under("/types/");
  t.is_pure_file = under("/pure/");
  t.is_io_file = under("/io/");
  t.is_test_file = std::any_of(k_test_suffixes.begin(), k_test_suffixes.end(), [&](auto s) {
    return ends_with(t.file_name, s);
  });
  t.is_index_file = t.stem == "index";
  t.is_main_entry = t.file_name == "main.ts" || options.is_main_entry;
  t.is_entry_point = t.is_index_file || options.is_entry_point || options.is_main_entry;
  t.test_runner = options.test_runner;
  return t;
}

std::string_view FileTraits::tested_name() const
{
  std::string_view name = file_name;
  for (std::string_view suffix : k_test_suffixes) {
    if (ends_with(name, suffix)) {
      name.remove_suffix(suffix.size());
      return name;
    }
  }
  return stem;
}

}  // namespace purets::lint
