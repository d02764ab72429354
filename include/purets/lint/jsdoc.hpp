// purets/lint/jsdoc.hpp - Documentation block lookup and @param extraction
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include <gsl/span>

#include "purets/ast/ast.hpp"

namespace purets::lint
{

/**
 * Find the documentation block immediately preceding `offset`.
 *
 * Only whitespace and the `export` / `default` keywords may separate the
 * block from the declaration.
 *
 * @return The full comment text including delimiters, or nullopt
 */
[[nodiscard]] std::optional<std::string_view> find_doc_comment(
  std::string_view source, gsl::span<const Comment> comments, uint32_t offset);

/**
 * Names documented by `@param` tags, in order.
 *
 * Understands `@param name`, `@param {T} name - text` and optional
 * parameters written as `[name]` or `[name=default]`.
 */
[[nodiscard]] std::vector<std::string_view> extract_param_tags(std::string_view doc);

}  // namespace purets::lint
