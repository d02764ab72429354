// purets/lint/visitor_state.hpp - Traversal state shared by the lint rules
#pragma once

#include <set>
#include <string_view>
#include <vector>

#include "purets/basic/source_manager.hpp"

namespace purets::lint
{

/// A name together with the range that introduced it.
struct NamedRange
{
  std::string_view name;
  SourceRange range;
};

/**
 * State of one file's traversal.
 *
 * The scope flags are saved and restored by the rule visitor around the
 * nodes that open a scope. The collections accumulate over the whole walk
 * and are read by the post-pass. Names point into the source text.
 */
struct VisitorState
{
  // ===========================================================================
  // Scope flags
  // ===========================================================================

  bool in_function = false;
  bool in_default_parameter = false;

  // ===========================================================================
  // Exports (filled by the pre-pass)
  // ===========================================================================

  std::vector<NamedRange> exported_functions;
  std::vector<NamedRange> exported_other;
  std::set<std::string_view, std::less<>> exported_names;
  std::set<std::string_view, std::less<>> documented_overloads;

  // ===========================================================================
  // Variable usage
  // ===========================================================================

  std::vector<NamedRange> declared_vars;  ///< In declaration order
  std::vector<NamedRange> imported_bindings;
  std::set<std::string_view, std::less<>> used_names;
  std::set<std::string_view, std::less<>> imported_process_names;

  // ===========================================================================
  // Array mutability
  // ===========================================================================

  std::vector<NamedRange> array_variables;  ///< First declaration of each name
  std::set<std::string_view, std::less<>> mutated_arrays;
  std::set<std::string_view, std::less<>> readonly_arrays;

  [[nodiscard]] bool is_tracked_array(std::string_view name) const
  {
    for (const NamedRange & a : array_variables) {
      if (a.name == name) return true;
    }
    return false;
  }
};

}  // namespace purets::lint
