// purets/basic/diagnostic_printer.hpp
//
// Prints diagnostics in the editor-friendly `file:line:col [rule] message`
// format, optionally followed by the offending source line and a caret.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "purets/basic/diagnostic.hpp"
#include "purets/basic/source_manager.hpp"

namespace purets
{

/**
 * Prints diagnostics in compact form.
 *
 * Produces output like:
 *   src/pure/add.ts:3:1 [no-classes] Classes are not allowed in pure TypeScript subset
 *     class Foo {}
 *     ^
 *
 * The source excerpt is only printed in verbose mode.
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   * @param verbose Whether to print the source line and a caret
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true, bool verbose = false);

  void print(const Diagnostic & diag, const SourceFile & source);

  /// Print all diagnostics in emission order.
  void print_all(const DiagnosticBag & diags, const SourceFile & source);

private:
  void print_location(std::string_view location);
  void print_source_excerpt(const SourceFile & source, LineColumn lc);

  [[nodiscard]] static std::string display_path(const SourceFile & source);

  std::ostream & os_;
  bool use_color_;
  bool verbose_;
};

}  // namespace purets
