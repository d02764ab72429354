// purets/lint/directives.hpp - Comment directives scanned from raw source text
//
// Directives are found by scanning lines of text, independently of the
// parsed tree:
//
//   // purets-disable-file
//   // purets-disable-next-line [rule, rule...]
//   // purets-disable-line [rule, rule...]
//   // purets-expect-error rule [rule...]
//
// A directive counts only after a `//` marker; `purets-disable-file` may
// also open a block comment. The words alone, e.g. inside a string, do
// nothing.
//
// All line numbers in this header are 0-indexed.
//
#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace purets::lint
{

inline constexpr std::string_view k_disable_file_directive = "purets-disable-file";
inline constexpr std::string_view k_disable_next_line_directive = "purets-disable-next-line";
inline constexpr std::string_view k_disable_line_directive = "purets-disable-line";
inline constexpr std::string_view k_expect_error_directive = "purets-expect-error";

/**
 * Split the text following a directive into rule names.
 *
 * Names are separated by commas or whitespace. Empty names and the token
 * closing a block comment are dropped.
 */
[[nodiscard]] std::vector<std::string> parse_rule_list(std::string_view text);

// ============================================================================
// SuppressionIndex
// ============================================================================

/**
 * Lines and rules silenced by disable directives.
 *
 * Built once per file before linting; read-only afterwards.
 */
class SuppressionIndex
{
public:
  [[nodiscard]] static SuppressionIndex from_source(std::string_view source);

  [[nodiscard]] bool is_file_disabled() const noexcept { return file_disabled_; }

  [[nodiscard]] bool is_line_disabled(uint32_t line) const;

  /**
   * Whether `rule` is silenced on `line`.
   *
   * A disabled line with a rule list silences only the listed rules; a
   * disabled line without one silences everything.
   */
  [[nodiscard]] bool is_rule_disabled(uint32_t line, std::string_view rule) const;

private:
  void disable(uint32_t line, std::string_view rest_of_line);

  std::set<uint32_t> disabled_lines_;
  std::map<uint32_t, std::set<std::string, std::less<>>> line_rule_overrides_;
  bool file_disabled_ = false;
};

// ============================================================================
// ExpectErrorIndex
// ============================================================================

/**
 * Violations a file declares it expects, and the ones actually observed.
 *
 * A `purets-expect-error` comment on line N expects the listed rules on
 * line N + 1.
 */
class ExpectErrorIndex
{
public:
  using LineRules = std::pair<uint32_t, std::vector<std::string>>;

  [[nodiscard]] static ExpectErrorIndex from_source(std::string_view source);

  [[nodiscard]] bool is_error_expected(uint32_t line, std::string_view rule) const;

  void mark_as_triggered(uint32_t line, std::string_view rule);

  /// Expected rules that never fired, grouped by line in ascending order.
  [[nodiscard]] std::vector<LineRules> get_untriggered_errors() const;

  [[nodiscard]] bool empty() const noexcept { return expected_.empty(); }

private:
  std::map<uint32_t, std::vector<std::string>> expected_;
  std::map<uint32_t, std::vector<std::string>> triggered_;
};

}  // namespace purets::lint
