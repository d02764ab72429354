// purets/lint/directives.cpp - Directive scanning
#include "purets/lint/directives.hpp"

#include <algorithm>

namespace purets::lint
{

namespace
{

bool is_space(char c)
{
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

std::string_view trim(std::string_view s)
{
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  return s;
}

/// Calls `fn(line_index, trimmed_line)` for every line of `source`.
template <typename Fn>
void for_each_line(std::string_view source, Fn && fn)
{
  uint32_t line = 0;
  size_t pos = 0;
  while (pos <= source.size()) {
    const size_t nl = source.find('\n', pos);
    const size_t end = nl == std::string_view::npos ? source.size() : nl;
    fn(line, trim(source.substr(pos, end - pos)));
    if (nl == std::string_view::npos) break;
    pos = nl + 1;
    ++line;
  }
}

/**
 * Text following a `// <directive>` comment in `line`, if one occurs.
 *
 * With `allow_block`, a block comment opening with the directive also
 * matches. Bare directive words outside a comment marker are ignored.
 */
bool text_after(
  std::string_view line, std::string_view directive, std::string_view & rest,
  bool allow_block = false)
{
  size_t pos = 0;
  while ((pos = line.find('/', pos)) != std::string_view::npos) {
    const bool is_marker =
      pos + 1 < line.size() && (line[pos + 1] == '/' || (allow_block && line[pos + 1] == '*'));
    if (!is_marker) {
      ++pos;
      continue;
    }
    size_t at = pos + 2;
    while (at < line.size() && (line[at] == '/' || line[at] == '*')) ++at;
    while (at < line.size() && is_space(line[at])) ++at;
    if (line.substr(at, directive.size()) == directive) {
      rest = line.substr(at + directive.size());
      return true;
    }
    pos += 2;
  }
  return false;
}

}  // namespace

std::vector<std::string> parse_rule_list(std::string_view text)
{
  std::vector<std::string> out;
  size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && (text[i] == ',' || is_space(text[i]))) ++i;
    const size_t begin = i;
    while (i < text.size() && text[i] != ',' && !is_space(text[i])) ++i;
    if (i == begin) continue;

    const std::string_view name = text.substr(begin, i - begin);
    if (name.substr(0, 2) == "*/") continue;
    out.emplace_back(name);
  }
  return out;
}

// ============================================================================
// SuppressionIndex
// ============================================================================

SuppressionIndex SuppressionIndex::from_source(std::string_view source)
{
  SuppressionIndex index;
  for_each_line(source, [&](uint32_t line, std::string_view text) {
    std::string_view rest;
    if (text_after(text, k_disable_file_directive, rest, true)) {
      index.file_disabled_ = true;
      return;
    }
    if (text_after(text, k_disable_next_line_directive, rest)) {
      index.disable(line + 1, rest);
    }
    if (text_after(text, k_disable_line_directive, rest)) {
      index.disable(line, rest);
    }
  });
  return index;
}

void SuppressionIndex::disable(uint32_t line, std::string_view rest_of_line)
{
  disabled_lines_.insert(line);
  auto rules = parse_rule_list(rest_of_line);
  if (rules.empty()) return;

  auto & overrides = line_rule_overrides_[line];
  for (auto & r : rules) {
    overrides.insert(std::move(r));
  }
}

bool SuppressionIndex::is_line_disabled(uint32_t line) const
{
  return file_disabled_ || disabled_lines_.count(line) > 0;
}

bool SuppressionIndex::is_rule_disabled(uint32_t line, std::string_view rule) const
{
  if (file_disabled_) return true;

  const auto it = line_rule_overrides_.find(line);
  if (disabled_lines_.count(line) > 0) {
    if (it == line_rule_overrides_.end() || it->second.empty()) return true;
    return it->second.find(rule) != it->second.end();
  }
  return it != line_rule_overrides_.end() && it->second.find(rule) != it->second.end();
}

// ============================================================================
// ExpectErrorIndex
// ============================================================================

ExpectErrorIndex ExpectErrorIndex::from_source(std::string_view source)
{
  ExpectErrorIndex index;
  for_each_line(source, [&](uint32_t line, std::string_view text) {
    std::string_view rest;
    if (!text_after(text, k_expect_error_directive, rest)) return;

    auto rules = parse_rule_list(rest);
    if (!rules.empty()) {
      index.expected_[line + 1] = std::move(rules);
    }
  });
  return index;
}

bool ExpectErrorIndex::is_error_expected(uint32_t line, std::string_view rule) const
{
  const auto it = expected_.find(line);
  if (it == expected_.end()) return false;
  return std::find(it->second.begin(), it->second.end(), rule) != it->second.end();
}

void ExpectErrorIndex::mark_as_triggered(uint32_t line, std::string_view rule)
{
  triggered_[line].emplace_back(rule);
}

std::vector<ExpectErrorIndex::LineRules> ExpectErrorIndex::get_untriggered_errors() const
{
  std::vector<LineRules> out;
  for (const auto & [line, rules] : expected_) {
    const auto trig = triggered_.find(line);
    std::vector<std::string> missing;
    for (const auto & r : rules) {
      const bool fired = trig != triggered_.end() &&
                         std::find(trig->second.begin(), trig->second.end(), r) !=
                           trig->second.end();
      if (!fired) missing.push_back(r);
    }
    if (!missing.empty()) {
      out.emplace_back(line, std::move(missing));
    }
  }
  return out;
}

}  // namespace purets::lint
