// purets/lint/allow_features.cpp - `@allow` grant parsing
#include "purets/lint/allow_features.hpp"

namespace purets::lint
{

namespace
{

constexpr std::string_view k_allow_tag = "@allow";

bool is_blank(char c) { return c == ' ' || c == '\t' || c == '\r'; }

std::string_view trim_blank(std::string_view s)
{
  while (!s.empty() && is_blank(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_blank(s.back())) s.remove_suffix(1);
  return s;
}

/// Feature named on one documentation line, e.g. ` * @allow dom`.
std::optional<Feature> feature_on_line(std::string_view line)
{
  line = trim_blank(line);
  while (!line.empty() && line.front() == '*') line.remove_prefix(1);
  line = trim_blank(line);

  if (line.substr(0, k_allow_tag.size()) != k_allow_tag) return std::nullopt;
  line.remove_prefix(k_allow_tag.size());
  if (line.empty() || !is_blank(line.front())) return std::nullopt;

  line = trim_blank(line);
  size_t end = 0;
  while (end < line.size() && !is_blank(line[end]) && line[end] != '*') ++end;
  return parse_feature(line.substr(0, end));
}

}  // namespace

std::optional<Feature> parse_feature(std::string_view name) noexcept
{
  for (Feature f : k_all_features) {
    if (to_string(f) == name) return f;
  }
  return std::nullopt;
}

FeatureSet parse_allowed_features(std::string_view source, gsl::span<const Comment> comments)
{
  FeatureSet allowed;
  for (const Comment & c : comments) {
    if (!c.isBlock) continue;

    const auto begin = c.range.get_begin().get_offset();
    const auto end = c.range.get_end().get_offset();
    if (end > source.size() || begin >= end) continue;

    std::string_view text = source.substr(begin, end - begin);
    if (text.substr(0, 3) != "/**" || text == "/**/") continue;

    // Strip the delimiters and scan line by line.
    text.remove_prefix(3);
    if (text.size() >= 2 && text.substr(text.size() - 2) == "*/") text.remove_suffix(2);

    size_t pos = 0;
    while (pos <= text.size()) {
      const size_t nl = text.find('\n', pos);
      const size_t line_end = nl == std::string_view::npos ? text.size() : nl;
      if (auto f = feature_on_line(text.substr(pos, line_end - pos))) {
        allowed.set(*f);
      }
      if (nl == std::string_view::npos) break;
      pos = nl + 1;
    }
    break;  // only the first documentation block counts
  }
  return allowed;
}

}  // namespace purets::lint
