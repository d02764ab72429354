// purets/lint/jsdoc.cpp - Documentation block helpers
#include "purets/lint/jsdoc.hpp"

namespace purets::lint
{

namespace
{

bool is_space(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

std::string_view trim(std::string_view s)
{
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  return s;
}

/// True if `gap` holds nothing but whitespace and export keywords.
bool is_declaration_prefix(std::string_view gap)
{
  gap = trim(gap);
  while (!gap.empty()) {
    size_t end = 0;
    while (end < gap.size() && !is_space(gap[end])) ++end;
    const std::string_view word = gap.substr(0, end);
    if (word != "export" && word != "default") return false;
    gap = trim(gap.substr(end));
  }
  return true;
}

}  // namespace

std::optional<std::string_view> find_doc_comment(
  std::string_view source, gsl::span<const Comment> comments, uint32_t offset)
{
  const Comment * last = nullptr;
  for (const Comment & c : comments) {
    if (c.range.get_end().get_offset() > offset) break;
    last = &c;
  }
  if (!last || !last->isBlock) return std::nullopt;

  const uint32_t begin = last->range.get_begin().get_offset();
  const uint32_t end = last->range.get_end().get_offset();
  if (end > source.size() || offset > source.size()) return std::nullopt;

  const std::string_view text = source.substr(begin, end - begin);
  if (text.substr(0, 3) != "/**" || text == "/**/") return std::nullopt;
  if (!is_declaration_prefix(source.substr(end, offset - end))) return std::nullopt;
  return text;
}

std::vector<std::string_view> extract_param_tags(std::string_view doc)
{
  constexpr std::string_view k_param_tag = "@param";

  std::vector<std::string_view> names;
  size_t pos = 0;
  while (pos < doc.size()) {
    const size_t nl = doc.find('\n', pos);
    const size_t line_end = nl == std::string_view::npos ? doc.size() : nl;
    std::string_view line = trim(doc.substr(pos, line_end - pos));
    pos = line_end + 1;

    while (!line.empty() && (line.front() == '*' || line.front() == '/')) line.remove_prefix(1);
    line = trim(line);
    if (line.substr(0, k_param_tag.size()) != k_param_tag) continue;
    line = trim(line.substr(k_param_tag.size()));

    // Optional `{Type}`; braces may nest.
    if (!line.empty() && line.front() == '{') {
      int depth = 0;
      size_t i = 0;
      for (; i < line.size(); ++i) {
        if (line[i] == '{') ++depth;
        if (line[i] == '}' && --depth == 0) break;
      }
      line = trim(i < line.size() ? line.substr(i + 1) : std::string_view{});
    }

    size_t end = 0;
    while (end < line.size() && !is_space(line[end])) ++end;
    std::string_view name = line.substr(0, end);

    if (!name.empty() && name.front() == '[') {
      name.remove_prefix(1);
      const size_t close = name.find_first_of("=]");
      name = name.substr(0, close);
    }
    if (const size_t close = name.find("*/"); close != std::string_view::npos) {
      name = name.substr(0, close);
    }
    if (!name.empty()) names.push_back(name);
  }
  return names;
}

}  // namespace purets::lint
