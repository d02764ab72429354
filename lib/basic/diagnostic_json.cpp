// purets/basic/diagnostic_json.cpp - JSON serialization implementation
//
#include "purets/basic/diagnostic_json.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace purets
{

using nlohmann::json;

json to_json(const Diagnostic & diag, const SourceFile & source)
{
  const SourceRange r = diag.primary_range();
  json j{
    {"file", source.get_path().generic_string()},
    {"rule", diag.code},
    {"message", diag.message},
    {"severity", "error"}};

  if (r.is_invalid()) {
    j["line"] = nullptr;
    j["column"] = nullptr;
    j["start"] = nullptr;
    j["end"] = nullptr;
    return j;
  }

  const LineColumn lc = source.get_line_column(r.get_begin());
  j["line"] = lc.line;
  j["column"] = lc.column;
  j["start"] = r.get_begin().get_offset();
  j["end"] = r.get_end().get_offset();
  return j;
}

json to_json(const DiagnosticBag & diags, const SourceFile & source)
{
  json arr = json::array();
  for (const auto & d : diags) {
    arr.push_back(to_json(d, source));
  }
  return arr;
}

}  // namespace purets
