// bird_typefix/report/json_report.cpp
#include "bird_typefix/report/json_report.hpp"

#include <string>

#include "bird_typefix/report/scan_diagnostics.hpp"

namespace bird_typefix
{

using json = nlohmann::json;

namespace
{

json decision_to_json(const FunctionTypeDecision & d, const SourceFile & source)
{
  json j;
  j["name"] = d.function.name;
  j["line"] = source.get_line_column(d.function.keyword_range.begin_offset()).line;
  j["decision"] = std::string(to_string(d.kind));
  if (d.kind == DecisionKind::Insert) {
    j["type"] = std::string(type_name(d.type));
  } else {
    j["reason"] = d.reason;
  }
  return j;
}

json error_to_json(const ScanError & e, const SourceFile & source)
{
  const LineColumn lc = source.get_line_column(e.range.begin_offset());
  json j;
  j["kind"] = std::string(to_string(e.kind));
  j["code"] = std::string(code_for(e.kind));
  j["line"] = lc.line;
  j["column"] = lc.column;
  j["message"] = e.message;
  if (!e.function_name.empty()) {
    j["function"] = e.function_name;
  }
  return j;
}

}  // namespace

json report_to_json(const ScanReport & report, const SourceFile & source)
{
  json out;
  out["functions"] = json::array();
  for (const auto & d : report.decisions) {
    out["functions"].push_back(decision_to_json(d, source));
  }
  out["errors"] = json::array();
  for (const auto & e : report.errors) {
    out["errors"].push_back(error_to_json(e, source));
  }
  return out;
}

std::string dump_json(const json & j)
{
  return j.dump(2, ' ', false, json::error_handler_t::replace);
}

}  // namespace bird_typefix
