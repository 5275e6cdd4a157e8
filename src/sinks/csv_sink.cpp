#include "log_scan/sinks.hpp"
#include <ostream>

namespace lscan {

std::string to_text(const Value& v) {
  switch (v.kind()) {
    case Value::Kind::Null:   return "null";
    case Value::Kind::Bool:   return v.as_bool() ? "true" : "false";
    case Value::Kind::Int:    return std::to_string(v.as_int());
    case Value::Kind::Double: return format_number(v.as_double());
    case Value::Kind::String: return v.as_string();
    default:                  return v.to_json();
  }
}

std::string CsvSink::render_cell(const Value& v) {
  if (v.is_null()) return std::string();
  std::string s = to_text(v);
  if (v.is_bool() || v.is_number()) return s;
  if (s.find(',') == std::string::npos && s.find('\n') == std::string::npos) return s;

  std::string out;
  out.reserve(s.size() + 2);
  out += '"';
  for (char c : s) {
    if (c == '"') out += '\\';
    out += c;
  }
  out += '"';
  return out;
}

void CsvSink::emit(const Row& row) {
  std::string line;
  for (size_t i = 0; i < row.values.size(); ++i) {
    if (i) line += ',';
    line += render_cell(row.values[i]);
  }
  line += '\n';
  out_ << line;
}

void CsvSink::flush() { out_.flush(); }

}
