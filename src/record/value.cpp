#include "log_scan/value.hpp"
#include <charconv>
#include <cmath>
#include <cstdio>

namespace lscan {

double Value::number() const {
  if (is_int()) return static_cast<double>(as_int());
  return as_double();
}

const Value* Value::find(std::string_view key) const {
  if (!is_object()) return nullptr;
  for (const auto& m : std::get<Object>(v_)) if (m.first == key) return &m.second;
  return nullptr;
}

Value* Value::find(std::string_view key) {
  if (!is_object()) return nullptr;
  for (auto& m : std::get<Object>(v_)) if (m.first == key) return &m.second;
  return nullptr;
}

const Value* Value::at(std::size_t i) const {
  if (!is_array()) return nullptr;
  const auto& a = std::get<Array>(v_);
  return i < a.size() ? &a[i] : nullptr;
}

void Value::set(std::string key, Value v) {
  if (!is_object()) return;
  if (Value* slot = find(key)) { *slot = std::move(v); return; }
  std::get<Object>(v_).emplace_back(std::move(key), std::move(v));
}

std::size_t Value::size() const noexcept {
  if (is_array())  return std::get<Array>(v_).size();
  if (is_object()) return std::get<Object>(v_).size();
  return 0;
}

std::string Value::to_json() const {
  std::string out;
  write_json(out, *this);
  return out;
}

std::string format_number(double d) {
  if (!std::isfinite(d)) return "null";
  char tmp[64];
  auto [ptr, ec] = std::to_chars(tmp, tmp + sizeof(tmp), d);
  if (ec != std::errc()) {
    int n = std::snprintf(tmp, sizeof(tmp), "%.17g", d);
    return std::string(tmp, (n > 0) ? static_cast<size_t>(n) : 0);
  }
  return std::string(tmp, ptr);
}

static void esc(std::string& o, const std::string& s) {
  static const char* hex = "0123456789abcdef";
  o += '"';
  for (char ch : s) {
    unsigned char c = static_cast<unsigned char>(ch);
    switch (c) {
      case '\\': o += "\\\\"; break;
      case '"':  o += "\\\""; break;
      case '\n': o += "\\n";  break;
      case '\r': o += "\\r";  break;
      case '\t': o += "\\t";  break;
      case '\b': o += "\\b";  break;
      case '\f': o += "\\f";  break;
      default:
        if (c < 0x20) { o += "\\u00"; o += hex[c >> 4]; o += hex[c & 0xF]; }
        else o += ch;
        break;
    }
  }
  o += '"';
}

void write_json(std::string& out, const Value& v) {
  switch (v.kind()) {
    case Value::Kind::Null:   out += "null"; break;
    case Value::Kind::Bool:   out += v.as_bool() ? "true" : "false"; break;
    case Value::Kind::Int:    out += std::to_string(v.as_int()); break;
    case Value::Kind::Double: out += format_number(v.as_double()); break;
    case Value::Kind::String: esc(out, v.as_string()); break;
    case Value::Kind::Array: {
      out += '[';
      bool first = true;
      for (const auto& e : v.as_array()) {
        if (!first) out += ',';
        first = false;
        write_json(out, e);
      }
      out += ']';
      break;
    }
    case Value::Kind::Object: {
      out += '{';
      bool first = true;
      for (const auto& m : v.as_object()) {
        if (!first) out += ',';
        first = false;
        esc(out, m.first);
        out += ':';
        write_json(out, m.second);
      }
      out += '}';
      break;
    }
  }
}

}
