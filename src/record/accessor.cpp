#include "log_scan/accessor.hpp"
#include "log_scan/errors.hpp"

#include <charconv>

namespace lscan {

static std::vector<std::string> split_path(std::string_view s) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (true) {
    std::size_t pos = s.find('.', start);
    if (pos == std::string_view::npos) { out.emplace_back(s.substr(start)); break; }
    out.emplace_back(s.substr(start, pos - start));
    start = pos + 1;
  }
  return out;
}

static const Value* step(const Value& cur, const std::string& seg) {
  if (cur.is_object()) return cur.find(seg);
  if (cur.is_array() && !seg.empty()) {
    std::size_t idx = 0;
    auto [ptr, ec] = std::from_chars(seg.data(), seg.data() + seg.size(), idx);
    if (ec != std::errc() || ptr != seg.data() + seg.size()) return nullptr;
    return cur.at(idx);
  }
  return nullptr;
}

Value resolve_path(const Value& record, const std::vector<std::string>& segments) {
  const Value* cur = &record;
  for (const auto& seg : segments) {
    if (cur == nullptr || cur->is_null()) return nullptr;
    cur = step(*cur, seg);
  }
  return cur ? *cur : Value();
}

Field compile_field(const FieldSpec& spec, std::size_t position) {
  if (spec.is_fn) {
    if (!spec.fn)
      throw ConfigError(ConfigErrc::InvalidFieldSpecification, "empty accessor function");
    std::string key = spec.path.empty() ? "accessor_" + std::to_string(position) : spec.path;
    return Field{std::move(key), spec.fn};
  }

  if (spec.path.empty())
    throw ConfigError(ConfigErrc::InvalidFieldSpecification, "empty field path");

  if (spec.path.find('.') == std::string::npos) {
    std::string k = spec.path;
    return Field{spec.path, [k](const Value& r) -> Value {
      const Value* v = r.find(k);
      return v ? *v : Value();
    }};
  }

  auto segments = split_path(spec.path);
  return Field{spec.path, [segments](const Value& r) { return resolve_path(r, segments); }};
}

void Projection::add(const FieldSpec& spec) {
  fields_.push_back(compile_field(spec, fields_.size() + 1));
}

void Projection::add(const std::vector<FieldSpec>& specs) {
  // Compile all first so a bad spec leaves the projection untouched.
  std::vector<Field> compiled;
  compiled.reserve(specs.size());
  for (const auto& s : specs) compiled.push_back(compile_field(s, fields_.size() + compiled.size() + 1));
  for (auto& f : compiled) fields_.push_back(std::move(f));
}

void Projection::apply_default() {
  if (!fields_.empty()) return;
  add(std::vector<FieldSpec>{"timestamp", "level", "message"});
}

std::vector<std::string> Projection::keys() const {
  std::vector<std::string> out;
  out.reserve(fields_.size());
  for (const auto& f : fields_) out.push_back(f.key);
  return out;
}

std::vector<Value> Projection::extract(const Value& record) const {
  std::vector<Value> out;
  out.reserve(fields_.size());
  for (const auto& f : fields_) out.push_back(f.get(record));
  return out;
}

Value Projection::header_record() const {
  Value h = Value::object();
  for (const auto& f : fields_) h.set(f.key, Value(f.key));
  return h;
}

}
