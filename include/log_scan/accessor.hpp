#pragma once
#include "log_scan/value.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace lscan {

using Accessor = std::function<Value(const Value&)>;

// A column as the caller describes it: a key / dotted path, or a custom accessor
// with an optional display key.
struct FieldSpec {
  FieldSpec(const char* path) : path(path) {}
  FieldSpec(std::string path) : path(std::move(path)) {}
  template <typename F,
            std::enable_if_t<std::is_invocable_r_v<Value, F, const Value&>, int> = 0>
  FieldSpec(F f) : fn(std::move(f)), is_fn(true) {}
  template <typename F,
            std::enable_if_t<std::is_invocable_r_v<Value, F, const Value&>, int> = 0>
  FieldSpec(std::string key, F f) : path(std::move(key)), fn(std::move(f)), is_fn(true) {}

  std::string path;   // path, or display key for function specs (may be empty)
  Accessor    fn;
  bool        is_fn = false;
};

// A compiled column.
struct Field {
  std::string key;
  Accessor    get;
};

// Walks `path` ("a.b.0.c") through objects and arrays; null on any miss.
Value resolve_path(const Value& record, const std::vector<std::string>& segments);

// Compile one spec. `position` is the 1-based column index, used to name
// anonymous accessors. Throws ConfigError{InvalidFieldSpecification}.
Field compile_field(const FieldSpec& spec, std::size_t position);

// Ordered list of compiled columns.
class Projection {
public:
  void add(const FieldSpec& spec);
  void add(const std::vector<FieldSpec>& specs);

  // Installs timestamp, level, message if nothing was added.
  void apply_default();

  bool empty() const noexcept { return fields_.empty(); }
  std::size_t size() const noexcept { return fields_.size(); }
  const std::vector<Field>& fields() const noexcept { return fields_; }
  std::vector<std::string> keys() const;

  std::vector<Value> extract(const Value& record) const;

  // {key: key, ...} in projection order.
  Value header_record() const;

private:
  std::vector<Field> fields_;
};

}
