#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace lscan {

// Owned, dynamically shaped JSON value. Objects keep key insertion order.
class Value {
public:
  using Array  = std::vector<Value>;
  using Member = std::pair<std::string, Value>;
  using Object = std::vector<Member>;

  enum class Kind { Null, Bool, Int, Double, String, Array, Object };

  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool b) : v_(b) {}
  template <typename T,
            std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
  Value(T n) : v_(static_cast<std::int64_t>(n)) {}
  Value(double d) : v_(d) {}
  Value(const char* s) : v_(std::string(s)) {}
  Value(std::string_view s) : v_(std::string(s)) {}
  Value(std::string s) : v_(std::move(s)) {}
  Value(Array a) : v_(std::move(a)) {}
  Value(Object o) : v_(std::move(o)) {}

  static Value object() { return Value(Object{}); }
  static Value array()  { return Value(Array{}); }

  Kind kind() const noexcept { return static_cast<Kind>(v_.index()); }

  bool is_null()   const noexcept { return kind() == Kind::Null; }
  bool is_bool()   const noexcept { return kind() == Kind::Bool; }
  bool is_int()    const noexcept { return kind() == Kind::Int; }
  bool is_double() const noexcept { return kind() == Kind::Double; }
  bool is_number() const noexcept { return is_int() || is_double(); }
  bool is_string() const noexcept { return kind() == Kind::String; }
  bool is_array()  const noexcept { return kind() == Kind::Array; }
  bool is_object() const noexcept { return kind() == Kind::Object; }

  // Exactly boolean false; the only filter result that rejects a record.
  bool is_false() const noexcept { return is_bool() && !std::get<bool>(v_); }

  // Typed access; throws std::bad_variant_access on a kind mismatch.
  bool                as_bool()   const { return std::get<bool>(v_); }
  std::int64_t        as_int()    const { return std::get<std::int64_t>(v_); }
  double              as_double() const { return std::get<double>(v_); }
  const std::string&  as_string() const { return std::get<std::string>(v_); }
  const Array&        as_array()  const { return std::get<Array>(v_); }
  Array&              as_array()        { return std::get<Array>(v_); }
  const Object&       as_object() const { return std::get<Object>(v_); }
  Object&             as_object()       { return std::get<Object>(v_); }

  // Int or Double widened to double.
  double number() const;

  // Object lookup; nullptr when this is not an object or the key is absent.
  const Value* find(std::string_view key) const;
  Value*       find(std::string_view key);

  // Array lookup; nullptr when out of range or not an array.
  const Value* at(std::size_t i) const;

  // Insert or overwrite in place (keeps the original position). No-op on non-objects.
  void set(std::string key, Value v);

  std::size_t size() const noexcept;

  // Compact JSON text.
  std::string to_json() const;

  friend bool operator==(const Value& a, const Value& b) { return a.v_ == b.v_; }
  friend bool operator!=(const Value& a, const Value& b) { return !(a == b); }

private:
  std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Array, Object> v_;
};

// Append compact JSON for `v` to `out`.
void write_json(std::string& out, const Value& v);

// Shortest round-trip text for a double ("100", "0.1", "1e+21").
std::string format_number(double d);

}
