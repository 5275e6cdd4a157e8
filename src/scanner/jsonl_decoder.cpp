#include "log_scan/jsonl_decoder.hpp"
#include "log_scan/errors.hpp"

#include <simdjson.h>
#include <string>
#include <string_view>
#include <utility>

namespace lscan {

namespace od = simdjson::ondemand;

static Value convert(od::value v);

static Value convert_number(od::value v) {
  auto r = v.get_number();
  if (r.error() == simdjson::BIGINT_ERROR) return Value(double(v.get_double()));
  od::number n = r.value();
  if (n.is_int64())  return Value(n.get_int64());
  if (n.is_uint64()) return Value(static_cast<double>(n.get_uint64()));
  return Value(n.as_double());
}

static Value convert(od::value v) {
  od::json_type t = v.type();
  switch (t) {
    case od::json_type::object: {
      Value obj = Value::object();
      for (auto field_result : v.get_object()) {
        od::field field = std::move(field_result);
        std::string_view k = field.unescaped_key();
        obj.set(std::string(k), convert(field.value()));
      }
      return obj;
    }
    case od::json_type::array: {
      Value::Array arr;
      for (auto el : v.get_array()) {
        od::value ev = std::move(el);
        arr.push_back(convert(ev));
      }
      return Value(std::move(arr));
    }
    case od::json_type::number:
      return convert_number(v);
    case od::json_type::string: {
      std::string_view s = v.get_string();
      return Value(s);
    }
    case od::json_type::boolean:
      return Value(bool(v.get_bool()));
    case od::json_type::null:
      // type() only peeks at the first byte; is_null() validates the literal.
      if (!bool(v.is_null())) break;
      return Value();
    default:
      break;
  }
  throw simdjson::simdjson_error(simdjson::INCORRECT_TYPE);
}

// Scalar documents cannot be read through get_value() on every simdjson release.
static Value convert_scalar(od::document& doc, od::json_type t) {
  switch (t) {
    case od::json_type::number: {
      auto r = doc.get_number();
      if (r.error() == simdjson::BIGINT_ERROR) return Value(double(doc.get_double()));
      od::number n = r.value();
      if (n.is_int64())  return Value(n.get_int64());
      if (n.is_uint64()) return Value(static_cast<double>(n.get_uint64()));
      return Value(n.as_double());
    }
    case od::json_type::string: {
      std::string_view s = doc.get_string();
      return Value(s);
    }
    case od::json_type::boolean:
      return Value(bool(doc.get_bool()));
    case od::json_type::null:
      if (!bool(doc.is_null())) break;
      return Value();
    default:
      break;
  }
  throw simdjson::simdjson_error(simdjson::INCORRECT_TYPE);
}

struct JsonlDecoder::Impl {
  explicit Impl(JsonlConfig c) : cfg(c) {}

  JsonlConfig cfg;
  od::parser parser;
  std::string scratch;
};

JsonlDecoder::JsonlDecoder(JsonlConfig cfg) : p_(std::make_unique<Impl>(cfg)) {}

JsonlDecoder::~JsonlDecoder() = default;

Value JsonlDecoder::decode(std::string_view line, std::uint64_t line_no) {
  p_->scratch.assign(line.data(), line.size());
  p_->scratch.resize(line.size() + simdjson::SIMDJSON_PADDING, '\0');
  simdjson::padded_string_view view(p_->scratch.data(), line.size(), p_->scratch.size());

  Value out;
  try {
    od::document doc = p_->parser.iterate(view);
    od::json_type t = doc.type();
    if (p_->cfg.strict && t != od::json_type::object)
      throw DecodeError(line_no, "not a JSON object");
    if (t == od::json_type::object || t == od::json_type::array) {
      od::value root = doc.get_value();
      out = convert(root);
    } else {
      out = convert_scalar(doc, t);
    }
    if (!doc.at_end()) throw DecodeError(line_no, "trailing content after JSON value");
  } catch (const simdjson::simdjson_error& e) {
    throw DecodeError(line_no, e.what());
  }
  return out;
}

}
