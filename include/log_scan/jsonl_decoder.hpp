#pragma once
#include "log_scan/value.hpp"

#include <cstdint>
#include <memory>
#include <string_view>

namespace lscan {

struct JsonlConfig {
  bool strict = false;  // when set, scalar and array lines are decode errors
};

// Decodes one JSON document per line into an owned Value. The simdjson parser
// and padding buffer are reused across lines.
class JsonlDecoder {
public:
  explicit JsonlDecoder(JsonlConfig cfg = {});
  ~JsonlDecoder();

  JsonlDecoder(const JsonlDecoder&) = delete;
  JsonlDecoder& operator=(const JsonlDecoder&) = delete;

  // Throws DecodeError (tagged with `line_no`) on invalid JSON, trailing
  // content, or a non-object line in strict mode.
  Value decode(std::string_view line, std::uint64_t line_no);

private:
  struct Impl;
  std::unique_ptr<Impl> p_;
};

}
