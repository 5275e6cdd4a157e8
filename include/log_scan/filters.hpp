#pragma once
#include "log_scan/value.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lscan {

// A record is rejected only when a filter returns exactly `false`.
using Filter = std::function<Value(const Value&)>;

// (record, records emitted so far) -> next record.
using Mapper = std::function<Value(Value, std::uint64_t)>;

class FilterChain {
public:
  // Throws ConfigError{InvalidFilterType} on an empty function.
  void add(Filter f);

  // True unless some filter returns boolean false; stops at the first one that does.
  bool pass(const Value& record) const;

  std::size_t size() const noexcept { return filters_.size(); }

private:
  std::vector<Filter> filters_;
};

class MapperChain {
public:
  // Throws ConfigError{InvalidMapperType} on an empty function.
  void add(Mapper m);

  Value apply(Value record, std::uint64_t emitted) const;

  std::size_t size() const noexcept { return mappers_.size(); }

private:
  std::vector<Mapper> mappers_;
};

// A point in time given as ISO-8601 text, a clock value, or epoch millis.
class TimeBound {
public:
  TimeBound(const char* iso) : text_(iso) {}
  TimeBound(std::string iso) : text_(std::move(iso)) {}
  TimeBound(std::chrono::system_clock::time_point tp)
    : ms_(std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count()) {}

  static TimeBound from_epoch_ms(std::int64_t ms) { TimeBound b(""); b.ms_ = ms; return b; }

  // Throws ConfigError{InvalidBound} when the text does not parse.
  std::int64_t epoch_ms() const;

private:
  std::string text_;
  std::optional<std::int64_t> ms_;
};

struct TimestampBounds {
  std::optional<TimeBound> from;
  std::optional<TimeBound> until;
};

// Inclusive [from, until] check on the record's `timestamp` (string -> ISO-8601,
// number -> epoch millis). Missing/null timestamps are rejected; any other
// unparseable value throws DecodeError.
// Throws ConfigError{MissingBound} when neither bound is set.
Filter make_timestamp_filter(const TimestampBounds& bounds);

}
