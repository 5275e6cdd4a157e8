#include "log_scan/filters.hpp"
#include "log_scan/date_parse.hpp"
#include "log_scan/errors.hpp"

#include <cmath>

namespace lscan {

void FilterChain::add(Filter f) {
  if (!f) throw ConfigError(ConfigErrc::InvalidFilterType, "filter must be callable");
  filters_.push_back(std::move(f));
}

bool FilterChain::pass(const Value& record) const {
  for (const auto& f : filters_) {
    if (f(record).is_false()) return false;
  }
  return true;
}

void MapperChain::add(Mapper m) {
  if (!m) throw ConfigError(ConfigErrc::InvalidMapperType, "mapper must be callable");
  mappers_.push_back(std::move(m));
}

Value MapperChain::apply(Value record, std::uint64_t emitted) const {
  for (const auto& m : mappers_) record = m(std::move(record), emitted);
  return record;
}

std::int64_t TimeBound::epoch_ms() const {
  if (ms_) return *ms_;
  auto ms = parse_iso8601_ms(text_);
  if (!ms) throw ConfigError(ConfigErrc::InvalidBound, "unparseable time '" + text_ + "'");
  return *ms;
}

static std::uint64_t line_of(const Value& r) {
  const Value* l = r.find("_line");
  return (l && l->is_int()) ? static_cast<std::uint64_t>(l->as_int()) : 0;
}

Filter make_timestamp_filter(const TimestampBounds& bounds) {
  if (!bounds.from && !bounds.until)
    throw ConfigError(ConfigErrc::MissingBound, "timestamp filter needs from or until");

  std::optional<std::int64_t> from, until;
  if (bounds.from)  from  = bounds.from->epoch_ms();
  if (bounds.until) until = bounds.until->epoch_ms();

  return [from, until](const Value& r) -> Value {
    const Value* ts = r.find("timestamp");
    if (ts == nullptr || ts->is_null()) return false;

    // Compared as double: fractional epoch millis must not round into the window.
    double t = 0.0;
    if (ts->is_string()) {
      auto ms = parse_iso8601_ms(ts->as_string());
      if (!ms) throw DecodeError(line_of(r), "unparseable timestamp '" + ts->as_string() + "'");
      t = static_cast<double>(*ms);
    } else if (ts->is_number()) {
      t = ts->number();
      if (!std::isfinite(t)) throw DecodeError(line_of(r), "timestamp is not finite");
    } else {
      throw DecodeError(line_of(r), "timestamp is not a string or number: " + ts->to_json());
    }

    if (from && t < static_cast<double>(*from)) return false;
    if (until && t > static_cast<double>(*until)) return false;
    return true;
  };
}

}
