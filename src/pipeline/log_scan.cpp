#include "log_scan/log_scan.hpp"
#include "log_scan/errors.hpp"

#include <iostream>
#include <utility>

namespace lscan {

LogScan::LogScan(Options opts)
  : opts_(std::move(opts)),
    decoder_(std::make_unique<JsonlDecoder>(opts_.jsonl)) {
  if (opts_.filename.empty())
    throw ConfigError(ConfigErrc::MissingFilename, "filename required in options");

  if (opts_.sink) {
    sink_ = opts_.sink;
  } else {
    std::ostream& out = opts_.out ? *opts_.out : std::cout;
    const std::string name = opts_.output.empty() ? "csv" : opts_.output;
    sink_ = make_builtin_sink(name, out);
    if (!sink_) {
      std::ostream& warn = opts_.status ? *opts_.status : std::cerr;
      if (!opts_.quiet) warn << "[scan] unknown output '" << name << "', using csv\n";
      sink_ = make_builtin_sink("csv", out);
    }
  }

  // Installed first so it always runs before caller filters.
  if (opts_.from || opts_.until)
    filters_.add(make_timestamp_filter(TimestampBounds{opts_.from, opts_.until}));

  if (!opts_.fields.empty()) projection_.add(opts_.fields);
}

LogScan& LogScan::add_fields(const FieldSpec& spec) {
  projection_.add(spec);
  return *this;
}

LogScan& LogScan::add_fields(const std::vector<FieldSpec>& specs) {
  projection_.add(specs);
  return *this;
}

LogScan& LogScan::filter(Filter f) {
  filters_.add(std::move(f));
  return *this;
}

LogScan& LogScan::map(Mapper m) {
  mappers_.add(std::move(m));
  return *this;
}

ScanStats LogScan::scan() {
  ChunkReader reader(opts_.filename, opts_.reader);
  return scan(reader);
}

ScanStats LogScan::scan(LineSource& source) {
  if (state_ != State::Idle)
    throw ScanStateError("scan() already ran on this instance");
  state_ = State::Scanning;

  std::ostream& status = opts_.status ? *opts_.status : std::cout;

  projection_.apply_default();
  counters_.start();
  if (!opts_.quiet) status << "Starting scan..." << std::endl;

  // Header: a one-off pseudo-record whose values are the display keys.
  emit(projection_.header_record(), true);

  try {
    source.for_each_line([this](std::string_view line) { process_line(line); });
  } catch (...) {
    // Rows already written stay written; make sure they reach the stream.
    sink_->flush();
    throw;
  }
  sink_->flush();
  state_ = State::Done;

  ScanStats stats = counters_.snapshot(source.bytes_read());
  if (!opts_.quiet) {
    status << "Done.  Scanned " << stats.lines << " lines, output " << stats.output;
    if (stats.malformed) status << ", skipped " << stats.malformed << " malformed";
    status << std::endl;
  }
  return stats;
}

void LogScan::process_line(std::string_view line) {
  counters_.add_line();
  const std::uint64_t line_no = counters_.lines();

  Value record;
  try {
    record = decoder_->decode(line, line_no);
    if (record.is_object()) record.set("_line", Value(line_no));
    if (!filters_.pass(record)) {
      counters_.add_filtered();
      return;
    }
  } catch (const DecodeError& e) {
    if (opts_.on_decode_error == DecodePolicy::Abort) throw;
    counters_.add_malformed();
    if (!opts_.quiet) std::cerr << "[scan] skip malformed " << e.what() << "\n";
    return;
  }

  record = mappers_.apply(std::move(record), counters_.output());
  emit(record, false);
  counters_.add_output();
}

void LogScan::emit(const Value& record, bool is_header) {
  std::vector<Value> values;
  if (is_header) {
    values.reserve(projection_.size());
    for (const auto& f : projection_.fields()) values.emplace_back(f.key);
  } else {
    values = projection_.extract(record);
  }
  sink_->emit(Row{record, values, projection_, is_header});
}

}
