#pragma once
#include "log_scan/accessor.hpp"
#include "log_scan/chunk_reader.hpp"
#include "log_scan/filters.hpp"
#include "log_scan/jsonl_decoder.hpp"
#include "log_scan/scan_stats.hpp"
#include "log_scan/sinks.hpp"
#include "log_scan/value.hpp"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lscan {

enum class DecodePolicy {
  Abort,  // first bad line ends the scan with DecodeError
  Skip,   // count it as malformed and continue
};

// Streams a JSONL file through filter -> map -> project -> sink.
//
//   lscan::LogScan::Options opts;
//   opts.filename = "app.log";
//   opts.until = "2015-04-24T21:57:50";
//   lscan::LogScan(opts)
//       .add_fields({"timestamp", "req.id"})
//       .filter([](const lscan::Value& r) { return r.find("level") != nullptr; })
//       .scan();
//
// One instance performs one scan.
class LogScan {
public:
  struct Options {
    std::string filename;
    std::optional<TimeBound> from;
    std::optional<TimeBound> until;
    std::vector<FieldSpec> fields;
    std::string output;              // "csv" (default), "consoleTabbed", "stringify"
    std::shared_ptr<Sink> sink;      // overrides `output` when set
    bool quiet = false;              // no start/summary lines

    DecodePolicy on_decode_error = DecodePolicy::Abort;
    JsonlConfig jsonl;
    ChunkReader::Config reader;
    std::ostream* out = nullptr;     // built-in sink destination; std::cout when null
    std::ostream* status = nullptr;  // start/summary lines; std::cout when null
  };

  enum class State { Idle, Scanning, Done };

  // Throws ConfigError (MissingFilename, MissingBound, InvalidBound,
  // InvalidFieldSpecification).
  explicit LogScan(Options opts);

  LogScan& add_fields(const FieldSpec& spec);
  LogScan& add_fields(const std::vector<FieldSpec>& specs);
  LogScan& filter(Filter f);
  LogScan& map(Mapper m);

  // Reads `filename`.
  ScanStats scan();
  // Same pipeline over any line source.
  ScanStats scan(LineSource& source);

  const Projection& projection() const noexcept { return projection_; }
  State state() const noexcept { return state_; }

private:
  void process_line(std::string_view line);
  void emit(const Value& record, bool is_header);

  Options opts_;
  Projection projection_;
  FilterChain filters_;
  MapperChain mappers_;
  std::shared_ptr<Sink> sink_;
  std::unique_ptr<JsonlDecoder> decoder_;
  ScanCounters counters_;
  State state_ = State::Idle;
};

}
