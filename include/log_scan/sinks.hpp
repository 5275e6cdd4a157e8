#pragma once
#include "log_scan/accessor.hpp"
#include "log_scan/value.hpp"

#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace lscan {

// What a sink gets for each emission. For the header row, `record` is the
// synthetic {key: key, ...} object and `values` are the display keys.
struct Row {
  const Value&              record;
  const std::vector<Value>& values;
  const Projection&         projection;
  bool                      is_header;
};

// Base interface for output sinks. Exceptions thrown by emit() propagate
// out of the scan unchanged.
class Sink {
public:
  virtual ~Sink() = default;

  virtual void emit(const Row& row) = 0;

  virtual void flush() {}
};

// Comma-joined projected values, one line per row. A string containing ',' or
// '\n' is wrapped in '"' with inner '"' written as '\"' (not RFC 4180).
class CsvSink : public Sink {
public:
  explicit CsvSink(std::ostream& out) : out_(out) {}
  void emit(const Row& row) override;
  void flush() override;

  // One cell, as written to the line.
  static std::string render_cell(const Value& v);

private:
  std::ostream& out_;
};

// Space-separated projected values, one line per row.
class TabbedSink : public Sink {
public:
  explicit TabbedSink(std::ostream& out) : out_(out) {}
  void emit(const Row& row) override;
  void flush() override;

private:
  std::ostream& out_;
};

// The whole record as compact JSON, one line per row.
class RawJsonSink : public Sink {
public:
  explicit RawJsonSink(std::ostream& out) : out_(out) {}
  void emit(const Row& row) override;
  void flush() override;

private:
  std::ostream& out_;
};

class FunctionSink : public Sink {
public:
  using Fn = std::function<void(const Row&)>;
  explicit FunctionSink(Fn fn) : fn_(std::move(fn)) {}
  void emit(const Row& row) override { fn_(row); }

private:
  Fn fn_;
};

// Text form of a value outside JSON: strings raw, containers as compact JSON.
std::string to_text(const Value& v);

// "csv", "consoleTabbed", "stringify"; nullptr for anything else.
std::unique_ptr<Sink> make_builtin_sink(std::string_view name, std::ostream& out);

}
