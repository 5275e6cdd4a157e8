#include "log_scan/sinks.hpp"
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

static int fails = 0;

static void check(bool ok, const char* what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++fails; }
}

int main(){
  using lscan::Value;

  check(lscan::CsvSink::render_cell(Value("hello, \"world\"")) == "\"hello, \\\"world\\\"\"", "comma quoted, quotes backslashed");
  check(lscan::CsvSink::render_cell(Value("plain")) == "plain", "plain unquoted");
  check(lscan::CsvSink::render_cell(Value("say \"hi\"")) == "say \"hi\"", "quotes alone do not trigger quoting");
  check(lscan::CsvSink::render_cell(Value("a\nb")) == "\"a\nb\"", "newline quoted");
  check(lscan::CsvSink::render_cell(Value("back\\slash, x")) == "\"back\\slash, x\"", "backslash left as is");
  check(lscan::CsvSink::render_cell(Value()) == "", "null is empty");
  check(lscan::CsvSink::render_cell(Value(3)) == "3", "int");
  check(lscan::CsvSink::render_cell(Value(2.5)) == "2.5", "double");
  check(lscan::CsvSink::render_cell(Value(false)) == "false", "bool");
  check(lscan::CsvSink::render_cell(Value(Value::Array{1, 2})) == "\"[1,2]\"", "array as quoted json");

  lscan::Projection proj;
  proj.add(std::vector<lscan::FieldSpec>{"a", "b", "c"});

  Value rec = Value::object();
  rec.set("a", "x, y");
  rec.set("b", nullptr);
  rec.set("c", 1.25);
  rec.set("_line", 4);
  std::vector<Value> values = proj.extract(rec);

  {
    std::ostringstream out;
    lscan::CsvSink sink(out);
    sink.emit(lscan::Row{rec, values, proj, false});
    check(out.str() == "\"x, y\",,1.25\n", "csv row");
  }
  {
    std::ostringstream out;
    lscan::TabbedSink sink(out);
    sink.emit(lscan::Row{rec, values, proj, false});
    check(out.str() == "x, y null 1.25\n", "tabbed row");
  }
  {
    std::ostringstream out;
    lscan::RawJsonSink sink(out);
    sink.emit(lscan::Row{rec, values, proj, false});
    check(out.str() == "{\"a\":\"x, y\",\"b\":null,\"c\":1.25,\"_line\":4}\n", "raw row is the whole record");
  }
  {
    std::vector<bool> headers;
    lscan::FunctionSink sink([&](const lscan::Row& r) { headers.push_back(r.is_header); });
    sink.emit(lscan::Row{rec, values, proj, true});
    sink.emit(lscan::Row{rec, values, proj, false});
    check(headers == std::vector<bool>{true, false}, "function sink");
  }

  std::ostringstream out;
  check(lscan::make_builtin_sink("csv", out) != nullptr, "csv by name");
  check(lscan::make_builtin_sink("consoleTabbed", out) != nullptr, "consoleTabbed by name");
  check(lscan::make_builtin_sink("stringify", out) != nullptr, "stringify by name");
  check(lscan::make_builtin_sink("xml", out) == nullptr, "unknown name");

  if (fails) return 1;
  std::cout << "[PASS] sinks\n";
  return 0;
}
