#include "log_scan/sinks.hpp"

namespace lscan {

std::unique_ptr<Sink> make_builtin_sink(std::string_view name, std::ostream& out) {
  if (name == "csv")           return std::make_unique<CsvSink>(out);
  if (name == "consoleTabbed") return std::make_unique<TabbedSink>(out);
  if (name == "stringify")     return std::make_unique<RawJsonSink>(out);
  return nullptr;
}

}
