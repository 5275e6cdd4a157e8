#include "log_scan/sinks.hpp"
#include <ostream>

namespace lscan {

void TabbedSink::emit(const Row& row) {
  std::string line;
  for (size_t i = 0; i < row.values.size(); ++i) {
    if (i) line += ' ';
    line += to_text(row.values[i]);
  }
  line += '\n';
  out_ << line;
}

void TabbedSink::flush() { out_.flush(); }

}
