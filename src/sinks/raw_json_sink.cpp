#include "log_scan/sinks.hpp"
#include <ostream>

namespace lscan {

void RawJsonSink::emit(const Row& row) {
  std::string line;
  write_json(line, row.record);
  line += '\n';
  out_ << line;
}

void RawJsonSink::flush() { out_.flush(); }

}
