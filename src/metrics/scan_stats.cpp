#include "log_scan/scan_stats.hpp"

namespace lscan {

ScanStats ScanCounters::snapshot(std::uint64_t bytes) const {
  ScanStats r = stats_;
  r.bytes = bytes;
  r.wall_ms = std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - t0_).count();
  return r;
}

}
