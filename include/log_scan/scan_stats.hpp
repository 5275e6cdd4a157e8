#pragma once
#include <chrono>
#include <cstdint>

namespace lscan {

struct ScanStats {
  std::uint64_t lines = 0;      // lines attempted
  std::uint64_t output = 0;     // records emitted
  std::uint64_t filtered = 0;   // records rejected by a filter
  std::uint64_t malformed = 0;  // lines skipped under DecodePolicy::Skip
  std::uint64_t bytes = 0;
  double wall_ms = 0.0;
};

// Counters for one scan, plus wall time.
class ScanCounters {
public:
  void start() noexcept { stats_ = ScanStats{}; t0_ = std::chrono::steady_clock::now(); }
  void add_line() noexcept { ++stats_.lines; }
  void add_output() noexcept { ++stats_.output; }
  void add_filtered() noexcept { ++stats_.filtered; }
  void add_malformed() noexcept { ++stats_.malformed; }

  std::uint64_t lines() const noexcept { return stats_.lines; }
  std::uint64_t output() const noexcept { return stats_.output; }

  ScanStats snapshot(std::uint64_t bytes) const;

private:
  ScanStats stats_;
  std::chrono::steady_clock::time_point t0_{};
};

}
