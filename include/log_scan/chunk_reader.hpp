#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>

namespace lscan {

// Producer of raw text lines, in order, without trailing newline.
class LineSource {
public:
  using LineCallback = std::function<void(std::string_view)>;

  virtual ~LineSource() = default;

  // Invokes `cb` once per line, then returns at end of input.
  // Throws SourceError on I/O failure; exceptions from `cb` propagate.
  virtual void for_each_line(const LineCallback& cb) = 0;

  virtual std::uint64_t bytes_read() const noexcept = 0;
};

class ChunkReader : public LineSource {
public:
  struct Config {
    std::size_t chunk_bytes      = 512 * 1024;       // 512 KiB
    std::size_t max_record_bytes = 64 * 1024 * 1024; // 64 MiB guard per line
    bool        strip_cr         = true;             // trim trailing '\r' (CRLF)
    bool        drop_oversize    = false;            // drop (true) or truncate (false) long lines
  };

  explicit ChunkReader(std::string path);      // uses default Config{}
  ChunkReader(std::string path, Config cfg);   // explicit Config
  ~ChunkReader() override;

  void for_each_line(const LineCallback& cb) override;
  std::uint64_t bytes_read() const noexcept override;

  // Lines dropped or truncated by the size guard.
  std::uint64_t oversize_lines() const noexcept;

private:
  struct Impl;
  std::unique_ptr<Impl> p_;
};

// Lines from an already open stream (stdin, std::istringstream, ...).
class StreamLineSource : public LineSource {
public:
  explicit StreamLineSource(std::istream& in, bool strip_cr = true)
    : in_(in), strip_cr_(strip_cr) {}

  void for_each_line(const LineCallback& cb) override;
  std::uint64_t bytes_read() const noexcept override { return bytes_; }

private:
  std::istream& in_;
  bool strip_cr_;
  std::uint64_t bytes_{0};
};

}
