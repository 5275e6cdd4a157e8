#include "log_scan/chunk_reader.hpp"
#include "log_scan/errors.hpp"
#include <cerrno>
#include <cstdio>
#include <istream>
#include <string_view>
#include <vector>

namespace lscan {

namespace {

struct FileCloser {
  void operator()(std::FILE* f) const noexcept { if (f) std::fclose(f); }
};
using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

}

struct ChunkReader::Impl {
  std::string path;
  Config cfg;
  std::uint64_t bytes{0};
  std::uint64_t oversize{0};

  void emit(std::string_view out, const LineCallback& cb) const {
    if (cfg.strip_cr && !out.empty() && out.back() == '\r') out.remove_suffix(1);
    cb(out);
  }

  void for_each_line(const LineCallback& cb) {
    FilePtr f(std::fopen(path.c_str(), "rb"));
    if (!f) throw SourceError(path, errno);

    std::vector<char> buf(cfg.chunk_bytes + 1, 0);
    std::string carry;
    carry.reserve(256);
    bool skipping_oversize = false; // if true, drop until next newline

    while (true) {
      std::size_t n = std::fread(buf.data(), 1, cfg.chunk_bytes, f.get());
      if (n == 0 && std::ferror(f.get())) throw SourceError(path, errno);
      if (n == 0 && std::feof(f.get()))   break;
      bytes += n;

      std::string_view block(buf.data(), n);
      std::size_t start = 0;
      while (true) {
        std::size_t pos = block.find('\n', start);
        const bool hit_nl = (pos != std::string_view::npos);
        std::string_view slice = hit_nl ? block.substr(start, pos - start)
                                        : block.substr(start);

        if (skipping_oversize) {
          if (!hit_nl) break;
          skipping_oversize = false;
          start = pos + 1;
          continue;
        }

        if (carry.size() + slice.size() > cfg.max_record_bytes) {
          ++oversize;
          if (!cfg.drop_oversize) {
            // truncate and emit as best-effort
            size_t left = cfg.max_record_bytes - carry.size();
            carry.append(slice.substr(0, left));
            emit(carry, cb);
          }
          carry.clear();
          if (!hit_nl) { skipping_oversize = true; break; }
          start = pos + 1;
          continue;
        }

        if (!hit_nl) { carry.append(slice); break; }

        if (!carry.empty()) {
          carry.append(slice);
          emit(carry, cb);
          carry.clear();
        } else {
          emit(slice, cb);
        }
        start = pos + 1;
      }
    }

    if (!carry.empty() && !skipping_oversize) emit(carry, cb);
  }
};

ChunkReader::ChunkReader(std::string path)
  : ChunkReader(std::move(path), Config{}) {}

ChunkReader::ChunkReader(std::string path, Config cfg)
  : p_(new Impl{std::move(path), cfg}) {}

ChunkReader::~ChunkReader() = default;

void ChunkReader::for_each_line(const LineCallback& cb) { p_->for_each_line(cb); }
std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->bytes; }
std::uint64_t ChunkReader::oversize_lines() const noexcept { return p_->oversize; }

void StreamLineSource::for_each_line(const LineCallback& cb) {
  std::string line;
  while (std::getline(in_, line)) {
    bytes_ += line.size() + 1;
    std::string_view out(line);
    if (strip_cr_ && !out.empty() && out.back() == '\r') out.remove_suffix(1);
    cb(out);
  }
  if (in_.bad()) throw SourceError("<stream>", EIO);
}

}
