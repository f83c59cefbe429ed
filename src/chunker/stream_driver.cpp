#include "line_chunker/stream_driver.hpp"
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <vector>

namespace lc {

struct StreamDriver::Impl {
  std::string path;
  Config cfg;
  FILE* f{nullptr};
  int last_errno{0};
  bool stopped{false};
  std::uint64_t bytes{0};
  std::uint64_t blocks{0};
  double read_ms{0.0};

  ~Impl() { if (f) std::fclose(f); }

  bool open() {
    if (f) return true;
    f = std::fopen(path.c_str(), "rb");
    if (!f) { last_errno = errno; return false; }
    return true;
  }

  bool for_each_block(const BlockCallback& cb) {
    if (!open()) return false;
    if (cfg.read_bytes == 0) cfg.read_bytes = 1;

    std::vector<char> buf(cfg.read_bytes);
    while (true) {
      const auto t0 = std::chrono::steady_clock::now();
      std::size_t n = std::fread(buf.data(), 1, cfg.read_bytes, f);
      read_ms += std::chrono::duration<double, std::milli>(
                   std::chrono::steady_clock::now() - t0).count();
      if (n == 0 && std::ferror(f)) { last_errno = errno ? errno : EIO; close(); return false; }
      if (n == 0) break;
      bytes += n;
      ++blocks;

      if (!cb(std::string_view(buf.data(), n))) { stopped = true; close(); return false; }
    }

    close();
    return true;
  }

  void close() {
    if (f) { std::fclose(f); f = nullptr; }
  }
};

StreamDriver::StreamDriver(std::string path)
  : StreamDriver(std::move(path), Config{}) {}

StreamDriver::StreamDriver(std::string path, Config cfg)
  : p_(new Impl{std::move(path), cfg}) {}

StreamDriver::~StreamDriver() { delete p_; }

bool StreamDriver::open() { return p_->open(); }
bool StreamDriver::for_each_block(const BlockCallback& cb) { return p_->for_each_block(cb); }
bool StreamDriver::stopped_by_callback() const noexcept { return p_->stopped; }
int  StreamDriver::last_error() const noexcept { return p_->last_errno; }
std::uint64_t StreamDriver::bytes_read() const noexcept { return p_->bytes; }
std::uint64_t StreamDriver::blocks_read() const noexcept { return p_->blocks; }
double StreamDriver::read_ms() const noexcept { return p_->read_ms; }

}
