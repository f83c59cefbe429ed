#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace lc {

// Reads a file in fixed-size blocks and hands each block to a callback.
class StreamDriver {
public:
  struct Config {
    std::size_t read_bytes = 8 * 1024 * 1024; // 8 MiB
  };

  explicit StreamDriver(std::string path);      // uses default Config{}
  StreamDriver(std::string path, Config cfg);   // explicit Config

  // Return false from the callback to stop reading.
  using BlockCallback = std::function<bool(std::string_view)>;

  ~StreamDriver();

  // Opens the input; for_each_block calls this when needed.
  bool open();

  // True when the whole input was read and every callback succeeded.
  bool for_each_block(const BlockCallback& cb);

  bool stopped_by_callback() const noexcept;
  int  last_error() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  std::uint64_t blocks_read() const noexcept;
  double read_ms() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
