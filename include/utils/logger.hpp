#pragma once

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace logger {

enum class Level : int {
  Debug = 10,
  Info  = 20,
  Warn  = 30,
  Error = 40
};

[[nodiscard]] const char* level_name(Level level) noexcept;
[[nodiscard]] bool parse_level(std::string_view s, Level& out) noexcept;

/**
 * @brief Logger configuration.
 *
 * Console output is synchronous. File output is queued and written by a
 * background thread into `<dir>/<file_prefix>_<session>.log`; the file is
 * rotated once it exceeds `max_file_bytes`, keeping at most `keep_files`
 * rotated copies.
 */
struct Options {
  Level console_level{Level::Info};
  Level file_level{Level::Debug};
  bool file_enabled{false};
  bool color{true};
  std::filesystem::path dir{"logs"};
  std::string file_prefix{"bgh"};
  std::uintmax_t max_file_bytes{1'000'000};
  uint32_t keep_files{5};
};

void configure(const Options& opts);

void trace(Level level,
           std::string_view message,
           const std::source_location& loc = std::source_location::current());

class LogStream {
public:
  LogStream(Level level, const std::source_location& loc);
  LogStream(LogStream&& other) noexcept;
  LogStream(const LogStream&) = delete;
  LogStream& operator=(const LogStream&) = delete;
  LogStream& operator=(LogStream&&) = delete;
  ~LogStream();

  template <typename T>
  LogStream& operator<<(T&& value) {
    stream_ << std::forward<T>(value);
    return *this;
  }

  using Manip = std::ostream& (*)(std::ostream&);
  LogStream& operator<<(Manip manip) {
    manip(stream_);
    return *this;
  }

  void commit();

private:
  Level level_;
  std::source_location loc_;
  std::ostringstream stream_;
  bool active_{true};
};

LogStream debug(const std::source_location& loc = std::source_location::current());
LogStream info(const std::source_location& loc = std::source_location::current());
LogStream warn(const std::source_location& loc = std::source_location::current());
LogStream error(const std::source_location& loc = std::source_location::current());

// Flush queued file output and stop the writer thread. Messages logged
// afterwards go to the console only, until the next configure().
void close_logger();

} // namespace logger
