#include "utils/logger.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

namespace logger {
namespace {

constexpr const char* kColorRed    = "\x1b[91m";
constexpr const char* kColorYellow = "\x1b[93m";
constexpr const char* kColorGreen  = "\x1b[92m";
constexpr const char* kColorBlue   = "\x1b[94m";
constexpr const char* kColorReset  = "\x1b[0m";

const char* level_color(Level level) {
  switch (level) {
    case Level::Debug: return kColorBlue;
    case Level::Info:  return kColorGreen;
    case Level::Warn:  return kColorYellow;
    case Level::Error: return kColorRed;
  }
  return kColorReset;
}

std::string format_time(const char* fmt) {
  const auto now = std::chrono::system_clock::now();
  const auto tt = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, fmt);
  return oss.str();
}

std::string_view trim_newlines(std::string_view s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.remove_suffix(1);
  return s;
}

struct LogLine {
  Level level;
  std::string text;
};

class Logger {
public:
  static Logger& instance() {
    static Logger inst;
    return inst;
  }

  void configure(const Options& opts) {
    {
      std::scoped_lock lk(config_mtx_);
      opts_ = opts;
      session_.clear();
    }
    console_level_.store(static_cast<int>(opts.console_level));
    file_level_.store(static_cast<int>(opts.file_level));
    file_enabled_.store(opts.file_enabled);
    if (opts.file_enabled) start_writer();
  }

  void trace(Level level, std::string_view message, const std::source_location& loc) {
    const int lvl = static_cast<int>(level);

    const std::filesystem::path file_path(loc.file_name());
    std::ostringstream ctx;
    ctx << "(" << file_path.filename().string() << ":" << loc.line() << ") " << trim_newlines(message);
    std::string text = ctx.str();

    if (lvl >= console_level_.load()) {
      const bool color = options_color();
      std::scoped_lock lk(print_mtx_);
      if (color) std::cout << level_color(level);
      std::cout << "[" << level_name(level) << "] " << text;
      if (color) std::cout << kColorReset;
      std::cout << "\n";
    }

    if (file_enabled_.load() && lvl >= file_level_.load()) {
      {
        std::scoped_lock lk(queue_mtx_);
        if (!accepting_) return;
        queue_.push_back({level, std::move(text)});
      }
      queue_cv_.notify_one();
    }
  }

  void close() {
    {
      std::scoped_lock lk(queue_mtx_);
      accepting_ = false;
      stop_ = true;
    }
    queue_cv_.notify_all();
    if (writer_.joinable()) writer_.join();
    std::scoped_lock lk(queue_mtx_);
    stop_ = false;
  }

private:
  Logger() = default;
  ~Logger() { close(); }

  bool options_color() {
    std::scoped_lock lk(config_mtx_);
    return opts_.color;
  }

  void start_writer() {
    std::scoped_lock lk(queue_mtx_);
    accepting_ = true;
    if (writer_.joinable()) return;
    writer_ = std::thread(&Logger::writer_loop, this);
  }

  std::filesystem::path current_file() {
    std::scoped_lock lk(config_mtx_);
    if (session_.empty()) {
      session_ = format_time("%Y-%m-%d_%H-%M-%S");
      std::error_code ec;
      std::filesystem::create_directories(opts_.dir, ec);
    }
    return opts_.dir / (opts_.file_prefix + "_" + session_ + ".log");
  }

  // True if `file` was moved aside and must be reopened.
  bool rotate_if_needed(const std::filesystem::path& file) {
    std::uintmax_t max_bytes = 0;
    uint32_t keep = 0;
    {
      std::scoped_lock lk(config_mtx_);
      max_bytes = opts_.max_file_bytes;
      keep = opts_.keep_files;
    }
    std::error_code ec;
    const auto size = std::filesystem::file_size(file, ec);
    if (ec || max_bytes == 0 || size <= max_bytes) return false;

    const auto dir = file.parent_path();
    const auto stem = file.stem().string();
    const auto ext = file.extension().string();
    auto rotated = [&](uint32_t i) { return dir / (stem + "." + std::to_string(i) + ext); };

    // file.N is the oldest; shift everything up by one and drop what falls off.
    if (keep == 0) {
      std::filesystem::remove(file, ec);
      return true;
    }
    std::filesystem::remove(rotated(keep), ec);
    for (uint32_t i = keep; i > 1; --i) {
      std::filesystem::rename(rotated(i - 1), rotated(i), ec);
    }
    std::filesystem::rename(file, rotated(1), ec);
    return true;
  }

  void writer_loop() {
    std::ofstream out;
    std::filesystem::path open_path;

    for (;;) {
      LogLine line;
      {
        std::unique_lock lk(queue_mtx_);
        queue_cv_.wait(lk, [&] { return stop_ || !queue_.empty(); });
        if (queue_.empty()) break;
        line = std::move(queue_.front());
        queue_.pop_front();
      }

      const auto file = current_file();
      if (out.is_open() && (file != open_path || rotate_if_needed(file))) out.close();
      if (!out.is_open()) {
        out.clear();
        out.open(file, std::ios::app);
        if (!out) continue;
        open_path = file;
      }

      out << std::setw(6) << std::setfill('0') << ++line_counter_
          << " [" << format_time("%H:%M:%S") << "] [" << level_name(line.level) << "] "
          << line.text << "\n";
      out.flush();
    }
  }

  std::mutex config_mtx_;
  Options opts_{};
  std::string session_;

  std::atomic<int> console_level_{static_cast<int>(Level::Info)};
  std::atomic<int> file_level_{static_cast<int>(Level::Debug)};
  std::atomic<bool> file_enabled_{false};

  std::mutex queue_mtx_;
  std::condition_variable queue_cv_;
  std::deque<LogLine> queue_;
  bool stop_{false};
  bool accepting_{false};
  std::thread writer_;
  uint64_t line_counter_{0};

  std::mutex print_mtx_;
};

} // namespace

const char* level_name(Level level) noexcept {
  switch (level) {
    case Level::Debug: return "DEBUG";
    case Level::Info:  return "INFO";
    case Level::Warn:  return "WARN";
    case Level::Error: return "ERROR";
  }
  return "UNKNOWN";
}

bool parse_level(std::string_view s, Level& out) noexcept {
  if (s == "debug") { out = Level::Debug; return true; }
  if (s == "info")  { out = Level::Info;  return true; }
  if (s == "warn")  { out = Level::Warn;  return true; }
  if (s == "error") { out = Level::Error; return true; }
  return false;
}

LogStream::LogStream(Level level, const std::source_location& loc)
  : level_(level), loc_(loc) {}

LogStream::LogStream(LogStream&& other) noexcept
  : level_(other.level_),
    loc_(other.loc_),
    stream_(std::move(other.stream_)),
    active_(other.active_) {
  other.active_ = false;
}

LogStream::~LogStream() {
  if (!active_) return;
  try {
    commit();
  } catch (const std::exception& e) {
    std::cerr << "[logger] dropped message: " << e.what() << "\n";
  }
}

void LogStream::commit() {
  if (!active_) return;
  active_ = false;
  trace(level_, stream_.str(), loc_);
}

void configure(const Options& opts) {
  Logger::instance().configure(opts);
}

void trace(Level level, std::string_view message, const std::source_location& loc) {
  Logger::instance().trace(level, message, loc);
}

LogStream debug(const std::source_location& loc) {
  return LogStream(Level::Debug, loc);
}

LogStream info(const std::source_location& loc) {
  return LogStream(Level::Info, loc);
}

LogStream warn(const std::source_location& loc) {
  return LogStream(Level::Warn, loc);
}

LogStream error(const std::source_location& loc) {
  return LogStream(Level::Error, loc);
}

void close_logger() {
  Logger::instance().close();
}

} // namespace logger
