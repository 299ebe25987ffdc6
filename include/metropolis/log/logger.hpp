#pragma once
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <format>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace metropolis::log {

enum class Level : int { debug = 1, info = 2, warn = 3, error = 4, off = 6 };

inline std::string_view to_string(Level lv) {
  switch (lv) {
  case Level::debug:
    return "D";
  case Level::info:
    return "I";
  case Level::warn:
    return "W";
  case Level::error:
    return "E";
  default:
    return "O";
  }
}

// "debug", "info", "warn", "error", "off"
inline std::optional<Level> parse_level(std::string_view name) {
  if (name == "debug")
    return Level::debug;
  if (name == "info")
    return Level::info;
  if (name == "warn")
    return Level::warn;
  if (name == "error")
    return Level::error;
  if (name == "off")
    return Level::off;
  return std::nullopt;
}

// Process-wide sampler log. Lines look like "[14:02:11 W] message".
// The starting level comes from METROPOLIS_LOG_LEVEL when it names a
// level, else info.
class Logger {
public:
  static Logger &instance() {
    static Logger L;
    return L;
  }

  void set_level(Level lv) { level_.store(lv, std::memory_order_relaxed); }
  Level level() const { return level_.load(std::memory_order_relaxed); }

  bool enabled(Level lv) const { return lv >= level() && lv != Level::off; }

  // nullptr restores stderr. The caller keeps the stream open while it is set.
  void set_sink(std::FILE *sink) { sink_.store(sink ? sink : stderr, std::memory_order_relaxed); }

  template <class... Args>
  void log(Level lv, std::format_string<Args...> fmt, Args &&...args) {
    if (!enabled(lv))
      return;
    write(lv, std::format(fmt, std::forward<Args>(args)...));
  }

private:
  Logger() {
    if (const char *env = std::getenv("METROPOLIS_LOG_LEVEL")) {
      if (auto lv = parse_level(env))
        level_.store(*lv, std::memory_order_relaxed);
    }
  }

  std::atomic<Level> level_{Level::info};
  std::atomic<std::FILE *> sink_{stderr};
  std::mutex mu_;

  void write(Level lv, const std::string &body) {
    auto now = std::chrono::system_clock::now();
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    char tbuf[9];
    std::strftime(tbuf, sizeof(tbuf), "%H:%M:%S", &tm);

    const std::string line = std::format("[{} {}] {}\n", tbuf, to_string(lv), body);

    std::scoped_lock lk(mu_);
    std::FILE *out = sink_.load(std::memory_order_relaxed);
    std::fwrite(line.data(), 1, line.size(), out);
    std::fflush(out);
  }
};

#define MLOG_DEBUG(...)                                                        \
  ::metropolis::log::Logger::instance().log(::metropolis::log::Level::debug,   \
                                            __VA_ARGS__)
#define MLOG_INFO(...)                                                         \
  ::metropolis::log::Logger::instance().log(::metropolis::log::Level::info,    \
                                            __VA_ARGS__)
#define MLOG_WARN(...)                                                         \
  ::metropolis::log::Logger::instance().log(::metropolis::log::Level::warn,    \
                                            __VA_ARGS__)
#define MLOG_ERROR(...)                                                        \
  ::metropolis::log::Logger::instance().log(::metropolis::log::Level::error,   \
                                            __VA_ARGS__)

} // namespace metropolis::log
