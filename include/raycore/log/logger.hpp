#pragma once
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace raycore::log {

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
  case Level::off:
    break;
  }
  return "-";
}

class Logger {
public:
  static Logger &instance() {
    static Logger L;
    return L;
  }

  void set_level(Level lv) {
    level_.store(lv, std::memory_order_relaxed);
  }

  Level level() const {
    return level_.load(std::memory_order_relaxed);
  }

  bool enabled(Level lv) const {
    return lv >= level() && lv != Level::off;
  }

  template <class... Args>
  void log(Level lv, std::string_view format, Args &&...args) {
    log_impl(lv, format, std::forward<Args>(args)...);
  }

private:
  std::atomic<Level> level_{Level::info};
  std::mutex mu_;

  template <class... Args>
  void log_impl(Level lv, std::string_view format, Args &&...args) {
    if (!enabled(lv))
      return;

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

    std::string body = fmt::vformat(fmt::string_view(format.data(), format.size()),
                                    fmt::make_format_args(args...));
    std::string line = fmt::format("[{} {}] {}\n", tbuf, to_string(lv), body);

    std::scoped_lock lk(mu_);
    std::fwrite(line.data(), 1, line.size(), stderr);
    std::fflush(stderr);
  }
};

#define RCLOG_DEBUG(...)                                                       \
  ::raycore::log::Logger::instance().log(::raycore::log::Level::debug,         \
                                         __VA_ARGS__)
#define RCLOG_INFO(...)                                                        \
  ::raycore::log::Logger::instance().log(::raycore::log::Level::info,          \
                                         __VA_ARGS__)
#define RCLOG_WARN(...)                                                        \
  ::raycore::log::Logger::instance().log(::raycore::log::Level::warn,          \
                                         __VA_ARGS__)
#define RCLOG_ERROR(...)                                                       \
  ::raycore::log::Logger::instance().log(::raycore::log::Level::error,         \
                                         __VA_ARGS__)

} // namespace raycore::log
