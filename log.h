// Logging utilities
// Author: Max Schwarz <max.schwarz@online.de>

#ifndef LOG_H
#define LOG_H

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>

#include <fmt/color.h>
#include <fmt/format.h>

enum class LogLevel { Debug, Info, Warning, Error };

// Messages below this level are dropped. Set once from the command line.
extern LogLevel log_level;

template <typename Level>
void log(FILE *file, Level &&level, const std::string &msg) {
  fmt::print(file, "stage_root[{}]: {}\n", std::forward<Level>(level), msg);
  std::fflush(file);
}

template <typename... Args>
void warning(const fmt::format_string<Args...> &format, Args &&...args) {
  if (log_level > LogLevel::Warning)
    return;

  log(stderr, fmt::styled("WARNING", fmt::fg(fmt::color::yellow)),
      fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void error(const fmt::format_string<Args...> &format, Args &&...args) {
  log(stderr, fmt::styled("ERROR", fmt::fg(fmt::color::red)),
      fmt::format(format, std::forward<Args>(args)...));
}

// Terminates the process. Never call this once mounts may be held by the
// current process: it skips every scope guard on the stack.
template <typename... Args>
[[noreturn]] void fatal(const fmt::format_string<Args...> &format,
                        Args &&...args) {
  log(stderr, fmt::styled("FATAL", fmt::fg(fmt::color::red)),
      fmt::format(format, std::forward<Args>(args)...));
  std::exit(1);
}

template <typename... Args>
void sys_error(const fmt::format_string<Args...> &format, Args &&...args) {
  auto savedErrno = errno;

  log(stderr, fmt::styled("ERROR", fmt::fg(fmt::color::red)),
      fmt::format("{}: {}", fmt::format(format, std::forward<Args>(args)...),
                  strerror(savedErrno)));

  // Callers may still want to inspect errno after reporting it
  errno = savedErrno;
}

template <typename... Args>
[[noreturn]] void sys_fatal(const fmt::format_string<Args...> &format,
                            Args &&...args) {
  auto savedErrno = errno;

  log(stderr, fmt::styled("FATAL", fmt::fg(fmt::color::red)),
      fmt::format("{}: {}", fmt::format(format, std::forward<Args>(args)...),
                  strerror(savedErrno)));
  std::exit(1);
}

template <typename... Args>
void info(const fmt::format_string<Args...> &format, Args &&...args) {
  if (log_level > LogLevel::Info)
    return;

  log(stdout, fmt::styled("INFO", fmt::fg(fmt::color::green)),
      fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void debug(const fmt::format_string<Args...> &format, Args &&...args) {
  if (log_level > LogLevel::Debug)
    return;

  log(stderr, fmt::styled("DEBUG", fmt::fg(fmt::color::orange)),
      fmt::format(format, std::forward<Args>(args)...));
}

#endif
