// Log level filtering tests
// Author: Max Schwarz <max.schwarz@online.de>

#include <cassert>
#include <cstdio>
#include <iostream>
#include <string>

#include <fcntl.h>
#include <unistd.h>

#include "log.h"
#include "test_util.h"

LogLevel log_level = LogLevel::Warning;

namespace {

// Runs @p fn with stderr redirected into a file and returns what it wrote
template <typename Fn> std::string captureStderr(Fn &&fn) {
  test::TempDir dir;
  auto path = dir.path() / "stderr";

  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  assert(fd >= 0);

  std::fflush(stderr);
  int saved = dup(STDERR_FILENO);
  assert(saved >= 0);
  dup2(fd, STDERR_FILENO);
  close(fd);

  fn();

  std::fflush(stderr);
  dup2(saved, STDERR_FILENO);
  close(saved);

  return test::readFile(path);
}

void testWarningLevel() {
  log_level = LogLevel::Warning;

  auto out = captureStderr([] {
    debug("hidden {}", 1);
    warning("shown {}", 2);
    error("shown {}", 3);
  });
  assert(out.find("hidden") == std::string::npos);
  assert(out.find("shown 2") != std::string::npos);
  assert(out.find("shown 3") != std::string::npos);
}

void testErrorLevelDropsWarnings() {
  log_level = LogLevel::Error;

  auto out = captureStderr([] {
    warning("stale key {}", "release");
    error("broken {}", "mount");
  });
  assert(out.find("stale key") == std::string::npos);
  assert(out.find("broken mount") != std::string::npos);
}

void testSysErrorKeepsErrno() {
  log_level = LogLevel::Error;

  captureStderr([] {
    errno = ENOENT;
    sys_error("Could not open {}", "/nonexistent");
    assert(errno == ENOENT);
  });
}

} // namespace

int main() {
  testWarningLevel();
  testErrorLevelDropsWarnings();
  testSysErrorKeepsErrno();

  std::cout << "log tests ok\n";
  return 0;
}
