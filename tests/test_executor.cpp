// Command executor tests
// Author: Max Schwarz <max.schwarz@online.de>

#include <algorithm>
#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "errors.h"
#include "executor.h"
#include "log.h"
#include "test_util.h"

LogLevel log_level = LogLevel::Error;

using executor::Mode;
using executor::Request;

namespace {

bool contains(const std::vector<std::string> &list, const std::string &s) {
  return std::ranges::find(list, s) != list.end();
}

void testArgv() {
  assert((executor::argvFor({.mode = Mode::Shell}) ==
          std::vector<std::string>{"/bin/bash", "-l"}));
  assert((executor::argvFor({.mode = Mode::Script}) ==
          std::vector<std::string>{"/bin/bash"}));

  auto argv = executor::argvFor(
      {.mode = Mode::Command, .command = {"emerge", "--info", "a b"}});
  assert(argv.size() == 7);
  assert(argv[0] == "/bin/bash");
  assert(argv[1] == "-c");
  assert(argv[2].find("/etc/profile") != std::string::npos);
  assert(argv[6] == "a b" && "arguments are passed without re-splitting");

  bool threw = test::throws<ExecutionError>(
      [] { executor::argvFor({.mode = Mode::Command}); });
  assert(threw && "Expected ExecutionError without a command");
}

void testEnvironment() {
  setenv("SECRET_TOKEN", "hunter2", 1);
  setenv("http_proxy", "http://proxy:3128", 1);
  unsetenv("https_proxy");
  unsetenv("no_proxy");
  unsetenv("TERM");

  auto env = executor::environmentFor({});
  assert(contains(env, "HOME=/root"));
  assert(contains(env, "TERM=linux"));
  assert(contains(env, "http_proxy=http://proxy:3128"));
  assert(std::ranges::none_of(env, [](const std::string &e) {
    return e.starts_with("SECRET_TOKEN=") || e.starts_with("https_proxy=");
  }));
  assert(std::ranges::any_of(
      env, [](const std::string &e) { return e.starts_with("PATH=/usr/local"); }));

  setenv("TERM", "xterm-256color", 1);
  env = executor::environmentFor(
      {.env = {"FEATURES=-sandbox", "HOME=/home/builder", "=bad", "bad",
               "FEATURES=parallel-fetch"}});
  assert(contains(env, "TERM=xterm-256color"));
  assert(contains(env, "HOME=/home/builder"));
  assert(!contains(env, "HOME=/root"));
  assert(contains(env, "FEATURES=parallel-fetch"));
  assert(!contains(env, "FEATURES=-sandbox"));
  assert(!contains(env, "bad") && !contains(env, "=bad"));
}

void testStartFailure() {
  // Either chroot() is not permitted or the empty tree has no shell
  test::TempDir dir;
  executor::ChrootExecutor exec;

  bool threw = test::throws<ExecutionError>(
      [&] { exec.run(dir.path(), {.mode = Mode::Command, .command = {"true"}}); });
  assert(threw && "Expected ExecutionError");
}

} // namespace

int main() {
  testArgv();
  testEnvironment();
  testStartFailure();

  std::cout << "executor tests ok\n";
  return 0;
}
