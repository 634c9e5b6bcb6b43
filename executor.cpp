// Command execution inside the target tree
// Author: Max Schwarz <max.schwarz@online.de>

#include "executor.h"

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fmt/std.h>

#include <scope_guard.hpp>

#include "errors.h"
#include "interrupt.h"
#include "log.h"

namespace fs = std::filesystem;

namespace executor {

namespace {
constexpr const char *SHELL = "/bin/bash";
constexpr const char *PATH =
    "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

enum class Stage : int { Chroot, Chdir, Exec };

// Sent from the child over the close-on-exec pipe if it fails before exec
struct ChildFailure {
  Stage stage;
  int error;
};

std::string_view stageName(Stage stage) {
  switch (stage) {
  case Stage::Chroot:
    return "chroot";
  case Stage::Chdir:
    return "chdir";
  case Stage::Exec:
    return "exec";
  }
  return "?";
}

[[noreturn]] void childFailed(int fd, Stage stage) {
  ChildFailure failure{stage, errno};
  // Nothing left to do if the parent does not listen
  [[maybe_unused]] auto ret = write(fd, &failure, sizeof(failure));
  _exit(127);
}

std::vector<char *> pointersTo(std::vector<std::string> &strings) {
  std::vector<char *> ret;
  ret.reserve(strings.size() + 1);
  for (auto &str : strings)
    ret.push_back(str.data());
  ret.push_back(nullptr);
  return ret;
}
} // namespace

std::vector<std::string> argvFor(const Request &request) {
  switch (request.mode) {
  case Mode::Shell:
    return {SHELL, "-l"};
  case Mode::Script:
    return {SHELL};
  case Mode::Command: {
    if (request.command.empty())
      throw ExecutionError{"No command given"};

    std::vector<std::string> argv{SHELL, "-c",
                                  R"(source /etc/profile && exec "$@")",
                                  "bash"};
    argv.insert(argv.end(), request.command.begin(), request.command.end());
    return argv;
  }
  }

  throw ExecutionError{"Unknown execution mode"};
}

std::vector<std::string> environmentFor(const Request &request) {
  std::vector<std::string> env{
      fmt::format("PATH={}", PATH),
      "HOME=/root",
  };

  const char *term = getenv("TERM");
  env.push_back(fmt::format("TERM={}", term ? term : "linux"));

  for (auto name : {"http_proxy", "https_proxy", "no_proxy"}) {
    if (const char *value = getenv(name))
      env.push_back(fmt::format("{}={}", name, value));
  }

  for (auto &entry : request.env) {
    auto eq = entry.find('=');
    if (eq == entry.npos || eq == 0) {
      error("Ignoring invalid env spec '{}'", entry);
      continue;
    }

    debug("Setting {}", entry);

    // Later entries override earlier ones with the same name
    auto prefix = entry.substr(0, eq + 1);
    std::erase_if(env,
                  [&](const std::string &e) { return e.starts_with(prefix); });
    env.push_back(entry);
  }

  return env;
}

int ChrootExecutor::run(const fs::path &root, const Request &request) {
  auto argv = argvFor(request);
  auto env = environmentFor(request);

  // Everything the child touches is allocated before fork()
  auto argvPtrs = pointersTo(argv);
  auto envPtrs = pointersTo(env);
  std::string rootString = root.string();

  debug("Running {} in {}", argv, root);

  int pipefd[2];
  if (pipe2(pipefd, O_CLOEXEC) != 0)
    throw ExecutionError{
        fmt::format("Could not create pipe: {}", strerror(errno))};

  pid_t pid = fork();
  if (pid < 0) {
    auto reason = strerror(errno);
    close(pipefd[0]);
    close(pipefd[1]);
    throw ExecutionError{fmt::format("Could not fork(): {}", reason)};
  }

  if (pid == 0) {
    close(pipefd[0]);

    if (chroot(rootString.c_str()) != 0)
      childFailed(pipefd[1], Stage::Chroot);
    if (chdir("/") != 0)
      childFailed(pipefd[1], Stage::Chdir);

    execve(argvPtrs[0], argvPtrs.data(), envPtrs.data());
    childFailed(pipefd[1], Stage::Exec);
  }

  close(pipefd[1]);
  auto pipeGuard = sg::make_scope_guard([&] { close(pipefd[0]); });

  interrupt::set_child(pid);
  auto childGuard = sg::make_scope_guard([] { interrupt::set_child(0); });

  // Returns 0 bytes once exec succeeded and closed the write end
  ChildFailure failure{};
  ssize_t got;
  do {
    got = read(pipefd[0], &failure, sizeof(failure));
  } while (got < 0 && errno == EINTR);

  int wstatus = 0;
  while (waitpid(pid, &wstatus, 0) < 0) {
    if (errno == EINTR)
      continue;

    throw ExecutionError{fmt::format("Could not wait for {}: {}", argv[0],
                                     strerror(errno))};
  }

  if (got == sizeof(failure))
    throw ExecutionError{fmt::format("Could not {} ({} in {}): {}",
                                     stageName(failure.stage), argv[0], root,
                                     strerror(failure.error))};

  if (WIFEXITED(wstatus)) {
    debug("{} exited with status {}", argv[0], WEXITSTATUS(wstatus));
    return WEXITSTATUS(wstatus);
  }

  if (WIFSIGNALED(wstatus)) {
    debug("{} was killed by signal {}", argv[0], WTERMSIG(wstatus));
    return 128 + WTERMSIG(wstatus);
  }

  throw ExecutionError{
      fmt::format("{} terminated with unexpected status {}", argv[0], wstatus)};
}

} // namespace executor
