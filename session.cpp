// Session lifecycle: prepare, mount, run, tear down
// Author: Max Schwarz <max.schwarz@online.de>

#include "session.h"

#include <cerrno>
#include <cstring>
#include <optional>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <fmt/format.h>
#include <fmt/std.h>

#include <scope_guard.hpp>

#include "digest.h"
#include "errors.h"
#include "interrupt.h"
#include "log.h"

namespace fs = std::filesystem;

namespace session {

std::string_view stateName(State state) {
  switch (state) {
  case State::Idle:
    return "Idle";
  case State::Preparing:
    return "Preparing";
  case State::Mounted:
    return "Mounted";
  case State::Running:
    return "Running";
  case State::Unmounting:
    return "Unmounting";
  }
  return "?";
}

// Lease

fs::path Lease::pathFor(const fs::path &sessionsDir, const fs::path &tree) {
  auto normal = tree.lexically_normal();
  if (!normal.has_filename())
    normal = normal.parent_path();

  auto hash = digest::hexDigest("SHA256", normal.string()).substr(0, 16);
  return sessionsDir / fmt::format("{}_{}.lock", normal.filename().string(), hash);
}

Lease::Lease(const fs::path &sessionsDir, const fs::path &tree) {
  std::error_code ec;
  fs::create_directories(sessionsDir, ec);
  if (ec)
    throw ConfigError{
        fmt::format("Could not create {}: {}", sessionsDir, ec.message())};

  auto path = pathFor(sessionsDir, tree);
  m_fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
  if (m_fd < 0)
    throw ConfigError{fmt::format("Could not open session lock {}: {}", path,
                                  strerror(errno))};

  while (flock(m_fd, LOCK_SH) != 0) {
    if (errno == EINTR)
      continue;

    auto reason = strerror(errno);
    close(m_fd);
    m_fd = -1;
    throw ConfigError{
        fmt::format("Could not lock {}: {}", path, reason)};
  }

  debug("Holding session lease {}", path);
}

Lease::~Lease() { release(); }

bool Lease::lastOut() {
  if (m_fd < 0)
    return false;

  if (flock(m_fd, LOCK_EX | LOCK_NB) == 0)
    return true;

  // Two sessions leaving at once would each see the other's shared lock.
  // Dropping ours first lets the second of them succeed.
  flock(m_fd, LOCK_UN);
  return flock(m_fd, LOCK_EX | LOCK_NB) == 0;
}

void Lease::release() {
  if (m_fd < 0)
    return;

  close(m_fd);
  m_fd = -1;
}

bool drain(const fs::path &sessionsDir, mounts::MountTable &table) {
  Lease lease{sessionsDir, table.root()};
  if (!lease.lastOut()) {
    info("Other sessions are still using {}, leaving mounts in place",
         table.root());
    return false;
  }

  table.unbindAll();
  return true;
}

// Controller

Controller::Controller(const fs::path &sessionsDir, mounts::MountTable &table,
                       executor::Executor &executor, Preparer prepare)
    : m_sessionsDir{sessionsDir}, m_table{table}, m_executor{executor},
      m_prepare{std::move(prepare)} {}

void Controller::transition(State state) {
  debug("Session state: {} -> {}", stateName(m_state), stateName(state));
  m_state = state;
}

int Controller::run(const executor::Request &request) {
  auto idleGuard = sg::make_scope_guard([&] { transition(State::Idle); });

  interrupt::Guard interruptGuard;

  transition(State::Preparing);
  m_prepare();

  if (interrupt::interrupted()) {
    warning("Interrupted by signal {} while preparing", interrupt::received());
    return 128 + interrupt::received();
  }

  Lease lease{m_sessionsDir, m_table.root()};

  // Never throws, so it can run from the scope guard below
  auto tearDown = [&]() -> std::optional<UnmountError> {
    transition(State::Unmounting);

    if (!lease.lastOut()) {
      info("Other sessions are still using {}, leaving mounts in place",
           m_table.root());
      return {};
    }

    try {
      m_table.unbindAll();
      return {};
    } catch (UnmountError &e) {
      error("Teardown failed: {}", e.what());
      return e;
    } catch (std::exception &e) {
      error("Teardown failed: {}", e.what());
      return UnmountError{m_table.root(), e.what()};
    }
  };

  try {
    m_table.bindAll();
  } catch (MountError &) {
    // The MountError stays the reported cause
    tearDown();
    throw;
  }

  int status = 0;
  std::optional<UnmountError> teardownError;
  {
    auto teardownGuard =
        sg::make_scope_guard([&] { teardownError = tearDown(); });

    transition(State::Mounted);

    if (interrupt::interrupted()) {
      warning("Interrupted by signal {}, not starting the command",
              interrupt::received());
      status = 128 + interrupt::received();
    } else {
      transition(State::Running);
      status = m_executor.run(m_table.root(), request);

      if (interrupt::interrupted())
        info("Received signal {} while running, tearing down",
             interrupt::received());
    }
  }

  if (teardownError)
    throw *teardownError;

  return status;
}

} // namespace session
