// Session lifecycle: prepare, mount, run, tear down
// Author: Max Schwarz <max.schwarz@online.de>

#ifndef SESSION_H
#define SESSION_H

#include <filesystem>
#include <functional>
#include <string_view>

#include "executor.h"
#include "mounts.h"

namespace session {

enum class State { Idle, Preparing, Mounted, Running, Unmounting };

std::string_view stateName(State state);

// Shared advisory lock held by every session on a tree. The last session
// out is the one that may drain the mounts.
class Lease {
public:
  // Blocks until the shared lock is granted. Throws ConfigError.
  Lease(const std::filesystem::path &sessionsDir,
        const std::filesystem::path &tree);
  ~Lease();

  Lease(const Lease &) = delete;
  Lease &operator=(const Lease &) = delete;

  // Tries to turn the lease into an exclusive one. Returns true if no other
  // session holds a lease on the tree. Otherwise our lease is dropped.
  bool lastOut();

  void release();

  static std::filesystem::path pathFor(const std::filesystem::path &sessionsDir,
                                       const std::filesystem::path &tree);

private:
  int m_fd = -1;
};

class Controller {
public:
  // Makes sure the tree is populated. May run acquisition.
  using Preparer = std::function<void()>;

  Controller(const std::filesystem::path &sessionsDir,
             mounts::MountTable &table, executor::Executor &executor,
             Preparer prepare);

  // Runs one session and returns the command's exit status (128+N if the
  // session was interrupted by signal N before the command started).
  // Throws the first failure, or UnmountError if only teardown failed.
  int run(const executor::Request &request);

  State state() const { return m_state; }

private:
  void transition(State state);

  std::filesystem::path m_sessionsDir;
  mounts::MountTable &m_table;
  executor::Executor &m_executor;
  Preparer m_prepare;

  State m_state = State::Idle;
};

// Unbinds everything unless another session still holds a lease.
// Returns false if the drain was skipped. Throws UnmountError.
bool drain(const std::filesystem::path &sessionsDir, mounts::MountTable &table);

} // namespace session

#endif
