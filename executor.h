// Command execution inside the target tree
// Author: Max Schwarz <max.schwarz@online.de>

#ifndef EXECUTOR_H
#define EXECUTOR_H

#include <filesystem>
#include <string>
#include <vector>

namespace executor {

enum class Mode {
  Shell,   //!< interactive login shell
  Command, //!< one-shot command
  Script,  //!< script read from stdin
};

struct Request {
  Mode mode = Mode::Shell;

  // Command mode only
  std::vector<std::string> command;

  // NAME=VALUE entries added to the sanitized environment
  std::vector<std::string> env;
};

class Executor {
public:
  virtual ~Executor() = default;

  // Blocks until the command exits and returns its exit status (128+N for
  // death by signal N). Throws ExecutionError if it could not be started.
  virtual int run(const std::filesystem::path &root, const Request &request) = 0;
};

// fork(), chroot() and exec in the child
class ChrootExecutor : public Executor {
public:
  int run(const std::filesystem::path &root, const Request &request) override;
};

std::vector<std::string> argvFor(const Request &request);

// Built from scratch, only a few host variables are carried over.
std::vector<std::string> environmentFor(const Request &request);

} // namespace executor

#endif
