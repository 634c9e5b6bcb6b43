// Signal routing while a session holds mounts
// Author: Max Schwarz <max.schwarz@online.de>

#ifndef INTERRUPT_H
#define INTERRUPT_H

#include <array>
#include <csignal>

#include <sys/types.h>

namespace interrupt {

constexpr std::array<int, 4> SIGNALS{SIGINT, SIGTERM, SIGHUP, SIGQUIT};

// While alive, SIGINT/SIGTERM/SIGHUP/SIGQUIT no longer kill the process.
// The first one is recorded, and signals sent to us explicitly (kill(1),
// sigqueue) are passed on to the running child. Terminal-generated signals
// reach the child through the foreground process group anyway.
// Only one Guard may exist at a time.
class Guard {
public:
  Guard();
  ~Guard();

  Guard(const Guard &) = delete;
  Guard &operator=(const Guard &) = delete;

private:
  std::array<struct sigaction, SIGNALS.size()> m_previous{};
};

bool interrupted();

// Number of the first signal received, 0 if none
int received();

// Child to forward signals to, 0 for none
void set_child(pid_t pid);

} // namespace interrupt

#endif
