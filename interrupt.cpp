// Signal routing while a session holds mounts
// Author: Max Schwarz <max.schwarz@online.de>

#include "interrupt.h"

#include <stdexcept>

#include <signal.h>

#include "log.h"

namespace interrupt {

namespace {
volatile sig_atomic_t g_signal = 0;
volatile sig_atomic_t g_child = 0;
bool g_active = false;

void handle(int sig, siginfo_t *info, void *) {
  if (g_signal == 0)
    g_signal = sig;

  if (g_child > 0 && info &&
      (info->si_code == SI_USER || info->si_code == SI_QUEUE))
    kill(static_cast<pid_t>(g_child), sig);
}
} // namespace

Guard::Guard() {
  if (g_active)
    throw std::logic_error{"interrupt::Guard is already active"};

  g_signal = 0;
  g_child = 0;

  struct sigaction action {};
  action.sa_sigaction = &handle;
  action.sa_flags = SA_SIGINFO | SA_RESTART;
  sigemptyset(&action.sa_mask);
  for (int sig : SIGNALS)
    sigaddset(&action.sa_mask, sig);

  for (std::size_t i = 0; i < SIGNALS.size(); ++i) {
    if (sigaction(SIGNALS[i], &action, &m_previous[i]) != 0) {
      sys_error("Could not install handler for signal {}", SIGNALS[i]);

      for (std::size_t j = 0; j < i; ++j)
        sigaction(SIGNALS[j], &m_previous[j], nullptr);
      throw std::runtime_error{"Could not install signal handlers"};
    }
  }

  g_active = true;
}

Guard::~Guard() {
  for (std::size_t i = 0; i < SIGNALS.size(); ++i) {
    if (sigaction(SIGNALS[i], &m_previous[i], nullptr) != 0)
      sys_error("Could not restore handler for signal {}", SIGNALS[i]);
  }

  g_child = 0;
  g_active = false;
}

bool interrupted() { return g_signal != 0; }

int received() { return g_signal; }

void set_child(pid_t pid) { g_child = pid; }

} // namespace interrupt
