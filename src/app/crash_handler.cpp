#include "app/crash_handler.hpp"

#include <cstdlib>

#ifdef __linux__
#include <array>
#include <csignal>
#include <cstring>
#include <iostream>
#include <stacktrace>
#include <unistd.h>
#endif

namespace app {

#ifdef __linux__
namespace {

constexpr std::array kFatalSignals = {SIGSEGV, SIGFPE, SIGILL, SIGBUS, SIGABRT};

void HandleFatalSignal(int sig) noexcept {
  std::signal(sig, SIG_DFL);

  std::cerr << "\nnuls: fatal signal " << sig << " (" << strsignal(sig)
            << ")\n";
  std::cerr << "Stack trace:\n" << std::stacktrace::current() << "\n";
  std::cerr.flush();

  ::raise(sig);
}

}  // namespace
#endif

void InitializeCrashHandlers() {
#ifdef __linux__
  for (int sig : kFatalSignals) {
    std::signal(sig, HandleFatalSignal);
  }
#endif
}

void WaitForDebuggerIfRequested() {
#ifdef __linux__
  if (std::getenv("WAIT_FOR_GDB") != nullptr) {
    std::cerr << "nuls: waiting for debugger, pid " << ::getpid() << "\n";
    std::raise(SIGSTOP);
  }
#endif
}

}  // namespace app
