#pragma once

namespace app {

/// Print a stack trace to stderr when the server dies on SIGSEGV, SIGFPE,
/// SIGILL, SIGBUS or SIGABRT, then re-raise the signal
void InitializeCrashHandlers();

/// Stop the process with SIGSTOP when WAIT_FOR_GDB is set, so a debugger
/// can attach before the editor starts talking to the server
void WaitForDebuggerIfRequested();

}  // namespace app
