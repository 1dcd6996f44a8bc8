#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <asio.hpp>
#include <jsonrpc/endpoint/endpoint.hpp>
#include <jsonrpc/transport/framed_pipe_transport.hpp>
#include <spdlog/spdlog.h>

#include "app/app_setup.hpp"
#include "app/crash_handler.hpp"
#include "nuls/compiler/subprocess_backend.hpp"
#include "nuls/core/nu_lsp_server.hpp"
#include "nuls/services/nu_language_service.hpp"

namespace {

using Loggers =
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>>;

// Serve one client connection on the named pipe until it shuts down
auto RunServer(const std::string& pipe_name, Loggers& loggers) -> int {
  asio::io_context io_context;
  auto executor = io_context.get_executor();

  auto transport =
      std::make_unique<jsonrpc::transport::FramedPipeTransport>(
          executor, pipe_name, false, loggers["transport"]);
  auto endpoint = std::make_unique<jsonrpc::endpoint::RpcEndpoint>(
      executor, std::move(transport), loggers["jsonrpc"]);

  auto backend = std::make_shared<nuls::compiler::SubprocessBackend>(
      executor, loggers["nuls"]);
  auto language_service = std::make_shared<nuls::services::NuLanguageService>(
      backend, loggers["nuls"]);
  auto server = std::make_unique<nuls::NuLspServer>(
      executor, std::move(endpoint), language_service, loggers["nuls"]);

  int exit_code = 0;
  asio::co_spawn(
      io_context,
      [&server, &exit_code]() -> asio::awaitable<void> {
        auto result = co_await server->Start();
        if (!result) {
          server->Logger()->error(
              "Server stopped: {}", result.error().Message());
          exit_code = 1;
        }
      },
      asio::detached);

  io_context.run();
  return exit_code;
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  app::WaitForDebuggerIfRequested();
  app::InitializeCrashHandlers();

  const std::vector<std::string> args(argv, argv + argc);
  auto pipe_name = app::ParsePipeName(args);
  if (!pipe_name) {
    spdlog::error("Usage: nuls --pipe=<pipe name>");
    return 1;
  }

  auto loggers = app::SetupLoggers();
  loggers["nuls"]->info("nuls listening on {}", *pipe_name);
  return RunServer(*pipe_name, loggers);
}
