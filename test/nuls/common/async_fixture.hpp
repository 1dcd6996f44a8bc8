#pragma once

#include <exception>
#include <optional>

#include <asio.hpp>
#include <catch2/catch_all.hpp>

namespace nuls::test {

// Drive a coroutine test body to completion on its own io_context. The
// completion handler receives whatever the body threw, failed REQUIREs
// included, and it is rethrown here so Catch2 sees it on the test thread.
template <typename F>
void RunAsyncTest(F&& test_fn) {
  asio::io_context io_context;
  auto executor = io_context.get_executor();

  std::optional<std::exception_ptr> outcome;
  asio::co_spawn(
      io_context, test_fn(executor),
      [&outcome](std::exception_ptr error) { outcome = error; });

  io_context.run();

  REQUIRE(outcome.has_value());
  if (*outcome) {
    std::rethrow_exception(*outcome);
  }
}

}  // namespace nuls::test
