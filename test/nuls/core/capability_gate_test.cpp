#include "nuls/core/capability_gate.hpp"

#include <stdexcept>

#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using nuls::CapabilityGate;
using nuls::ExtractCapabilityFlags;

namespace {

auto ParseCapabilities(std::string_view json) -> lsp::ClientCapabilities {
  return nlohmann::json::parse(json).get<lsp::ClientCapabilities>();
}

}  // namespace

TEST_CASE("Capability flags follow the client capabilities", "[capability]") {
  SECTION("Full-featured client") {
    auto flags = ExtractCapabilityFlags(ParseCapabilities(R"({
      "workspace": {"didChangeConfiguration": {"dynamicRegistration": true},
                    "configuration": true},
      "textDocument": {"publishDiagnostics": {"relatedInformation": true}}
    })"));
    REQUIRE(flags.can_publish_diagnostics);
    REQUIRE(flags.can_change_configuration);
    REQUIRE(flags.can_lookup_configuration);
  }

  SECTION("Bare client") {
    auto flags = ExtractCapabilityFlags(ParseCapabilities("{}"));
    REQUIRE_FALSE(flags.can_publish_diagnostics);
    REQUIRE_FALSE(flags.can_change_configuration);
    REQUIRE_FALSE(flags.can_lookup_configuration);
  }

  SECTION("Configuration lookup requires an explicit true") {
    auto flags = ExtractCapabilityFlags(
        ParseCapabilities(R"({"workspace": {"configuration": false}})"));
    REQUIRE_FALSE(flags.can_lookup_configuration);
  }
}

TEST_CASE("CapabilityGate latches exactly once", "[capability]") {
  CapabilityGate gate;
  REQUIRE_FALSE(gate.IsLatched());
  REQUIRE_THROWS_AS(gate.CanPublishDiagnostics(), std::logic_error);

  gate.Latch(
      nuls::CapabilityFlags{
          .can_publish_diagnostics = true,
          .can_change_configuration = false,
          .can_lookup_configuration = true,
      });
  REQUIRE(gate.IsLatched());
  REQUIRE(gate.CanPublishDiagnostics());
  REQUIRE_FALSE(gate.CanChangeConfiguration());
  REQUIRE(gate.CanLookupConfiguration());

  REQUIRE_THROWS_AS(gate.Latch(nuls::CapabilityFlags{}), std::logic_error);
  // The first latch stays in effect
  REQUIRE(gate.CanPublishDiagnostics());
}
