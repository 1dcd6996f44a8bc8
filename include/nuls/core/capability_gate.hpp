#pragma once

#include <optional>
#include <shared_mutex>

#include <lsp/client_capabilities.hpp>

namespace nuls {

struct CapabilityFlags {
  bool can_publish_diagnostics = false;
  bool can_change_configuration = false;
  bool can_lookup_configuration = false;
};

// Derive the flags the server acts on from the client's initialize request
auto ExtractCapabilityFlags(const lsp::ClientCapabilities& capabilities)
    -> CapabilityFlags;

// Client capability flags, written exactly once during initialize.
// Latching twice or reading before the latch is a protocol sequencing bug
// and throws std::logic_error.
class CapabilityGate {
 public:
  CapabilityGate() = default;

  auto Latch(const lsp::ClientCapabilities& capabilities) -> void;
  auto Latch(CapabilityFlags flags) -> void;

  [[nodiscard]] auto IsLatched() const -> bool;

  [[nodiscard]] auto CanPublishDiagnostics() const -> bool;
  [[nodiscard]] auto CanChangeConfiguration() const -> bool;
  [[nodiscard]] auto CanLookupConfiguration() const -> bool;

 private:
  auto Flags() const -> CapabilityFlags;

  mutable std::shared_mutex mutex_;
  std::optional<CapabilityFlags> flags_;
};

}  // namespace nuls
