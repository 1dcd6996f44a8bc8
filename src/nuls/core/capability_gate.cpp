#include "nuls/core/capability_gate.hpp"

#include <mutex>
#include <stdexcept>

namespace nuls {

auto ExtractCapabilityFlags(const lsp::ClientCapabilities& capabilities)
    -> CapabilityFlags {
  CapabilityFlags flags;

  if (const auto& text_document = capabilities.textDocument) {
    flags.can_publish_diagnostics =
        text_document->publishDiagnostics.has_value();
  }

  if (const auto& workspace = capabilities.workspace) {
    flags.can_change_configuration =
        workspace->didChangeConfiguration.has_value();
    flags.can_lookup_configuration = workspace->configuration.value_or(false);
  }

  return flags;
}

auto CapabilityGate::Latch(const lsp::ClientCapabilities& capabilities)
    -> void {
  Latch(ExtractCapabilityFlags(capabilities));
}

auto CapabilityGate::Latch(CapabilityFlags flags) -> void {
  std::unique_lock lock(mutex_);
  if (flags_.has_value()) {
    throw std::logic_error("client capabilities are already latched");
  }
  flags_ = flags;
}

auto CapabilityGate::IsLatched() const -> bool {
  std::shared_lock lock(mutex_);
  return flags_.has_value();
}

auto CapabilityGate::CanPublishDiagnostics() const -> bool {
  return Flags().can_publish_diagnostics;
}

auto CapabilityGate::CanChangeConfiguration() const -> bool {
  return Flags().can_change_configuration;
}

auto CapabilityGate::CanLookupConfiguration() const -> bool {
  return Flags().can_lookup_configuration;
}

auto CapabilityGate::Flags() const -> CapabilityFlags {
  std::shared_lock lock(mutex_);
  if (!flags_.has_value()) {
    throw std::logic_error("client capabilities read before initialize");
  }
  return *flags_;
}

}  // namespace nuls
