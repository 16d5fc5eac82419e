#pragma once

#include <memory>
#include <optional>

#include "nlohmann/json.hpp"
#include "providers/execution_provider.hpp"
#include "state/state_store.hpp"

namespace sandcell::providers {

struct Capabilities {
    bool local_profile = false;
    bool container = false;
    bool kernel_filter = false;
    bool remote = false;

    bool Supports(ProviderKind kind) const;
    nlohmann::json ToJson() const;
};

Capabilities ProbeCapabilities(const ProviderSettings& settings);

// Pure: the first supported backend in preference order. Auto tries the
// local profile, then container, then kernel filter, then remote. An
// explicit preference is honoured only when supported.
std::optional<ProviderKind> SelectProvider(ProviderKind preference, const Capabilities& capabilities);

std::unique_ptr<ExecutionProvider> CreateProvider(ProviderKind kind,
                                                  const ProviderSettings& settings,
                                                  state::StateStore& store);

}  // namespace sandcell::providers
