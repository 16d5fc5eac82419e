#include "providers/provider_factory.hpp"

#include "providers/container_provider.hpp"
#include "providers/kernel_filter_provider.hpp"
#include "providers/local_profile_provider.hpp"
#include "providers/remote_provider.hpp"
#include "utils/common.hpp"

namespace sandcell::providers {

const char* ToString(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::kAuto: return "auto";
        case ProviderKind::kLocalProfile: return "local";
        case ProviderKind::kContainer: return "container";
        case ProviderKind::kRemote: return "remote";
        case ProviderKind::kKernelFilter: return "kernel";
    }
    return "auto";
}

std::optional<ProviderKind> ProviderKindFromString(const std::string& value) {
    const auto lowered = utils::ToLower(utils::Trim(value));
    if (lowered.empty() || lowered == "auto") {
        return ProviderKind::kAuto;
    }
    if (lowered == "local" || lowered == "local-profile" || lowered == "seatbelt" || lowered == "bwrap") {
        return ProviderKind::kLocalProfile;
    }
    if (lowered == "container" || lowered == "docker") {
        return ProviderKind::kContainer;
    }
    if (lowered == "remote") {
        return ProviderKind::kRemote;
    }
    if (lowered == "kernel" || lowered == "kernel-filter") {
        return ProviderKind::kKernelFilter;
    }
    return std::nullopt;
}

bool Capabilities::Supports(ProviderKind kind) const {
    switch (kind) {
        case ProviderKind::kLocalProfile: return local_profile;
        case ProviderKind::kContainer: return container;
        case ProviderKind::kKernelFilter: return kernel_filter;
        case ProviderKind::kRemote: return remote;
        case ProviderKind::kAuto: return local_profile || container || kernel_filter || remote;
    }
    return false;
}

nlohmann::json Capabilities::ToJson() const {
    return {
        {"local", local_profile},
        {"container", container},
        {"kernel", kernel_filter},
        {"remote", remote}
    };
}

Capabilities ProbeCapabilities(const ProviderSettings& settings) {
    Capabilities capabilities{};
    capabilities.local_profile = LocalProfileProvider::IsSupported(settings);
    capabilities.container = ContainerProvider::IsSupported(settings);
    capabilities.kernel_filter = KernelFilterProvider::IsSupported(settings);
    capabilities.remote = RemoteProvider::IsSupported(settings);
    return capabilities;
}

std::optional<ProviderKind> SelectProvider(ProviderKind preference, const Capabilities& capabilities) {
    if (preference != ProviderKind::kAuto) {
        if (capabilities.Supports(preference)) {
            return preference;
        }
        return std::nullopt;
    }
    for (auto kind : {ProviderKind::kLocalProfile, ProviderKind::kContainer, ProviderKind::kKernelFilter,
                      ProviderKind::kRemote}) {
        if (capabilities.Supports(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

std::unique_ptr<ExecutionProvider> CreateProvider(ProviderKind kind,
                                                  const ProviderSettings& settings,
                                                  state::StateStore& store) {
    switch (kind) {
        case ProviderKind::kLocalProfile:
            return std::make_unique<LocalProfileProvider>(settings, store);
        case ProviderKind::kContainer:
            return std::make_unique<ContainerProvider>(settings, store);
        case ProviderKind::kKernelFilter:
            return std::make_unique<KernelFilterProvider>(settings, store);
        case ProviderKind::kRemote:
            return std::make_unique<RemoteProvider>(settings);
        case ProviderKind::kAuto:
            break;
    }
    throw SandboxSetupError("no backend selected; resolve ProviderKind::kAuto with SelectProvider first");
}

}  // namespace sandcell::providers
