#include "ConflictResolver.hpp"
#include "core/Log.hpp"

#include <algorithm>

namespace h5bind {

namespace {

void AppendUnique(Vector<String>& list, const String& item) {
    if (!item.empty() && std::find(list.begin(), list.end(), item) == list.end()) {
        list.push_back(item);
    }
}

} // namespace

ConflictResolver::ConflictResolver(const FeatureRegistry& registry)
    : m_Registry(registry)
{
}

// ============================================================================
// Dynamic linkage
// ============================================================================

ResolveResult<LinkagePlan> ConflictResolver::ResolveDynamic(const FlagSet& flags, const NativeLibrary& library) const {
    if (auto err = CheckVersion(library)) {
        return ResolveResult<LinkagePlan>::Err(std::move(*err));
    }

    // Registry order keeps the reported flag deterministic
    for (const auto& entry : m_Registry.Table()) {
        if (!flags.contains(entry.flag) || !entry.requiresCapability) {
            continue;
        }
        if (!library.caps.Has(*entry.requiresCapability)) {
            return ResolveResult<LinkagePlan>::Err(ResolveError::CapabilityMismatch(
                FeatureFlagName(entry.flag), CapabilityName(*entry.requiresCapability),
                "HDF5 " + library.caps.version.ToString() + " at " + library.libraryDir.string() +
                " was built without it"));
        }
    }

    LinkagePlan plan = BuildPlan(LinkMode::Dynamic, flags, library);

    [[maybe_unused]] const GroupSet provided = ProvidedGroups(library.caps.capabilities);
    HB_ASSERT(std::includes(provided.begin(), provided.end(),
                            plan.symbolsExposed.begin(), plan.symbolsExposed.end()),
              "exposed symbol group not backed by a capability");

    HB_LOG_INFO("Resolved dynamic linkage against HDF5 {}: groups [{}]",
                plan.native.version.ToString(), JoinGroupNames(plan.symbolsExposed));
    return plan;
}

// ============================================================================
// Static linkage
// ============================================================================

ResolveResult<LinkagePlan> ConflictResolver::ResolveStatic(const FlagSet& flags, const NativeLibrary& built) const {
    if (auto err = CheckVersion(built)) {
        return ResolveResult<LinkagePlan>::Err(std::move(*err));
    }

    for (const auto& entry : m_Registry.Table()) {
        if (!entry.requiresCapability) {
            continue;
        }
        const bool requested = flags.contains(entry.flag);
        const bool present = built.caps.Has(*entry.requiresCapability);
        if (requested && !present) {
            return ResolveResult<LinkagePlan>::Err(ResolveError::CapabilityMismatch(
                FeatureFlagName(entry.flag), CapabilityName(*entry.requiresCapability),
                "the static build did not produce it"));
        }
        if (!requested && present) {
            return ResolveResult<LinkagePlan>::Err(ResolveError::CapabilityMismatch(
                FeatureFlagName(entry.flag), CapabilityName(*entry.requiresCapability),
                "the static build produced it although the feature was not requested"));
        }
    }

    LinkagePlan plan = BuildPlan(LinkMode::Static, flags, built);

    HB_LOG_INFO("Resolved static linkage against built HDF5 {}: groups [{}]",
                plan.native.version.ToString(), JoinGroupNames(plan.symbolsExposed));
    return plan;
}

// ============================================================================
// Shared
// ============================================================================

GroupSet ConflictResolver::ProvidedGroups(const CapabilitySet& caps) const {
    GroupSet groups = {SymbolGroup::Core};
    for (const auto& entry : m_Registry.Table()) {
        if (entry.group && (!entry.requiresCapability || caps.contains(*entry.requiresCapability))) {
            groups.insert(*entry.group);
        }
    }
    if (caps.contains(Capability::Direct)) {
        groups.insert(SymbolGroup::Direct);
    }
    return groups;
}

Optional<ResolveError> ConflictResolver::CheckVersion(const NativeLibrary& library) const {
    if (!IsSupportedVersion(library.caps.version)) {
        return ResolveError::AbiVersionUnsupported(library.caps.version.ToString(), SupportedVersionRange());
    }
    return std::nullopt;
}

LinkagePlan ConflictResolver::BuildPlan(LinkMode mode, const FlagSet& flags, const NativeLibrary& library) const {
    LinkagePlan plan;
    plan.linkMode = mode;
    plan.features = flags;
    plan.native = library.caps;
    plan.origin = library.discoveredBy;
    plan.threadsafeSatisfied = library.caps.Has(Capability::Threadsafe);

    plan.symbolsExposed = m_Registry.Groups(flags);
    plan.symbolsExposed.insert(SymbolGroup::Core);
    if (library.caps.Has(Capability::Direct)) {
        plan.symbolsExposed.insert(SymbolGroup::Direct);
    }

    if (!library.includeDir.empty()) {
        plan.includeDirs.push_back(library.includeDir);
    }
    if (!library.libraryDir.empty()) {
        plan.searchPaths.push_back(library.libraryDir);
    }

    // hl depends on the core library, so it comes first
    if (flags.contains(FeatureFlag::Hl)) {
        AppendUnique(plan.libraries,
                     library.hlLibraryName.empty() ? library.libraryName + "_hl" : library.hlLibraryName);
    }
    AppendUnique(plan.libraries, library.libraryName);

    if (mode == LinkMode::Static) {
        for (const auto& lib : m_Registry.StaticLinkLibraries(flags)) {
            AppendUnique(plan.libraries, lib);
        }
        for (const auto& lib : library.extraLibraries) {
            AppendUnique(plan.libraries, lib);
        }
        AppendUnique(plan.libraries, "dl");
        AppendUnique(plan.libraries, "m");
    }

    return plan;
}

} // namespace h5bind
