#pragma once

#include "core/Error.hpp"
#include "features/FeatureRegistry.hpp"
#include "resolve/LinkagePlan.hpp"

// ============================================================================
// ConflictResolver - check requested features against native capabilities
// ============================================================================
// Dynamic: every requested flag's capability must be present; unrequested
//          capabilities are fine.
// Static:  the freshly built library must provide exactly the requested
//          capabilities, no more and no less.
//
// Both reject native versions outside SupportedVersionRange().
// ============================================================================

namespace h5bind {

class HB_API ConflictResolver {
public:
    explicit ConflictResolver(const FeatureRegistry& registry = FeatureRegistry::Default());

    ResolveResult<LinkagePlan> ResolveDynamic(const FlagSet& flags, const NativeLibrary& library) const;

    ResolveResult<LinkagePlan> ResolveStatic(const FlagSet& flags, const NativeLibrary& built) const;

    /// Symbol groups a library with these capabilities can back
    GroupSet ProvidedGroups(const CapabilitySet& caps) const;

private:
    Optional<ResolveError> CheckVersion(const NativeLibrary& library) const;

    LinkagePlan BuildPlan(LinkMode mode, const FlagSet& flags, const NativeLibrary& library) const;

    const FeatureRegistry& m_Registry;
};

} // namespace h5bind
