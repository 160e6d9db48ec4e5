#pragma once

#include "features/FeatureTypes.hpp"
#include "probe/NativeLibrary.hpp"

// ============================================================================
// LinkagePlan - the resolved decision: what to declare and how to link it
// ============================================================================
// Computed once by ConflictResolver and never mutated afterwards.
// ============================================================================

namespace h5bind {

enum class LinkMode : u8 {
    Dynamic,
    Static
};

constexpr const char* LinkModeName(LinkMode mode) {
    switch (mode) {
        case LinkMode::Dynamic: return "dynamic";
        case LinkMode::Static:  return "static";
    }
    return "unknown";
}

struct LinkagePlan {
    LinkMode linkMode = LinkMode::Dynamic;

    /// Closed feature set the plan was resolved for
    FlagSet features;

    /// Always contains SymbolGroup::Core
    GroupSet symbolsExposed;

    /// Version and capabilities of the library being linked
    NativeCapabilitySet native;

    Vector<Path> includeDirs;

    /// Library search paths in link order
    Vector<Path> searchPaths;

    /// Libraries without prefix/suffix, in link order
    Vector<String> libraries;

    /// False means consumers must serialize every call into the library
    bool threadsafeSatisfied = false;

    /// Where the library came from (probe label or "static build")
    String origin;

    bool Exposes(SymbolGroup group) const { return symbolsExposed.contains(group); }
};

} // namespace h5bind
