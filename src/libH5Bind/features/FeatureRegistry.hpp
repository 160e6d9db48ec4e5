#pragma once

#include "features/FeatureTypes.hpp"
#include "core/Error.hpp"

// ============================================================================
// FeatureRegistry - hard-coded table of feature toggles
// ============================================================================
// Each entry names the flags it implies, the native capability it needs, the
// symbol group it exposes, the native configure arguments that produce it in
// a source build, and the extra libraries a static link needs.
//
// The registry is immutable after construction. All queries are pure.
// ============================================================================

namespace h5bind {

struct FeatureSpec {
    FeatureFlag flag;
    Vector<FeatureFlag> implies;
    Optional<Capability> requiresCapability;
    Optional<SymbolGroup> group;
    Vector<String> configureArgs;
    Vector<String> staticLinkLibraries;
};

class HB_API FeatureRegistry {
public:
    explicit FeatureRegistry(Vector<FeatureSpec> table);

    /// The table the resolver ships with
    static const FeatureRegistry& Default();

    /// Map a configuration name to its flag
    ResolveResult<FeatureFlag> Lookup(StringView name) const;

    /// Close a list of configuration names under implication
    ResolveResult<FlagSet> Close(const Vector<String>& names) const;

    /// Close an already-typed flag set under implication (idempotent)
    FlagSet Close(const FlagSet& flags) const;

    /// Table entry for a flag (every FeatureFlag has one in Default())
    const FeatureSpec& Spec(FeatureFlag flag) const;

    bool Contains(FeatureFlag flag) const;

    /// Configure arguments contributed by exactly these flags, in table order
    Vector<String> ConfigureArgs(const FlagSet& flags) const;

    /// Extra libraries a static link against a build with these flags needs
    Vector<String> StaticLinkLibraries(const FlagSet& flags) const;

    /// Symbol groups exposed by these flags (core is not included)
    GroupSet Groups(const FlagSet& flags) const;

    /// Flags whose required capability is present, used when no flags are
    /// configured explicitly. Never includes flags without a capability.
    FlagSet AutoDetect(const CapabilitySet& caps) const;

    const Vector<FeatureSpec>& Table() const { return m_Table; }

private:
    Vector<FeatureSpec> m_Table;
};

} // namespace h5bind
