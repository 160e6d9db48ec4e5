#pragma once

#include "core/Platform.hpp"
#include "core/Types.hpp"

// ============================================================================
// Feature flags, native capability tags and symbol groups
// ============================================================================
// FeatureFlag  - what the consumer asks for
// Capability   - what the native HDF5 build was compiled with
// SymbolGroup  - which slice of the C API ends up declared
// ============================================================================

namespace h5bind {

enum class FeatureFlag : u8 {
    Mpio,
    Hl,
    Threadsafe,
    Zlib,
    Deprecated,
    Static
};

enum class Capability : u8 {
    Mpio,        // H5_HAVE_PARALLEL
    Hl,          // hdf5_hl headers and library present
    Threadsafe,  // H5_HAVE_THREADSAFE
    Zlib,        // H5_HAVE_FILTER_DEFLATE
    Deprecated,  // H5_NO_DEPRECATED_SYMBOLS not defined
    Direct,      // H5_HAVE_DIRECT
    Stdbool      // H5_HAVE_STDBOOL_H
};

enum class SymbolGroup : u8 {
    Core,
    Mpio,
    Hl,
    Zlib,
    Deprecated,
    Direct
};

using FlagSet = Set<FeatureFlag>;
using CapabilitySet = Set<Capability>;
using GroupSet = Set<SymbolGroup>;

inline constexpr Array<FeatureFlag, 6> kAllFeatureFlags = {
    FeatureFlag::Mpio, FeatureFlag::Hl, FeatureFlag::Threadsafe,
    FeatureFlag::Zlib, FeatureFlag::Deprecated, FeatureFlag::Static
};

inline constexpr Array<SymbolGroup, 6> kAllSymbolGroups = {
    SymbolGroup::Core, SymbolGroup::Mpio, SymbolGroup::Hl,
    SymbolGroup::Zlib, SymbolGroup::Deprecated, SymbolGroup::Direct
};

constexpr const char* FeatureFlagName(FeatureFlag flag) {
    switch (flag) {
        case FeatureFlag::Mpio:       return "mpio";
        case FeatureFlag::Hl:         return "hl";
        case FeatureFlag::Threadsafe: return "threadsafe";
        case FeatureFlag::Zlib:       return "zlib";
        case FeatureFlag::Deprecated: return "deprecated";
        case FeatureFlag::Static:     return "static";
    }
    return "unknown";
}

constexpr const char* CapabilityName(Capability cap) {
    switch (cap) {
        case Capability::Mpio:       return "has_mpio";
        case Capability::Hl:         return "has_hl";
        case Capability::Threadsafe: return "has_threadsafe";
        case Capability::Zlib:       return "has_zlib";
        case Capability::Deprecated: return "has_deprecated";
        case Capability::Direct:     return "has_direct";
        case Capability::Stdbool:    return "has_stdbool";
    }
    return "unknown";
}

constexpr const char* SymbolGroupName(SymbolGroup group) {
    switch (group) {
        case SymbolGroup::Core:       return "core";
        case SymbolGroup::Mpio:       return "mpio";
        case SymbolGroup::Hl:         return "hl";
        case SymbolGroup::Zlib:       return "zlib";
        case SymbolGroup::Deprecated: return "deprecated";
        case SymbolGroup::Direct:     return "direct";
    }
    return "unknown";
}

Optional<SymbolGroup> SymbolGroupFromName(StringView name);

/// "a, b, c" in set order
String JoinFlagNames(const FlagSet& flags);
String JoinCapabilityNames(const CapabilitySet& caps);
String JoinGroupNames(const GroupSet& groups);

} // namespace h5bind
