#pragma once

#include "core/Platform.hpp"
#include "core/Types.hpp"

#include <compare>

// ============================================================================
// Version - HDF5 release number (major.minor.release)
// ============================================================================

namespace h5bind {

struct HB_API Version {
    u32 majnum = 0;
    u32 minnum = 0;
    u32 relnum = 0;

    constexpr Version() = default;
    constexpr Version(u32 maj, u32 min, u32 mic) : majnum(maj), minnum(min), relnum(mic) {}

    auto operator<=>(const Version&) const = default;

    /// Accepts "1.10", "1.10.8", "1.10.8-patch1", "1.14.3.2" (extra parts ignored)
    static Optional<Version> Parse(StringView text);

    /// "1.10.8"
    String ToString() const;

    /// "1_10_8", used in generated macro names
    String ToMacroSuffix() const;
};

/// A version selector such as HDF5_VERSION=1.10 or 1.10.8.
/// Fields that were not given match anything.
struct HB_API VersionSelector {
    u32 majnum = 0;
    Optional<u32> minnum;
    Optional<u32> relnum;

    static Optional<VersionSelector> Parse(StringView text);
    bool Matches(const Version& version) const;
    String ToString() const;
};

/// Releases whose declaration sets the emitter knows about.
/// Resolution accepts [kMinSupportedVersion, kMaxSupportedVersionExclusive).
inline constexpr Version kMinSupportedVersion{1, 8, 4};
inline constexpr Version kMaxSupportedVersionExclusive{1, 15, 0};

bool IsSupportedVersion(const Version& version);

/// "[1.8.4, 1.15.0)"
String SupportedVersionRange();

/// Known HDF5 releases in ascending order; every entry not newer than the
/// resolved version gets a H5BIND_HDF5_<x>_<y>_<z> marker macro.
const Vector<Version>& KnownReleases();

} // namespace h5bind
