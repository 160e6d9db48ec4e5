#pragma once

#include "core/Error.hpp"
#include "features/FeatureTypes.hpp"
#include "probe/Version.hpp"

// ============================================================================
// HeaderParser - read capability metadata out of an HDF5 installation
// ============================================================================
// Sources:
//   H5public.h         H5_VERS_MAJOR / H5_VERS_MINOR / H5_VERS_RELEASE
//   H5pubconf.h        H5_HAVE_* configuration macros, H5_VERSION
//   libhdf5.settings   "Key: value" summary written by configure
// ============================================================================

namespace h5bind {

class HB_API HeaderParser {
public:
    /// Names of every macro #define'd in a header (commented-out
    /// "/* #undef X */" lines do not count)
    static Set<String> DefinedMacros(StringView headerText);

    /// Version from H5public.h
    /// @param file Only used in the error message
    static ResolveResult<Version> ParseVersion(StringView h5publicText, const Path& file);

    /// Version from the H5_VERSION string in H5pubconf.h, when present
    static Optional<Version> ParseConfigVersion(StringView h5pubconfText);

    /// Capabilities recorded in H5pubconf.h. has_hl is not derivable from
    /// the header and is never returned.
    static ResolveResult<CapabilitySet> ParseCapabilities(StringView h5pubconfText, const Path& file);

    /// "Key: value" pairs of libhdf5.settings, keys trimmed
    static Map<String, String> ParseSettings(StringView settingsText);

    /// Library names from a "-lcrypto -lz -ldl" style list
    static Vector<String> ParseLibraryList(StringView text);
};

} // namespace h5bind
