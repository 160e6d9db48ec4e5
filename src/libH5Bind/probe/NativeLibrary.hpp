#pragma once

#include "features/FeatureTypes.hpp"
#include "probe/Version.hpp"

// ============================================================================
// NativeCapabilitySet / NativeLibrary - what a native HDF5 build provides
// ============================================================================

namespace h5bind {

/// Version and compile-time capabilities of one native HDF5 build.
/// Discovered once per run and read-only afterwards.
struct NativeCapabilitySet {
    Version version;
    CapabilitySet capabilities;

    bool Has(Capability cap) const { return capabilities.contains(cap); }
};

/// A located native library: its capabilities plus where it lives and how
/// to link it.
struct NativeLibrary {
    NativeCapabilitySet caps;

    Path includeDir;
    Path libraryDir;

    /// Core library name without prefix/suffix ("hdf5", "hdf5_serial", ...)
    String libraryName = "hdf5";

    /// High-level library name, empty when not present
    String hlLibraryName;

    /// Extra libraries the native build links against ("Extra libraries:"
    /// in libhdf5.settings), without -l prefix
    Vector<String> extraLibraries;

    /// How the library was found ("HDF5_DIR", "pkg-config hdf5", ...)
    String discoveredBy;
};

} // namespace h5bind
