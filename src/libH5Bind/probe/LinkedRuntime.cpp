#include "LinkedRuntime.hpp"
#include "core/Log.hpp"

HB_DISABLE_WARNINGS_PUSH
#include <H5Cpp.h>
HB_DISABLE_WARNINGS_POP

#include <sstream>

#ifndef H5BIND_LINKED_HDF5_INCLUDE_DIR
    #define H5BIND_LINKED_HDF5_INCLUDE_DIR ""
#endif
#ifndef H5BIND_LINKED_HDF5_LIBRARY_DIR
    #define H5BIND_LINKED_HDF5_LIBRARY_DIR ""
#endif
#ifndef H5BIND_LINKED_HDF5_LIBRARY_NAME
    #define H5BIND_LINKED_HDF5_LIBRARY_NAME "hdf5"
#endif

namespace h5bind {

namespace {

CapabilitySet CompiledCapabilities() {
    CapabilitySet caps;
#ifdef H5_HAVE_PARALLEL
    caps.insert(Capability::Mpio);
#endif
#ifdef H5_HAVE_THREADSAFE
    caps.insert(Capability::Threadsafe);
#endif
#ifdef H5_HAVE_FILTER_DEFLATE
    caps.insert(Capability::Zlib);
#endif
#ifndef H5_NO_DEPRECATED_SYMBOLS
    caps.insert(Capability::Deprecated);
#endif
#ifdef H5_HAVE_DIRECT
    caps.insert(Capability::Direct);
#endif
#ifdef H5_HAVE_STDBOOL_H
    caps.insert(Capability::Stdbool);
#endif
    return caps;
}

// Runtime answer; the compile-time macro can disagree when the tool runs
// against a different shared library than it was built with
Optional<bool> RuntimeThreadsafe() {
    // H5is_library_threadsafe arrived in 1.8.16; H5_VERSION_GE is missing
    // from the oldest supported headers
#if H5_VERS_MAJOR > 1 || (H5_VERS_MAJOR == 1 && (H5_VERS_MINOR > 8 || \
                                                 (H5_VERS_MINOR == 8 && H5_VERS_RELEASE >= 16)))
    hbool_t threadsafe = 0;
    if (H5is_library_threadsafe(&threadsafe) < 0) {
        return std::nullopt;
    }
    return threadsafe != 0;
#else
    return std::nullopt;
#endif
}

} // namespace

Version LinkedRuntime::CompiledVersion() {
    return Version(H5_VERS_MAJOR, H5_VERS_MINOR, H5_VERS_RELEASE);
}

ResolveResult<NativeLibrary> LinkedRuntime::Query() {
    unsigned majnum = 0;
    unsigned minnum = 0;
    unsigned relnum = 0;

    try {
        H5::H5Library::getLibVersion(majnum, minnum, relnum);
    } catch (const H5::Exception& e) {
        HB_LOG_ERROR("LinkedRuntime: getLibVersion failed: {}", e.getDetailMsg());
        return ResolveResult<NativeLibrary>::Err(ResolveError::ProbeParseError(
            "H5Library::getLibVersion", e.getDetailMsg()));
    }

    NativeLibrary lib;
    lib.caps.version = Version(majnum, minnum, relnum);
    lib.caps.capabilities = CompiledCapabilities();
    lib.includeDir = H5BIND_LINKED_HDF5_INCLUDE_DIR;
    lib.libraryDir = H5BIND_LINKED_HDF5_LIBRARY_DIR;
    lib.libraryName = H5BIND_LINKED_HDF5_LIBRARY_NAME;
    lib.discoveredBy = "linked runtime";

    if (lib.caps.version != CompiledVersion()) {
        HB_LOG_WARN("LinkedRuntime: running HDF5 {} but compiled against {}",
                    lib.caps.version.ToString(), CompiledVersion().ToString());
    }

    if (auto threadsafe = RuntimeThreadsafe()) {
        if (*threadsafe) {
            lib.caps.capabilities.insert(Capability::Threadsafe);
        } else {
            lib.caps.capabilities.erase(Capability::Threadsafe);
        }
    }

    return lib;
}

String LinkedRuntime::Describe() {
    auto lib = Query();
    if (!lib) {
        return lib.error().Describe();
    }

    std::ostringstream out;
    out << "HDF5 " << lib->caps.version.ToString() << " (compiled against "
        << CompiledVersion().ToString() << ")\n";
    out << "  capabilities: " << JoinCapabilityNames(lib->caps.capabilities) << "\n";
    out << "  include dir:  " << lib->includeDir.string() << "\n";
    out << "  library dir:  " << lib->libraryDir.string() << "\n";
    out << "  library:      " << lib->libraryName;
    return out.str();
}

} // namespace h5bind
