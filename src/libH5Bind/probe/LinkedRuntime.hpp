#pragma once

#include "core/Error.hpp"
#include "probe/NativeLibrary.hpp"

// ============================================================================
// LinkedRuntime - the HDF5 library this tool was built and linked against
// ============================================================================
// Version comes from the running library (H5::H5Library), capabilities from
// the H5pubconf.h the tool was compiled with. Include and library
// directories are recorded by the build system; has_hl is never reported
// because the tool does not link the high-level library.
// ============================================================================

namespace h5bind {

class HB_API LinkedRuntime {
public:
    /// Describe the linked library as a discovery record
    static ResolveResult<NativeLibrary> Query();

    /// Version of the headers the tool was compiled with (H5_VERS_*)
    static Version CompiledVersion();

    /// Human-readable summary for --runtime-info
    static String Describe();
};

} // namespace h5bind
