#pragma once

#include "core/Error.hpp"
#include "io/CommandRunner.hpp"
#include "io/Environment.hpp"
#include "probe/NativeLibrary.hpp"

// ============================================================================
// CapabilityProbe - locate an installed native HDF5 and read its capabilities
// ============================================================================
// Search order:
//   1. Explicit prefix (probe.hdf5_dir, else $HDF5_DIR); nothing else is tried
//   2. Library the tool itself links (probe.use_linked_runtime)
//   3. probe.extra_search_paths, in the order given
//   4. pkg-config: hdf5, hdf5-serial, hdf5-openmpi, hdf5-mpich
//   5. Well-known prefixes (Debian flavour directories, /usr, /usr/local...)
//
// $HDF5_VERSION (e.g. "1.10" or "1.10.8") skips candidates of other versions.
// The first valid candidate wins.
// ============================================================================

namespace h5bind {

struct ProbeOptions {
    /// Overrides $HDF5_DIR when set
    Optional<Path> hdf5Dir;

    bool usePkgConfig = true;
    bool useLinkedRuntime = false;

    /// Installation prefixes searched before pkg-config and the system prefixes
    Vector<Path> extraSearchPaths;
};

class HB_API CapabilityProbe {
public:
    CapabilityProbe(const Environment& env, CommandRunner& runner, ProbeOptions options = {});

    /// Run the full search
    ResolveResult<NativeLibrary> Probe();

    /// Examine one installation prefix (<prefix>/include, <prefix>/lib...).
    /// Used for explicit directories and for freshly built static libraries.
    /// The version selector is not applied.
    ResolveResult<NativeLibrary> ProbeInstallPrefix(const Path& prefix, StringView label) const;

    /// Core library names tried in each library directory
    static const Vector<String>& LibraryNames();

private:
    struct Candidate {
        Path includeDir;
        Path libraryDir;
        String label;
    };

    /// Outcome of examining one candidate: a library, "not an installation"
    /// (nullopt), or a hard error
    using CandidateResult = ResolveResult<Optional<NativeLibrary>>;

    CandidateResult Examine(const Candidate& candidate) const;

    Vector<Candidate> PrefixCandidates(const Path& prefix, StringView label) const;
    Vector<Candidate> PkgConfigCandidates();
    Vector<Candidate> WellKnownCandidates() const;

    bool HasLibrary(const Path& libraryDir, StringView name) const;

    const Environment& m_Env;
    CommandRunner& m_Runner;
    ProbeOptions m_Options;
};

} // namespace h5bind
