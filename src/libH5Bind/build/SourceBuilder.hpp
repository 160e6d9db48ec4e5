#pragma once

#include "core/Error.hpp"
#include "features/FeatureRegistry.hpp"
#include "io/CommandRunner.hpp"
#include "io/Environment.hpp"
#include "probe/Version.hpp"

// ============================================================================
// SourceBuilder - build a static native HDF5 from a source tree
// ============================================================================
// configure arguments, in order (later ones win):
//   1. base: static only, no tests/tools/fortran/c++, every optional
//      component off
//   2. ConfigureArgs(flags) from the feature registry
//   3. combinations: --enable-unsupported for threadsafe+hl, CC=<compiler>
//
// The build runs out of tree in <build_dir>; configure and make output are
// appended to <build_dir>/h5bind-native-build.log. The build directory is
// owned by this builder for the duration of the run.
// ============================================================================

namespace h5bind {

struct SourceBuildOptions {
    /// Source tree; falls back to $HDF5_SOURCE_DIR
    Optional<Path> sourceDir;

    Path buildDir = "h5bind-native";
    u32 jobs = 4;

    /// C compiler; "mpicc" is used when empty and mpio is requested
    String cc;

    /// Build log lines quoted in NativeBuildFailed
    u32 logTailLines = 20;
};

class HB_API SourceBuilder {
public:
    static constexpr const char* kLogFileName = "h5bind-native-build.log";

    SourceBuilder(Environment& env, CommandRunner& runner,
                  const FeatureRegistry& registry, SourceBuildOptions options);

    /// Configure, build and install; returns the install prefix
    ResolveResult<Path> Build(const FlagSet& flags);

    /// Everything passed to ./configure for these flags
    Vector<String> ConfigureArguments(const FlagSet& flags) const;

    /// Arguments that only apply to flag combinations
    Vector<String> CombinationArguments(const FlagSet& flags) const;

    static const Vector<String>& BaseArguments();

    Path BuildDir() const;
    Path InstallPrefix() const { return BuildDir() / "install"; }
    Path LogFile() const { return BuildDir() / kLogFileName; }

private:
    ResolveResult<Path> LocateSource() const;
    ResolveResult<Version> SourceVersion(const Path& sourceDir) const;
    ResolveError Failure(i32 exitStatus, StringView step) const;

    Environment& m_Env;
    CommandRunner& m_Runner;
    const FeatureRegistry& m_Registry;
    SourceBuildOptions m_Options;
};

} // namespace h5bind
