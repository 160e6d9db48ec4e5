#pragma once

#include "build/SourceBuilder.hpp"
#include "core/Config.hpp"
#include "core/Error.hpp"
#include "core/Log.hpp"
#include "probe/CapabilityProbe.hpp"

// ============================================================================
// ResolverOptions - everything a resolution run is parameterized by
// ============================================================================
// Filled from h5bind.toml (see assets/configs/h5bind.toml); command-line
// flags overwrite individual fields afterwards.
// ============================================================================

namespace h5bind {

struct OutputOptions {
    Path dir = "generated";
    String header = "h5bind_decls.h";
    String cmake = "h5bind_link.cmake";
    String flags = "h5bind_link.flags";
};

struct ResolverOptions {
    /// Requested feature names; nullopt selects auto-detection
    Optional<Vector<String>> features;

    ProbeOptions probe;
    SourceBuildOptions staticBuild;
    OutputOptions output;

    Log::Level logLevel = Log::Level::Info;
    String logFile = "h5bind.log";

    /// Read [features], [probe], [static_build], [output] and [log].
    /// Missing keys keep their defaults; present keys of the wrong type are
    /// a ConfigError.
    static ResolveResult<ResolverOptions> FromConfig(const Config& config);

    /// "hl, zlib" -> {"hl", "zlib"}; empty items are dropped
    static Vector<String> SplitFeatureList(StringView list);
};

} // namespace h5bind
