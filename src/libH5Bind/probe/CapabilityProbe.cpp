#include "CapabilityProbe.hpp"
#include "core/Log.hpp"
#include "probe/HeaderParser.hpp"
#include "probe/LinkedRuntime.hpp"

#include <sstream>

namespace h5bind {

namespace {

const char* kPkgConfigPackages[] = {"hdf5", "hdf5-serial", "hdf5-openmpi", "hdf5-mpich"};

const char* kLibrarySuffixes[] = {".so", ".a", ".dylib"};

const char* kMultiarchDirs[] = {"x86_64-linux-gnu", "aarch64-linux-gnu"};

// Debian/Ubuntu install every flavour side by side
const char* kDebianFlavors[] = {"serial", "openmpi", "mpich"};

const char* kWellKnownPrefixes[] = {
    "/usr",
    "/usr/local",
    "/usr/local/hdf5",
    "/opt/local",
    "/opt/homebrew",
    "/opt/homebrew/opt/hdf5",
    "/usr/local/opt/hdf5",
};

// Tokens of a pkg-config answer starting with `flag`, flag stripped
Vector<Path> CollectPaths(const String& output, StringView flag) {
    Vector<Path> paths;
    std::istringstream in(output);
    String token;
    while (in >> token) {
        if (token.size() > flag.size() && StringView(token).substr(0, flag.size()) == flag) {
            paths.emplace_back(token.substr(flag.size()));
        }
    }
    return paths;
}

} // namespace

CapabilityProbe::CapabilityProbe(const Environment& env, CommandRunner& runner, ProbeOptions options)
    : m_Env(env)
    , m_Runner(runner)
    , m_Options(std::move(options))
{
}

const Vector<String>& CapabilityProbe::LibraryNames() {
    static const Vector<String> names = {"hdf5", "hdf5_serial", "hdf5_openmpi", "hdf5_mpich"};
    return names;
}

// ============================================================================
// Search
// ============================================================================

ResolveResult<NativeLibrary> CapabilityProbe::Probe() {
    Optional<VersionSelector> selector;
    if (auto requested = m_Env.GetVar("HDF5_VERSION")) {
        selector = VersionSelector::Parse(*requested);
        if (!selector) {
            return ResolveResult<NativeLibrary>::Err(ResolveError::ConfigError(
                "HDF5_VERSION='" + *requested + "' is not a version (expected e.g. 1.10 or 1.10.8)"));
        }
        HB_LOG_INFO("Restricting HDF5 search to version {}", selector->ToString());
    }

    auto accept = [&selector](const NativeLibrary& lib) {
        if (selector && !selector->Matches(lib.caps.version)) {
            HB_LOG_INFO("Skipping HDF5 {} at {} (HDF5_VERSION={})",
                        lib.caps.version.ToString(), lib.includeDir.string(), selector->ToString());
            return false;
        }
        return true;
    };

    String versionNote = selector ? " matching HDF5_VERSION=" + selector->ToString() : String();

    // 1. Explicit prefix
    Optional<Path> explicitDir = m_Options.hdf5Dir;
    String explicitLabel = "probe.hdf5_dir";
    if (!explicitDir) {
        if (auto dir = m_Env.GetVar("HDF5_DIR")) {
            explicitDir = Path(*dir);
            explicitLabel = "HDF5_DIR";
        }
    }
    if (explicitDir) {
        HB_LOG_INFO("Probing HDF5 in {} ({})", explicitDir->string(), explicitLabel);
        auto lib = ProbeInstallPrefix(*explicitDir, explicitLabel);
        if (!lib) {
            return lib;
        }
        if (!accept(*lib)) {
            return ResolveResult<NativeLibrary>::Err(ResolveError::LibraryNotFound(
                explicitLabel + "=" + explicitDir->string() + " holds HDF5 " +
                lib->caps.version.ToString() + ", not one" + versionNote));
        }
        return lib;
    }

    // 2. The library this tool links
    if (m_Options.useLinkedRuntime) {
        auto lib = LinkedRuntime::Query();
        if (!lib) {
            return lib;
        }
        if (accept(*lib)) {
            HB_LOG_INFO("Using linked HDF5 runtime {}", lib->caps.version.ToString());
            return lib;
        }
    }

    // 3.-5. Search
    Vector<Candidate> candidates;
    for (const auto& prefix : m_Options.extraSearchPaths) {
        for (auto& candidate : PrefixCandidates(prefix, "probe.extra_search_paths")) {
            candidates.push_back(std::move(candidate));
        }
    }
    if (m_Options.usePkgConfig) {
        for (auto& candidate : PkgConfigCandidates()) {
            candidates.push_back(std::move(candidate));
        }
    }
    for (auto& candidate : WellKnownCandidates()) {
        candidates.push_back(std::move(candidate));
    }

    for (const auto& candidate : candidates) {
        auto examined = Examine(candidate);
        if (!examined) {
            return ResolveResult<NativeLibrary>::Err(std::move(examined).error());
        }
        if (!examined->has_value()) {
            continue;
        }
        NativeLibrary lib = std::move(**examined);
        if (accept(lib)) {
            HB_LOG_INFO("Found HDF5 {} via {} ({})", lib.caps.version.ToString(),
                        lib.discoveredBy, lib.includeDir.string());
            return lib;
        }
    }

    return ResolveResult<NativeLibrary>::Err(ResolveError::LibraryNotFound(
        "no HDF5 installation" + versionNote + " found; set HDF5_DIR or probe.hdf5_dir, "
        "or enable the 'static' feature to build one from source"));
}

ResolveResult<NativeLibrary> CapabilityProbe::ProbeInstallPrefix(const Path& prefix, StringView label) const {
    if (!m_Env.IsDirectory(prefix)) {
        return ResolveResult<NativeLibrary>::Err(ResolveError::LibraryNotFound(
            String(label) + "=" + prefix.string() + " is not a directory"));
    }

    for (const auto& candidate : PrefixCandidates(prefix, label)) {
        auto examined = Examine(candidate);
        if (!examined) {
            return ResolveResult<NativeLibrary>::Err(std::move(examined).error());
        }
        if (examined->has_value()) {
            return std::move(**examined);
        }
    }

    return ResolveResult<NativeLibrary>::Err(ResolveError::LibraryNotFound(
        String(label) + "=" + prefix.string() +
        " contains no HDF5 installation (need include/H5pubconf.h and lib/libhdf5.*)"));
}

// ============================================================================
// Candidate evaluation
// ============================================================================

CapabilityProbe::CandidateResult CapabilityProbe::Examine(const Candidate& candidate) const {
    const Path pubconf = candidate.includeDir / "H5pubconf.h";
    const Path pub = candidate.includeDir / "H5public.h";

    if (!m_Env.IsFile(pubconf) || !m_Env.IsFile(pub)) {
        return CandidateResult(Optional<NativeLibrary>{});
    }

    Optional<String> libraryName;
    for (const auto& name : LibraryNames()) {
        if (HasLibrary(candidate.libraryDir, name)) {
            libraryName = name;
            break;
        }
    }
    if (!libraryName) {
        HB_LOG_DEBUG("Headers in {} but no libhdf5 in {}",
                     candidate.includeDir.string(), candidate.libraryDir.string());
        return CandidateResult(Optional<NativeLibrary>{});
    }

    auto pubconfText = m_Env.ReadFile(pubconf);
    auto pubText = m_Env.ReadFile(pub);
    if (!pubconfText || !pubText) {
        return CandidateResult::Err(ResolveError::ProbeParseError(
            pubconfText ? pub : pubconf, "file exists but cannot be read"));
    }

    NativeLibrary lib;

    auto version = HeaderParser::ParseVersion(*pubText, pub);
    if (version) {
        lib.caps.version = *version;
    } else if (auto configVersion = HeaderParser::ParseConfigVersion(*pubconfText)) {
        lib.caps.version = *configVersion;
    } else {
        return CandidateResult::Err(std::move(version).error());
    }

    auto caps = HeaderParser::ParseCapabilities(*pubconfText, pubconf);
    if (!caps) {
        return CandidateResult::Err(std::move(caps).error());
    }
    lib.caps.capabilities = std::move(*caps);

    lib.includeDir = candidate.includeDir;
    lib.libraryDir = candidate.libraryDir;
    lib.libraryName = *libraryName;
    lib.discoveredBy = candidate.label;

    if (m_Env.IsFile(candidate.includeDir / "hdf5_hl.h")) {
        String hlName = *libraryName + "_hl";
        if (HasLibrary(candidate.libraryDir, hlName)) {
            lib.hlLibraryName = hlName;
            lib.caps.capabilities.insert(Capability::Hl);
        }
    }

    if (auto settings = m_Env.ReadFile(candidate.libraryDir / "libhdf5.settings")) {
        auto entries = HeaderParser::ParseSettings(*settings);
        auto it = entries.find("Extra libraries");
        if (it != entries.end()) {
            lib.extraLibraries = HeaderParser::ParseLibraryList(it->second);
        }
    }

    HB_LOG_DEBUG("Candidate {} / {}: HDF5 {} [{}]", candidate.includeDir.string(),
                 candidate.libraryDir.string(), lib.caps.version.ToString(),
                 JoinCapabilityNames(lib.caps.capabilities));
    return CandidateResult(Optional<NativeLibrary>(std::move(lib)));
}

bool CapabilityProbe::HasLibrary(const Path& libraryDir, StringView name) const {
    for (const char* suffix : kLibrarySuffixes) {
        if (m_Env.IsFile(libraryDir / ("lib" + String(name) + suffix))) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Candidate sources
// ============================================================================

Vector<CapabilityProbe::Candidate> CapabilityProbe::PrefixCandidates(const Path& prefix, StringView label) const {
    Vector<Path> libraryDirs = {prefix / "lib", prefix / "lib64"};
    for (const char* arch : kMultiarchDirs) {
        libraryDirs.push_back(prefix / "lib" / arch);
    }

    Vector<Candidate> candidates;
    for (const auto& libraryDir : libraryDirs) {
        candidates.push_back({prefix / "include", libraryDir, String(label)});
    }
    return candidates;
}

Vector<CapabilityProbe::Candidate> CapabilityProbe::PkgConfigCandidates() {
    String pkgConfig = m_Env.GetVar("PKG_CONFIG").value_or("pkg-config");

    Vector<Candidate> candidates;
    for (const char* package : kPkgConfigPackages) {
        CommandResult cflags = m_Runner.Capture({pkgConfig, "--cflags-only-I", package});
        if (!cflags.Succeeded()) {
            HB_LOG_TRACE("pkg-config: no package {}", package);
            continue;
        }
        CommandResult libs = m_Runner.Capture({pkgConfig, "--libs-only-L", package});

        Vector<Path> includeDirs = CollectPaths(cflags.output, "-I");
        Vector<Path> libraryDirs = libs.Succeeded() ? CollectPaths(libs.output, "-L") : Vector<Path>{};

        // Packages living in the compiler's default paths print nothing
        if (includeDirs.empty()) {
            includeDirs.emplace_back("/usr/include");
        }
        if (libraryDirs.empty()) {
            libraryDirs.emplace_back("/usr/lib");
            for (const char* arch : kMultiarchDirs) {
                libraryDirs.push_back(Path("/usr/lib") / arch);
            }
        }

        String label = String("pkg-config ") + package;
        for (const auto& includeDir : includeDirs) {
            for (const auto& libraryDir : libraryDirs) {
                candidates.push_back({includeDir, libraryDir, label});
            }
        }
    }
    return candidates;
}

Vector<CapabilityProbe::Candidate> CapabilityProbe::WellKnownCandidates() const {
    Vector<Candidate> candidates;

    for (const char* flavor : kDebianFlavors) {
        Path includeDir = Path("/usr/include/hdf5") / flavor;
        for (const char* arch : kMultiarchDirs) {
            Path archDir = Path("/usr/lib") / arch;
            candidates.push_back({includeDir, archDir / "hdf5" / flavor, "well-known prefix"});
            candidates.push_back({includeDir, archDir, "well-known prefix"});
        }
    }

    for (const char* prefix : kWellKnownPrefixes) {
        for (auto& candidate : PrefixCandidates(prefix, "well-known prefix")) {
            candidates.push_back(std::move(candidate));
        }
    }

    return candidates;
}

} // namespace h5bind
