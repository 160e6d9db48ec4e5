#include "SourceBuilder.hpp"
#include "core/Log.hpp"
#include "probe/HeaderParser.hpp"

#include <algorithm>

namespace h5bind {

SourceBuilder::SourceBuilder(Environment& env, CommandRunner& runner,
                             const FeatureRegistry& registry, SourceBuildOptions options)
    : m_Env(env)
    , m_Runner(runner)
    , m_Registry(registry)
    , m_Options(std::move(options))
{
}

const Vector<String>& SourceBuilder::BaseArguments() {
    // --prefix is added per build
    static const Vector<String> args = {
        "--enable-static",
        "--disable-shared",
        "--disable-tests",
        "--disable-tools",
        "--disable-fortran",
        "--disable-cxx",
        "--disable-hl",
        "--disable-deprecated-symbols",
        "--without-zlib",
    };
    return args;
}

Path SourceBuilder::BuildDir() const {
    // configure requires an absolute --prefix
    return std::filesystem::absolute(m_Options.buildDir).lexically_normal();
}

Vector<String> SourceBuilder::CombinationArguments(const FlagSet& flags) const {
    Vector<String> args;
    if (flags.contains(FeatureFlag::Threadsafe) && flags.contains(FeatureFlag::Hl)) {
        args.emplace_back("--enable-unsupported");
    }
    if (!m_Options.cc.empty()) {
        args.push_back("CC=" + m_Options.cc);
    } else if (flags.contains(FeatureFlag::Mpio)) {
        args.emplace_back("CC=mpicc");
    }
    return args;
}

Vector<String> SourceBuilder::ConfigureArguments(const FlagSet& flags) const {
    Vector<String> args;
    args.push_back("--prefix=" + InstallPrefix().string());

    const auto& base = BaseArguments();
    args.insert(args.end(), base.begin(), base.end());

    auto features = m_Registry.ConfigureArgs(flags);
    args.insert(args.end(), features.begin(), features.end());

    auto combinations = CombinationArguments(flags);
    args.insert(args.end(), combinations.begin(), combinations.end());
    return args;
}

ResolveResult<Path> SourceBuilder::LocateSource() const {
    Optional<Path> source = m_Options.sourceDir;
    if (!source) {
        if (auto env = m_Env.GetVar("HDF5_SOURCE_DIR")) {
            source = Path(*env);
        }
    }
    if (!source) {
        return ResolveResult<Path>::Err(ResolveError::ConfigError(
            "feature 'static' needs an HDF5 source tree: set static_build.source_dir or HDF5_SOURCE_DIR"));
    }
    if (!m_Env.IsFile(*source / "configure")) {
        return ResolveResult<Path>::Err(ResolveError::ConfigError(
            source->string() + " is not an HDF5 source tree (no configure script)"));
    }
    return std::filesystem::absolute(*source).lexically_normal();
}

ResolveResult<Version> SourceBuilder::SourceVersion(const Path& sourceDir) const {
    const Path header = sourceDir / "src" / "H5public.h";
    auto text = m_Env.ReadFile(header);
    if (!text) {
        return ResolveResult<Version>::Err(ResolveError::ProbeParseError(header, "cannot read source tree version"));
    }
    return HeaderParser::ParseVersion(*text, header);
}

ResolveError SourceBuilder::Failure(i32 exitStatus, StringView step) const {
    String tail;
    if (auto log = m_Env.ReadFile(LogFile())) {
        tail = TailLines(*log, m_Options.logTailLines);
    }
    HB_LOG_ERROR("Native {} failed with status {}; see {}", step, exitStatus, LogFile().string());
    return ResolveError::NativeBuildFailed(exitStatus, step, std::move(tail));
}

ResolveResult<Path> SourceBuilder::Build(const FlagSet& flags) {
    auto source = LocateSource();
    if (!source) {
        return source;
    }

    auto version = SourceVersion(*source);
    if (!version) {
        return ResolveResult<Path>::Err(std::move(version).error());
    }
    if (!IsSupportedVersion(*version)) {
        return ResolveResult<Path>::Err(ResolveError::AbiVersionUnsupported(
            version->ToString(), SupportedVersionRange()));
    }

    // Starts a fresh log and creates the build directory
    if (auto err = m_Env.WriteFile(LogFile(), "# h5bind native build of HDF5 " + version->ToString() +
                                              " from " + source->string() + "\n")) {
        return ResolveResult<Path>::Err(ResolveError::IoError(LogFile(), *err));
    }

    // make install only adds files; headers and libraries left by a build
    // with other features would otherwise show up as capabilities
    if (auto err = m_Env.RemoveAll(InstallPrefix())) {
        return ResolveResult<Path>::Err(ResolveError::IoError(InstallPrefix(), *err));
    }

    HB_LOG_INFO("Building static HDF5 {} from {} (features: {})",
                version->ToString(), source->string(), JoinFlagNames(flags));

    Vector<String> configure = {(*source / "configure").string()};
    auto args = ConfigureArguments(flags);
    configure.insert(configure.end(), args.begin(), args.end());

    HB_LOG_DEBUG("{}", FormatCommandLine(configure));
    CommandResult configured = m_Runner.RunLogged(configure, BuildDir(), LogFile());
    if (!configured.Succeeded()) {
        return ResolveResult<Path>::Err(Failure(configured.exitStatus, "configure"));
    }

    Vector<String> make = {"make", "-j" + std::to_string(std::max<u32>(m_Options.jobs, 1)), "install"};
    CommandResult installed = m_Runner.RunLogged(make, BuildDir(), LogFile());
    if (!installed.Succeeded()) {
        return ResolveResult<Path>::Err(Failure(installed.exitStatus, "make install"));
    }

    HB_LOG_INFO("Static HDF5 installed to {}", InstallPrefix().string());
    return InstallPrefix();
}

} // namespace h5bind
