#include "Pipeline.hpp"
#include "build/SourceBuilder.hpp"
#include "core/Log.hpp"
#include "probe/CapabilityProbe.hpp"

namespace h5bind {

Pipeline::Pipeline(Environment& env, CommandRunner& runner, ResolverOptions options,
                   const FeatureRegistry& registry, const SymbolCatalog& catalog)
    : m_Env(env)
    , m_Runner(runner)
    , m_Options(std::move(options))
    , m_Registry(registry)
    , m_Catalog(catalog)
{
}

void Pipeline::Advance(Stage next) {
    HB_ASSERT(static_cast<u8>(next) == static_cast<u8>(m_Stage) + 1, "pipeline stages only move forward");
    HB_LOG_DEBUG("Pipeline: {} -> {}", StageName(m_Stage), StageName(next));
    m_Stage = next;
}

ResolveError Pipeline::Fail(ResolveError error) {
    m_FailedAfter = m_Stage;
    m_Stage = Stage::Failed;
    HB_LOG_ERROR("Resolution failed after stage {}: {}", StageName(m_FailedAfter), error.Describe());
    return error;
}

ResolveResult<PipelineOutcome> Pipeline::Run() {
    if (m_Stage != Stage::Start) {
        return ResolveResult<PipelineOutcome>::Err(ResolveError::ConfigError(
            String("pipeline already ran (stage ") + StageName(m_Stage) + ")"));
    }

    auto flags = CloseFlags();
    if (!flags) {
        return ResolveResult<PipelineOutcome>::Err(Fail(std::move(flags).error()));
    }
    Advance(Stage::FlagsClosed);

    FlagSet features = std::move(*flags);
    auto library = DiscoverCapabilities(features);
    if (!library) {
        return ResolveResult<PipelineOutcome>::Err(Fail(std::move(library).error()));
    }
    Advance(Stage::CapabilitiesKnown);

    auto plan = ResolvePlan(features, *library);
    if (!plan) {
        return ResolveResult<PipelineOutcome>::Err(Fail(std::move(plan).error()));
    }
    Advance(Stage::PlanResolved);

    DeclarationEmitter emitter(m_Catalog);
    EmittedArtifacts artifacts = emitter.Emit(*plan);
    HB_ASSERT(DeclarationEmitter::ParseEmittedGroups(artifacts.header) == plan->symbolsExposed,
              "emitted symbol groups differ from the plan");
    Advance(Stage::DeclarationsEmitted);

    auto written = WriteArtifacts(artifacts);
    if (!written) {
        return ResolveResult<PipelineOutcome>::Err(Fail(std::move(written).error()));
    }
    Advance(Stage::Done);

    HB_LOG_INFO("HDF5 {} ({} linkage), groups [{}], threadsafe: {}",
                plan->native.version.ToString(), LinkModeName(plan->linkMode),
                JoinGroupNames(plan->symbolsExposed), plan->threadsafeSatisfied ? "yes" : "no");

    PipelineOutcome outcome;
    outcome.plan = std::move(*plan);
    outcome.artifacts = std::move(artifacts);
    outcome.writtenFiles = std::move(*written);
    return outcome;
}

// ============================================================================
// Stages
// ============================================================================

ResolveResult<FlagSet> Pipeline::CloseFlags() {
    if (!m_Options.features) {
        HB_LOG_INFO("No features configured, detecting from the native library");
        return FlagSet{};
    }
    auto closed = m_Registry.Close(*m_Options.features);
    if (closed) {
        HB_LOG_INFO("Requested features: [{}]", JoinFlagNames(*closed));
    }
    return closed;
}

ResolveResult<NativeLibrary> Pipeline::DiscoverCapabilities(FlagSet& flags) {
    CapabilityProbe probe(m_Env, m_Runner, m_Options.probe);

    if (!flags.contains(FeatureFlag::Static)) {
        auto library = probe.Probe();
        if (library && !m_Options.features) {
            flags = m_Registry.AutoDetect(library->caps.capabilities);
            HB_LOG_INFO("Detected features: [{}]", JoinFlagNames(flags));
        }
        return library;
    }

    SourceBuilder builder(m_Env, m_Runner, m_Registry, m_Options.staticBuild);
    auto prefix = builder.Build(flags);
    if (!prefix) {
        return ResolveResult<NativeLibrary>::Err(std::move(prefix).error());
    }

    auto built = probe.ProbeInstallPrefix(*prefix, "static build");
    if (!built) {
        return built;
    }

    NativeLibrary library = std::move(*built);
    // Static archives live in <prefix>/lib, whatever the probe matched
    library.libraryDir = *prefix / "lib";
    return library;
}

ResolveResult<LinkagePlan> Pipeline::ResolvePlan(const FlagSet& flags, const NativeLibrary& library) {
    ConflictResolver resolver(m_Registry);
    if (flags.contains(FeatureFlag::Static)) {
        return resolver.ResolveStatic(flags, library);
    }
    return resolver.ResolveDynamic(flags, library);
}

ResolveResult<Vector<Path>> Pipeline::WriteArtifacts(const EmittedArtifacts& artifacts) {
    const std::pair<String, const String*> files[] = {
        {m_Options.output.header, &artifacts.header},
        {m_Options.output.cmake, &artifacts.cmake},
        {m_Options.output.flags, &artifacts.flags},
    };

    Vector<Path> written;
    for (const auto& [name, contents] : files) {
        Path path = m_Options.output.dir / name;
        if (auto err = m_Env.WriteFile(path, *contents)) {
            return ResolveResult<Vector<Path>>::Err(ResolveError::IoError(path, *err));
        }
        HB_LOG_INFO("Wrote {}", path.string());
        written.push_back(std::move(path));
    }
    return written;
}

} // namespace h5bind
