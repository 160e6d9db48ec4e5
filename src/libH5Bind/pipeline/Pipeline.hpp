#pragma once

#include "emit/DeclarationEmitter.hpp"
#include "features/FeatureRegistry.hpp"
#include "pipeline/ResolverOptions.hpp"
#include "resolve/ConflictResolver.hpp"

// ============================================================================
// Pipeline - one resolution run
// ============================================================================
//   Start -> FlagsClosed -> CapabilitiesKnown -> PlanResolved
//         -> DeclarationsEmitted -> Done
//
// Stages only move forward. The first error moves the pipeline to Failed
// and is returned together with the stage it happened in. A pipeline runs
// once; there are no retries.
// ============================================================================

namespace h5bind {

enum class Stage : u8 {
    Start,
    FlagsClosed,
    CapabilitiesKnown,
    PlanResolved,
    DeclarationsEmitted,
    Done,
    Failed
};

constexpr const char* StageName(Stage stage) {
    switch (stage) {
        case Stage::Start:               return "Start";
        case Stage::FlagsClosed:         return "FlagsClosed";
        case Stage::CapabilitiesKnown:   return "CapabilitiesKnown";
        case Stage::PlanResolved:        return "PlanResolved";
        case Stage::DeclarationsEmitted: return "DeclarationsEmitted";
        case Stage::Done:                return "Done";
        case Stage::Failed:              return "Failed";
    }
    return "Unknown";
}

struct PipelineOutcome {
    LinkagePlan plan;
    EmittedArtifacts artifacts;
    Vector<Path> writtenFiles;
};

class HB_API Pipeline {
public:
    Pipeline(Environment& env, CommandRunner& runner, ResolverOptions options,
             const FeatureRegistry& registry = FeatureRegistry::Default(),
             const SymbolCatalog& catalog = SymbolCatalog::Default());

    /// Run every stage; writes the artifacts into options.output.dir
    ResolveResult<PipelineOutcome> Run();

    Stage GetStage() const { return m_Stage; }

    /// Last stage completed before the failure (meaningful when Failed)
    Stage GetFailedAfter() const { return m_FailedAfter; }

private:
    ResolveResult<FlagSet> CloseFlags();
    ResolveResult<NativeLibrary> DiscoverCapabilities(FlagSet& flags);
    ResolveResult<LinkagePlan> ResolvePlan(const FlagSet& flags, const NativeLibrary& library);
    ResolveResult<Vector<Path>> WriteArtifacts(const EmittedArtifacts& artifacts);

    void Advance(Stage next);
    ResolveError Fail(ResolveError error);

    Environment& m_Env;
    CommandRunner& m_Runner;
    ResolverOptions m_Options;
    const FeatureRegistry& m_Registry;
    const SymbolCatalog& m_Catalog;

    Stage m_Stage = Stage::Start;
    Stage m_FailedAfter = Stage::Start;
};

} // namespace h5bind
