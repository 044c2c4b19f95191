#pragma once

#include <cstdint>
#include <memory>

#include "classification/classification_resolver.h"
#include "config/gate_config.h"
#include "gate/diagnostic.h"
#include "policy/policy_documents.h"
#include "workspace/source_cache.h"
#include "workspace/workspace_model.h"

namespace ArchGate {

/// Gate stages in evaluation order. The run halts at the first failure.
enum class Stage : uint8_t {
    PREREQUISITES = 0,
    REQUIRED_DOCUMENTS,
    WORKSPACE,
    CLASSIFICATION,
    CORE_BANS,
    ENGINE_FLAGS,
    INVARIANT_REGISTRY,
    AUTHORITY_MAP,
    UNFORGEABILITY,
    CONSTRUCTOR_RUNGS,
    PARAMETRICITY,
    MOVE_SEMANTICS,
    DRY_PROOF_MAP,
    COUNT
};

[[nodiscard]] auto stageName(Stage stage) noexcept -> const char*;

/// Everything one run loads. Built fresh per run and discarded with it.
struct GateRun {
    WorkspaceModel workspace;
    std::unique_ptr<SourceCache> cache;
    ClassificationAssignment classification;

    ClassificationMap classification_map;
    InvariantRegistry registry;
    AuthorityBoundaryMap authority_map;
    ParametricityRules parametricity;
    MoveSemanticsRules move_semantics;
    DryProofMap dry_map;
};

/// Sequences the stages over one workspace.
class GateOrchestrator {
public:
    explicit GateOrchestrator(const GateConfig& config) noexcept : config_(config) {}

    GateOrchestrator(const GateOrchestrator&) = delete;
    GateOrchestrator& operator=(const GateOrchestrator&) = delete;

    /// Run every stage in order. On failure `diagnostic` holds the single
    /// reportable finding and `failedStage()` the stage that produced it.
    [[nodiscard]] auto run(Diagnostic* diagnostic) -> bool;

    [[nodiscard]] auto failedStage() const noexcept -> Stage { return failed_stage_; }
    [[nodiscard]] auto stagesPassed() const noexcept -> uint32_t { return stages_passed_; }

private:
    using StageFn = bool (GateOrchestrator::*)(GateRun&, Diagnostic*);

    auto checkPrerequisites(GateRun& run, Diagnostic* diagnostic) -> bool;
    auto checkRequiredDocuments(GateRun& run, Diagnostic* diagnostic) -> bool;
    auto loadWorkspace(GateRun& run, Diagnostic* diagnostic) -> bool;
    auto classifyFiles(GateRun& run, Diagnostic* diagnostic) -> bool;
    auto checkCoreBans(GateRun& run, Diagnostic* diagnostic) -> bool;
    auto checkEngineFlags(GateRun& run, Diagnostic* diagnostic) -> bool;
    auto checkRegistry(GateRun& run, Diagnostic* diagnostic) -> bool;
    auto checkAuthorityMap(GateRun& run, Diagnostic* diagnostic) -> bool;
    auto checkUnforgeability(GateRun& run, Diagnostic* diagnostic) -> bool;
    auto checkConstructorRungs(GateRun& run, Diagnostic* diagnostic) -> bool;
    auto checkParametricity(GateRun& run, Diagnostic* diagnostic) -> bool;
    auto checkMoveSemantics(GateRun& run, Diagnostic* diagnostic) -> bool;
    auto checkDryMap(GateRun& run, Diagnostic* diagnostic) -> bool;

    const GateConfig& config_;
    Stage failed_stage_{Stage::COUNT};
    uint32_t stages_passed_{0};
};

} // namespace ArchGate
