#include "gate_orchestrator.h"

#include <array>
#include <filesystem>
#include <system_error>

#include "common/logging.h"
#include "policy/policy_loader.h"
#include "scanner/symbol_resolver.h"
#include "validators/core_ban_validator.h"
#include "validators/policy_validators.h"

namespace ArchGate {

namespace fs = std::filesystem;

auto stageName(Stage stage) noexcept -> const char* {
    switch (stage) {
        case Stage::PREREQUISITES:      return "prerequisites";
        case Stage::REQUIRED_DOCUMENTS: return "required-documents";
        case Stage::WORKSPACE:          return "workspace";
        case Stage::CLASSIFICATION:     return "classification";
        case Stage::CORE_BANS:          return "core-bans";
        case Stage::ENGINE_FLAGS:       return "engine-flags";
        case Stage::INVARIANT_REGISTRY: return "invariant-registry";
        case Stage::AUTHORITY_MAP:      return "authority-boundary-map";
        case Stage::UNFORGEABILITY:     return "unforgeability";
        case Stage::CONSTRUCTOR_RUNGS:  return "constructor-rungs";
        case Stage::PARAMETRICITY:      return "parametricity";
        case Stage::MOVE_SEMANTICS:     return "move-semantics";
        case Stage::DRY_PROOF_MAP:      return "dry-proof-map";
        case Stage::COUNT:              break;
    }
    return "none";
}

namespace {

auto isReadableDirectory(const fs::path& dir) noexcept -> bool {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return false;
    }
    fs::directory_iterator it(dir, ec);
    return !ec;
}

} // namespace

auto GateOrchestrator::run(Diagnostic* diagnostic) -> bool {
    struct StageEntry {
        Stage stage;
        StageFn fn;
    };
    static constexpr std::array<StageEntry, static_cast<size_t>(Stage::COUNT)> STAGES = {{
        {Stage::PREREQUISITES,      &GateOrchestrator::checkPrerequisites},
        {Stage::REQUIRED_DOCUMENTS, &GateOrchestrator::checkRequiredDocuments},
        {Stage::WORKSPACE,          &GateOrchestrator::loadWorkspace},
        {Stage::CLASSIFICATION,     &GateOrchestrator::classifyFiles},
        {Stage::CORE_BANS,          &GateOrchestrator::checkCoreBans},
        {Stage::ENGINE_FLAGS,       &GateOrchestrator::checkEngineFlags},
        {Stage::INVARIANT_REGISTRY, &GateOrchestrator::checkRegistry},
        {Stage::AUTHORITY_MAP,      &GateOrchestrator::checkAuthorityMap},
        {Stage::UNFORGEABILITY,     &GateOrchestrator::checkUnforgeability},
        {Stage::CONSTRUCTOR_RUNGS,  &GateOrchestrator::checkConstructorRungs},
        {Stage::PARAMETRICITY,      &GateOrchestrator::checkParametricity},
        {Stage::MOVE_SEMANTICS,     &GateOrchestrator::checkMoveSemantics},
        {Stage::DRY_PROOF_MAP,      &GateOrchestrator::checkDryMap},
    }};

    diagnostic->clear();
    failed_stage_ = Stage::COUNT;
    stages_passed_ = 0;

    GateRun run;
    for (const auto& entry : STAGES) {
        LOG_DEBUG("Stage %s", stageName(entry.stage));
        if (!(this->*entry.fn)(run, diagnostic)) {
            failed_stage_ = entry.stage;
            LOG_ERROR("Stage %s failed: [%s] %s: %s", stageName(entry.stage), errorKindName(diagnostic->kind),
                      diagnostic->location.c_str(), diagnostic->message.c_str());
            return false;
        }
        ++stages_passed_;
        LOG_INFO("Stage %s passed", stageName(entry.stage));
    }

    if (run.cache) {
        const auto stats = run.cache->getStats();
        LOG_INFO("Source cache: %u files read, %u scans, %u hits", stats.files_read, stats.scans_computed,
                 stats.hits);
    }
    return true;
}

// ========== Stages ==========

auto GateOrchestrator::checkPrerequisites(GateRun&, Diagnostic* diagnostic) -> bool {
    if (!isReadableDirectory(config_.paths.root)) {
        return fail(diagnostic, ErrorKind::PREREQUISITE, config_.paths.root.string(), 0,
                    "workspace root is not a readable directory");
    }
    const fs::path policy_dir = config_.policyDir();
    if (!isReadableDirectory(policy_dir)) {
        return fail(diagnostic, ErrorKind::PREREQUISITE, policy_dir.string(), 0,
                    "policy directory is not a readable directory");
    }
    return true;
}

auto GateOrchestrator::checkRequiredDocuments(GateRun&, Diagnostic* diagnostic) -> bool {
    return PolicyLoader::checkRequiredDocuments(config_.policyDir(), diagnostic);
}

auto GateOrchestrator::loadWorkspace(GateRun& run, Diagnostic* diagnostic) -> bool {
    if (!WorkspaceModel::load(config_, &run.workspace, diagnostic) || !run.workspace.checkHealth(diagnostic)) {
        return false;
    }
    run.cache = std::make_unique<SourceCache>(run.workspace);
    return true;
}

auto GateOrchestrator::classifyFiles(GateRun& run, Diagnostic* diagnostic) -> bool {
    const auto path = documentPath(config_.policyDir(), DocumentKind::CLASSIFICATION_MAP);
    return PolicyLoader::loadClassificationMap(path, &run.classification_map, diagnostic) &&
           ClassificationResolver::classify(run.classification_map, run.workspace.allFiles(), &run.classification,
                                            diagnostic);
}

auto GateOrchestrator::checkCoreBans(GateRun& run, Diagnostic* diagnostic) -> bool {
    CoreBanValidator validator(config_.bans);
    return validator.checkCoreFiles(run.workspace, run.classification, *run.cache, diagnostic);
}

auto GateOrchestrator::checkEngineFlags(GateRun& run, Diagnostic* diagnostic) -> bool {
    CoreBanValidator validator(config_.bans);
    return validator.checkEngineFlags(run.workspace, *run.cache, diagnostic);
}

auto GateOrchestrator::checkRegistry(GateRun& run, Diagnostic* diagnostic) -> bool {
    const auto path = documentPath(config_.policyDir(), DocumentKind::INVARIANT_REGISTRY);
    if (!PolicyLoader::loadInvariantRegistry(path, &run.registry, diagnostic)) {
        return false;
    }
    SymbolResolver resolver(run.workspace, *run.cache);
    return PolicyValidators(resolver).validateRegistry(run.registry, diagnostic);
}

auto GateOrchestrator::checkAuthorityMap(GateRun& run, Diagnostic* diagnostic) -> bool {
    const auto path = documentPath(config_.policyDir(), DocumentKind::AUTHORITY_BOUNDARY_MAP);
    if (!PolicyLoader::loadAuthorityBoundaryMap(path, &run.authority_map, diagnostic)) {
        return false;
    }
    SymbolResolver resolver(run.workspace, *run.cache);
    return PolicyValidators(resolver).validateAuthorityMap(run.authority_map, diagnostic);
}

auto GateOrchestrator::checkUnforgeability(GateRun& run, Diagnostic* diagnostic) -> bool {
    SymbolResolver resolver(run.workspace, *run.cache);
    return PolicyValidators(resolver).validateUnforgeability(run.authority_map, diagnostic);
}

auto GateOrchestrator::checkConstructorRungs(GateRun& run, Diagnostic* diagnostic) -> bool {
    SymbolResolver resolver(run.workspace, *run.cache);
    return PolicyValidators(resolver).validateConstructorRungs(run.authority_map, diagnostic);
}

auto GateOrchestrator::checkParametricity(GateRun& run, Diagnostic* diagnostic) -> bool {
    const auto path = documentPath(config_.policyDir(), DocumentKind::PARAMETRICITY_RULES);
    if (!PolicyLoader::loadParametricityRules(path, &run.parametricity, diagnostic)) {
        return false;
    }
    SymbolResolver resolver(run.workspace, *run.cache);
    return PolicyValidators(resolver).validateParametricity(run.parametricity, diagnostic);
}

auto GateOrchestrator::checkMoveSemantics(GateRun& run, Diagnostic* diagnostic) -> bool {
    const auto path = documentPath(config_.policyDir(), DocumentKind::MOVE_SEMANTICS_RULES);
    if (!PolicyLoader::loadMoveSemanticsRules(path, &run.move_semantics, diagnostic)) {
        return false;
    }
    SymbolResolver resolver(run.workspace, *run.cache);
    return PolicyValidators(resolver).validateMoveSemantics(run.move_semantics, diagnostic);
}

auto GateOrchestrator::checkDryMap(GateRun& run, Diagnostic* diagnostic) -> bool {
    const auto path = documentPath(config_.policyDir(), DocumentKind::DRY_PROOF_MAP);
    if (!PolicyLoader::loadDryProofMap(path, &run.dry_map, diagnostic)) {
        return false;
    }
    SymbolResolver resolver(run.workspace, *run.cache);
    return PolicyValidators(resolver).validateDryMap(run.dry_map, run.registry, diagnostic);
}

} // namespace ArchGate
