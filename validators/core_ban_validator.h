#pragma once

#include <set>
#include <string>

#include "classification/classification_resolver.h"
#include "config/gate_config.h"
#include "gate/diagnostic.h"
#include "scanner/structural_scanner.h"
#include "workspace/source_cache.h"
#include "workspace/workspace_model.h"

namespace ArchGate {

/// Structural bans. Core files may not use the optional wrapper in
/// data shapes or inherent signatures, pair a raw bool with a same-module
/// enumeration field, return an optional duration from an interface method
/// or declare placeholder variants. Engine modules may not carry
/// "already warned" bool fields regardless of classification.
class CoreBanValidator {
public:
    explicit CoreBanValidator(const GateConfig::Bans& bans) noexcept : bans_(bans) {}

    /// Every core file in sorted order; stops at the first violation.
    [[nodiscard]] auto checkCoreFiles(const WorkspaceModel& workspace, const ClassificationAssignment& assignment,
                                      SourceCache& cache, Diagnostic* diagnostic) const -> bool;

    /// Every file of the configured engine modules.
    [[nodiscard]] auto checkEngineFlags(const WorkspaceModel& workspace, SourceCache& cache,
                                        Diagnostic* diagnostic) const -> bool;

    /// All four core bans on one file. `module_enums` holds every enumeration
    /// name declared in the file's module.
    [[nodiscard]] auto checkCoreFile(const SourceFile& file, const FileScan& scan,
                                     const std::set<std::string>& module_enums, Diagnostic* diagnostic) const -> bool;

    [[nodiscard]] auto checkEngineFile(const SourceFile& file, const FileScan& scan, Diagnostic* diagnostic) const
        -> bool;

private:
    [[nodiscard]] auto checkOptionalWrapper(const SourceFile& file, const Declaration& decl,
                                            Diagnostic* diagnostic) const -> bool;
    [[nodiscard]] auto checkParallelBoolean(const SourceFile& file, const Declaration& decl,
                                            const std::set<std::string>& module_enums, Diagnostic* diagnostic) const
        -> bool;
    [[nodiscard]] auto checkOptionalDuration(const SourceFile& file, const Declaration& decl,
                                             Diagnostic* diagnostic) const -> bool;
    [[nodiscard]] auto checkBannedVariants(const SourceFile& file, const Declaration& decl,
                                           Diagnostic* diagnostic) const -> bool;

    const GateConfig::Bans& bans_;
};

} // namespace ArchGate
