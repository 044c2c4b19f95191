#pragma once

#include <string>
#include <vector>

#include "common/types.h"
#include "gate/diagnostic.h"
#include "scanner/structural_scanner.h"
#include "workspace/source_cache.h"
#include "workspace/workspace_model.h"

namespace ArchGate {

/// A parsed `module::...::symbol[::*]` path.
struct SymbolPath {
    std::string text;
    std::string module;
    std::vector<std::string> scope;   // leading lowercase segments
    std::string owner;                // `Type` of `Type::member`; empty for bare symbols
    std::string symbol;               // bare symbol, member name or wildcard prefix
    bool wildcard{false};             // `prefix_*` or trailing `::*` (symbol is the prefix)

    [[nodiscard]] auto isMemberPath() const noexcept -> bool { return !owner.empty(); }
};

/// One piece of source evidence for a path.
struct SymbolMatch {
    const SourceFile* file{nullptr};
    const Declaration* declaration{nullptr};
    const Member* member{nullptr};    // nullptr for a declaration-level match
    uint32_t line{0};
    bool text_only{false};            // whole-word match in stripped text
};

/// Resolves dotted symbol paths against the run's scans.
class SymbolResolver {
public:
    SymbolResolver(const WorkspaceModel& workspace, SourceCache& cache) noexcept
        : workspace_(workspace), cache_(cache) {}

    /// Split a path; UnknownModuleError when the first segment is not a module.
    [[nodiscard]] auto parse(const std::string& path, SymbolPath* out, Diagnostic* diagnostic) const -> bool;

    /// All evidence for `path`. UnresolvedSymbolError when there is none.
    [[nodiscard]] auto resolve(const std::string& path, std::vector<SymbolMatch>* matches, Diagnostic* diagnostic)
        -> bool;

    /// `module[::seg...]` naming a module, a file module or an inline module.
    [[nodiscard]] auto resolveModulePath(const std::string& path, Diagnostic* diagnostic) -> bool;

    /// Effective visibility of a constructor path (highest rung for wildcards).
    [[nodiscard]] auto constructorRung(const std::string& path, Common::VisibilityRung* rung,
                                       Diagnostic* diagnostic) -> bool;

    /// The type declaration (aggregate, enumeration, interface, alias) a
    /// capitalised path names.
    [[nodiscard]] auto findTypeDeclaration(const std::string& path, SymbolMatch* match, Diagnostic* diagnostic)
        -> bool;

private:
    /// Files searched for `path`: the narrowed file if it exists, else the module.
    [[nodiscard]] auto scopeFiles(const Module& module, const std::vector<std::string>& scope) const
        -> std::vector<std::string>;

    [[nodiscard]] auto collect(const SymbolPath& path, bool allow_text, std::vector<SymbolMatch>* matches,
                               Diagnostic* diagnostic) -> bool;

    const WorkspaceModel& workspace_;
    SourceCache& cache_;
};

} // namespace ArchGate
