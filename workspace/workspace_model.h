#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "config/gate_config.h"
#include "gate/diagnostic.h"

namespace ArchGate {

/// A workspace member crate. Paths are workspace-relative with '/' separators.
struct Module {
    std::string name;          // package name, '-' replaced by '_'
    std::string directory;     // "" for the root package
    std::string source_root;   // "<directory>/src"
    std::vector<std::string> files;  // sorted
    bool source_root_present{false};
    bool readme_present{false};
};

/// Modules and source files of a Cargo workspace, read from its root manifest.
class WorkspaceModel {
public:
    /// Read the root manifest and every member manifest, list sources.
    /// ConfigError on a missing/malformed manifest, empty member list or
    /// duplicate module names.
    [[nodiscard]] static auto load(const GateConfig& config, WorkspaceModel* out, Diagnostic* diagnostic) noexcept
        -> bool;

    /// Batched health check: every module lacking a source root, source
    /// files or a README-equivalent is reported in one WorkspaceHealthError.
    [[nodiscard]] auto checkHealth(Diagnostic* diagnostic) const noexcept -> bool;

    [[nodiscard]] auto root() const noexcept -> const std::filesystem::path& { return root_; }
    [[nodiscard]] auto modules() const noexcept -> const std::vector<Module>& { return modules_; }
    [[nodiscard]] auto findModule(std::string_view name) const noexcept -> const Module*;

    /// Every source file of every module, sorted.
    [[nodiscard]] auto allFiles() const -> std::vector<std::string>;

    /// Absolute-or-root-relative filesystem path of a workspace-relative path.
    [[nodiscard]] auto resolvePath(const std::string& relative) const -> std::filesystem::path {
        return relative.empty() ? root_ : root_ / relative;
    }

private:
    std::filesystem::path root_;
    std::vector<Module> modules_;  // manifest order after glob expansion
};

/// "a" + "b" -> "a/b", "" + "b" -> "b"
[[nodiscard]] auto joinRelative(const std::string& base, const std::string& child) -> std::string;

} // namespace ArchGate
