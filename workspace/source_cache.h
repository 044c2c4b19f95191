#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "gate/diagnostic.h"
#include "scanner/structural_scanner.h"
#include "workspace/workspace_model.h"

namespace ArchGate {

/// One source file as the validators see it.
struct SourceFile {
    std::string path;                 // workspace-relative
    std::string module;               // owning module name
    std::string raw;
    std::vector<std::string> lines;   // comments stripped, literals blanked
    std::string stripped;             // `lines` joined with '\n'
};

/// Run-scoped read-through cache: each file is read and stripped at most
/// once and its structural scan is computed at most once. Entries are
/// never mutated after insertion; returned pointers live as long as the cache.
class SourceCache {
public:
    explicit SourceCache(const WorkspaceModel& workspace) noexcept : workspace_(workspace) {}

    SourceCache(const SourceCache&) = delete;
    SourceCache& operator=(const SourceCache&) = delete;

    /// nullptr (and a WorkspaceHealthError) when the file cannot be read.
    [[nodiscard]] auto file(const std::string& path, const std::string& module, Diagnostic* diagnostic)
        -> const SourceFile*;

    [[nodiscard]] auto scan(const std::string& path, const std::string& module, Diagnostic* diagnostic)
        -> const FileScan*;

    struct Stats {
        uint32_t files_read = 0;
        uint32_t scans_computed = 0;
        uint32_t hits = 0;
    };

    [[nodiscard]] auto getStats() const noexcept -> Stats { return stats_; }

private:
    struct Entry {
        SourceFile file;
        std::unique_ptr<FileScan> scan;
    };

    const WorkspaceModel& workspace_;
    std::map<std::string, Entry> entries_;
    Stats stats_{};
};

} // namespace ArchGate
