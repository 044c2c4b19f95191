#include "source_cache.h"

#include <fstream>
#include <sstream>

#include "common/logging.h"
#include "scanner/source_text.h"

namespace ArchGate {

auto SourceCache::file(const std::string& path, const std::string& module, Diagnostic* diagnostic)
    -> const SourceFile* {
    auto it = entries_.find(path);
    if (it != entries_.end()) {
        ++stats_.hits;
        return &it->second.file;
    }

    std::ifstream in(workspace_.resolvePath(path), std::ios::binary);
    if (!in) {
        fail(diagnostic, ErrorKind::WORKSPACE_HEALTH, path, 0, "cannot read source file");
        return nullptr;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    Entry entry;
    entry.file.path = path;
    entry.file.module = module;
    entry.file.raw = buffer.str();
    entry.file.lines = stripSource(entry.file.raw);
    entry.file.stripped = joinLines(entry.file.lines);
    ++stats_.files_read;
    LOG_DEBUG("Read %s (%zu lines)", path.c_str(), entry.file.lines.size());

    auto inserted = entries_.emplace(path, std::move(entry)).first;
    return &inserted->second.file;
}

auto SourceCache::scan(const std::string& path, const std::string& module, Diagnostic* diagnostic)
    -> const FileScan* {
    const SourceFile* source = file(path, module, diagnostic);
    if (!source) {
        return nullptr;
    }
    Entry& entry = entries_.find(path)->second;
    if (!entry.scan) {
        entry.scan = std::make_unique<FileScan>(StructuralScanner::scan(source->lines));
        ++stats_.scans_computed;
        LOG_DEBUG("Scanned %s: %zu declarations", path.c_str(), entry.scan->declarations.size());
    }
    return entry.scan.get();
}

} // namespace ArchGate
