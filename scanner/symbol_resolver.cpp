#include "symbol_resolver.h"

#include <algorithm>

#include "common/logging.h"
#include "scanner/source_text.h"

namespace ArchGate {

using Common::VisibilityRung;

namespace {

auto splitPath(const std::string& path) -> std::vector<std::string> {
    std::vector<std::string> segments;
    size_t start = 0;
    for (;;) {
        size_t sep = path.find("::", start);
        segments.emplace_back(trim(std::string_view(path).substr(start, sep == std::string::npos ? sep : sep - start)));
        if (sep == std::string::npos) break;
        start = sep + 2;
    }
    return segments;
}

auto isLowercaseSegment(const std::string& segment) noexcept -> bool {
    return !segment.empty() && ((segment[0] >= 'a' && segment[0] <= 'z') || segment[0] == '_');
}

auto isCapitalized(const std::string& segment) noexcept -> bool {
    return !segment.empty() && segment[0] >= 'A' && segment[0] <= 'Z';
}

auto startsWith(const std::string& text, const std::string& prefix) noexcept -> bool {
    return text.compare(0, prefix.size(), prefix) == 0;
}

auto maxRung(VisibilityRung a, VisibilityRung b) noexcept -> VisibilityRung {
    return Common::rungExceeds(a, b) ? a : b;
}

/// Module path of a file relative to its crate: `engine/src/app/mod.rs` -> `app::`
/// style segments joined with "::"; crate roots (`lib`, `main`) are empty.
auto fileModulePath(const std::string& file, const std::string& source_root) -> std::string {
    std::string rel = source_root.empty() ? file : file.substr(std::min(file.size(), source_root.size() + 1));
    size_t dot = rel.rfind('.');
    size_t slash = rel.rfind('/');
    if (dot != std::string::npos && (slash == std::string::npos || dot > slash)) {
        rel.erase(dot);
    }
    if (rel == "lib" || rel == "main" || rel == "mod") {
        return {};
    }
    if (rel.size() > 4 && rel.compare(rel.size() - 4, 4, "/mod") == 0) {
        rel.erase(rel.size() - 4);
    }
    std::string out;
    for (char c : rel) {
        if (c == '/') {
            out += "::";
        } else {
            out.push_back(c);
        }
    }
    return out;
}

auto joinSegments(const std::vector<std::string>& segments, size_t count, const char* sep) -> std::string {
    std::string out;
    for (size_t i = 0; i < count && i < segments.size(); ++i) {
        if (i > 0) out += sep;
        out += segments[i];
    }
    return out;
}

} // namespace

auto SymbolResolver::parse(const std::string& path, SymbolPath* out, Diagnostic* diagnostic) const -> bool {
    *out = SymbolPath{};
    out->text = path;

    std::vector<std::string> segments = splitPath(path);
    for (const auto& s : segments) {
        if (s.empty()) {
            return fail(diagnostic, ErrorKind::UNRESOLVED_SYMBOL, path, 0, "malformed symbol path");
        }
    }

    out->module = segments.front();
    if (!workspace_.findModule(out->module)) {
        return fail(diagnostic, ErrorKind::UNKNOWN_MODULE, path, 0,
                    "unknown module '" + out->module + "'");
    }

    std::vector<std::string> rest(segments.begin() + 1, segments.end());
    if (rest.empty()) {
        return true;
    }

    if (rest.back() == "*") {
        out->wildcard = true;
        rest.pop_back();
    } else {
        std::string last = rest.back();
        rest.pop_back();
        if (!last.empty() && last.back() == '*') {
            out->wildcard = true;
            last.pop_back();
        }
        out->symbol = last;
        if (!isLowercaseSegment(out->symbol) && !isCapitalized(out->symbol) && !out->wildcard) {
            return fail(diagnostic, ErrorKind::UNRESOLVED_SYMBOL, path, 0, "malformed symbol '" + out->symbol + "'");
        }
    }

    size_t i = 0;
    while (i < rest.size() && isLowercaseSegment(rest[i])) {
        out->scope.push_back(rest[i]);
        ++i;
    }
    if (i < rest.size()) {
        out->owner = rest.back();
    }
    return true;
}

auto SymbolResolver::scopeFiles(const Module& module, const std::vector<std::string>& scope) const
    -> std::vector<std::string> {
    for (size_t k = scope.size(); k > 0; --k) {
        const std::string wanted = joinSegments(scope, k, "::");
        for (const auto& file : module.files) {
            if (fileModulePath(file, module.source_root) == wanted) {
                return {file};
            }
        }
    }
    return module.files;
}

auto SymbolResolver::collect(const SymbolPath& path, bool allow_text, std::vector<SymbolMatch>* matches,
                             Diagnostic* diagnostic) -> bool {
    const Module* module = workspace_.findModule(path.module);
    const auto files = scopeFiles(*module, path.scope);

    auto nameMatches = [&path](const std::string& name) {
        return path.wildcard ? startsWith(name, path.symbol) : name == path.symbol;
    };

    for (const auto& file : files) {
        const FileScan* scan = cache_.scan(file, module->name, diagnostic);
        if (!scan) {
            return false;
        }
        const SourceFile* source = cache_.file(file, module->name, diagnostic);

        for (const auto& decl : scan->declarations) {
            if (!path.isMemberPath()) {
                if (decl.kind != DeclKind::IMPL_BLOCK && nameMatches(decl.name)) {
                    matches->push_back(SymbolMatch{source, &decl, nullptr, decl.line, false});
                }
                continue;
            }

            const bool owner_block = (decl.kind == DeclKind::IMPL_BLOCK && decl.self_type == path.owner) ||
                                     (decl.kind == DeclKind::ENUMERATION && decl.name == path.owner) ||
                                     (decl.kind == DeclKind::INTERFACE && decl.name == path.owner);
            if (!owner_block) {
                continue;
            }
            for (const auto& member : decl.members) {
                if (member.kind == MemberKind::FIELD || member.kind == MemberKind::SLOT) {
                    continue;
                }
                if (nameMatches(member.name)) {
                    matches->push_back(SymbolMatch{source, &decl, &member, member.line, false});
                }
            }
        }
    }

    if (!matches->empty() || !allow_text || path.wildcard || path.isMemberPath() || path.symbol.empty()) {
        return true;
    }

    // Whole-word reference in stripped text
    for (const auto& file : files) {
        const SourceFile* source = cache_.file(file, module->name, diagnostic);
        if (!source) {
            return false;
        }
        for (size_t i = 0; i < source->lines.size(); ++i) {
            if (containsWord(source->lines[i], path.symbol)) {
                matches->push_back(SymbolMatch{source, nullptr, nullptr, static_cast<uint32_t>(i + 1), true});
                return true;
            }
        }
    }
    return true;
}

auto SymbolResolver::resolve(const std::string& path, std::vector<SymbolMatch>* matches, Diagnostic* diagnostic)
    -> bool {
    SymbolPath parsed;
    if (!parse(path, &parsed, diagnostic)) {
        return false;
    }
    if (parsed.symbol.empty() && !parsed.wildcard) {
        return fail(diagnostic, ErrorKind::UNRESOLVED_SYMBOL, path, 0, "path names a module, not a symbol");
    }
    matches->clear();
    if (!collect(parsed, true, matches, diagnostic)) {
        return false;
    }
    if (matches->empty()) {
        return fail(diagnostic, ErrorKind::UNRESOLVED_SYMBOL, path, 0,
                    "no source evidence in module '" + parsed.module + "'");
    }
    LOG_DEBUG("Resolved %s: %zu matches", path.c_str(), matches->size());
    return true;
}

auto SymbolResolver::resolveModulePath(const std::string& path, Diagnostic* diagnostic) -> bool {
    std::vector<std::string> segments = splitPath(path);
    const Module* module = workspace_.findModule(segments.front());
    if (!module) {
        return fail(diagnostic, ErrorKind::UNKNOWN_MODULE, path, 0, "unknown module '" + segments.front() + "'");
    }
    if (segments.size() == 1) {
        return true;
    }

    const std::string wanted = joinSegments(std::vector<std::string>(segments.begin() + 1, segments.end()),
                                            segments.size() - 1, "::");
    for (const auto& file : module->files) {
        const std::string file_module = fileModulePath(file, module->source_root);
        if (file_module == wanted) {
            return true;
        }
        const FileScan* scan = cache_.scan(file, module->name, diagnostic);
        if (!scan) {
            return false;
        }
        for (const auto& decl : scan->declarations) {
            if (decl.kind != DeclKind::INLINE_MODULE) continue;
            std::string qualified = decl.module_path.empty() ? decl.name : decl.module_path + "::" + decl.name;
            if (!file_module.empty()) qualified = file_module + "::" + qualified;
            if (qualified == wanted) {
                return true;
            }
        }
    }
    return fail(diagnostic, ErrorKind::UNRESOLVED_SYMBOL, path, 0,
                "no file or inline module '" + wanted + "' in module '" + module->name + "'");
}

auto SymbolResolver::findTypeDeclaration(const std::string& path, SymbolMatch* match, Diagnostic* diagnostic)
    -> bool {
    SymbolPath parsed;
    if (!parse(path, &parsed, diagnostic)) {
        return false;
    }
    if (parsed.isMemberPath() || parsed.wildcard || !isCapitalized(parsed.symbol)) {
        return fail(diagnostic, ErrorKind::UNRESOLVED_SYMBOL, path, 0, "path does not name a type");
    }

    std::vector<SymbolMatch> matches;
    if (!collect(parsed, false, &matches, diagnostic)) {
        return false;
    }
    for (const auto& m : matches) {
        const DeclKind kind = m.declaration->kind;
        if (kind == DeclKind::AGGREGATE || kind == DeclKind::ENUMERATION || kind == DeclKind::INTERFACE ||
            kind == DeclKind::TYPE_ALIAS) {
            *match = m;
            return true;
        }
    }
    return fail(diagnostic, ErrorKind::UNRESOLVED_SYMBOL, path, 0,
                "no type declaration '" + parsed.symbol + "' in module '" + parsed.module + "'");
}

auto SymbolResolver::constructorRung(const std::string& path, VisibilityRung* rung, Diagnostic* diagnostic) -> bool {
    SymbolPath parsed;
    if (!parse(path, &parsed, diagnostic)) {
        return false;
    }

    if (!parsed.isMemberPath() && !parsed.wildcard && isCapitalized(parsed.symbol)) {
        SymbolMatch type;
        if (!findTypeDeclaration(path, &type, diagnostic)) {
            return false;
        }
        *rung = type.declaration->visibility;
        return true;
    }

    std::vector<SymbolMatch> matches;
    if (!collect(parsed, false, &matches, diagnostic)) {
        return false;
    }
    if (matches.empty()) {
        return fail(diagnostic, ErrorKind::UNRESOLVED_SYMBOL, path, 0,
                    "no constructor declaration in module '" + parsed.module + "'");
    }

    if (!parsed.isMemberPath()) {
        VisibilityRung highest = VisibilityRung::PRIVATE;
        for (const auto& m : matches) highest = maxRung(highest, m.declaration->visibility);
        *rung = highest;
        return true;
    }

    // Inherent methods first, then interface implementations, then variants
    // and interface declarations at their owner's visibility
    bool inherent = false;
    bool via_interface = false;
    VisibilityRung inherent_rung = VisibilityRung::PRIVATE;
    VisibilityRung other_rung = VisibilityRung::PRIVATE;
    for (const auto& m : matches) {
        if (m.declaration->isInherentImpl()) {
            inherent = true;
            inherent_rung = maxRung(inherent_rung, m.member->visibility);
        } else if (m.declaration->isInterfaceImpl()) {
            via_interface = true;
        } else {
            other_rung = maxRung(other_rung, m.declaration->visibility);
        }
    }

    if (parsed.wildcard) {
        VisibilityRung highest = inherent_rung;
        if (via_interface) highest = VisibilityRung::PUBLIC;
        *rung = maxRung(highest, other_rung);
    } else if (inherent) {
        *rung = inherent_rung;
    } else if (via_interface) {
        *rung = VisibilityRung::PUBLIC;
    } else {
        *rung = other_rung;
    }
    return true;
}

} // namespace ArchGate
