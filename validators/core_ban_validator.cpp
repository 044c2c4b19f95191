#include "core_ban_validator.h"

#include <algorithm>
#include <cctype>
#include <regex>

#include "common/logging.h"
#include "scanner/source_text.h"

namespace ArchGate {

namespace {

const std::regex& optionalWrapperPattern() {
    static const std::regex pattern(R"(\bOption\s*<)");
    return pattern;
}

// `-> Option<Duration>` with any path qualification on either name
const std::regex& optionalDurationPattern() {
    static const std::regex pattern(
        R"(->\s*(?:[A-Za-z_][A-Za-z0-9_]*\s*::\s*)*Option\s*<\s*(?:[A-Za-z_][A-Za-z0-9_]*\s*::\s*)*Duration\s*>)");
    return pattern;
}

auto hasOptional(const std::string& text) -> bool {
    return std::regex_search(text, optionalWrapperPattern());
}

auto isBool(const std::string& type_text) -> bool {
    return trim(type_text) == "bool";
}

auto lowercase(std::string text) -> std::string {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

auto violation(Diagnostic* d, const SourceFile& file, uint32_t line, const std::string& message) -> bool {
    return fail(d, ErrorKind::BAN_VIOLATION, file.path, line, message);
}

auto memberNoun(MemberKind kind) noexcept -> const char* {
    switch (kind) {
        case MemberKind::FIELD:   return "field";
        case MemberKind::SLOT:    return "positional slot";
        case MemberKind::VARIANT: return "variant";
        default:                  return "member";
    }
}

/// Enumeration names declared anywhere in `module`.
auto collectModuleEnums(const Module& module, SourceCache& cache, std::set<std::string>* names,
                        Diagnostic* diagnostic) -> bool {
    for (const auto& path : module.files) {
        const FileScan* scan = cache.scan(path, module.name, diagnostic);
        if (!scan) {
            return false;
        }
        for (const auto& decl : scan->declarations) {
            if (decl.kind == DeclKind::ENUMERATION) names->insert(decl.name);
        }
    }
    return true;
}

} // namespace

auto CoreBanValidator::checkCoreFiles(const WorkspaceModel& workspace, const ClassificationAssignment& assignment,
                                      SourceCache& cache, Diagnostic* diagnostic) const -> bool {
    size_t checked = 0;
    for (const auto& module : workspace.modules()) {
        const bool any_core = std::any_of(module.files.begin(), module.files.end(),
                                          [&assignment](const std::string& f) { return assignment.isCore(f); });
        if (!any_core) {
            continue;
        }

        std::set<std::string> module_enums;
        if (!collectModuleEnums(module, cache, &module_enums, diagnostic)) {
            return false;
        }

        for (const auto& path : module.files) {
            if (!assignment.isCore(path)) {
                continue;
            }
            const FileScan* scan = cache.scan(path, module.name, diagnostic);
            if (!scan) {
                return false;
            }
            const SourceFile* file = cache.file(path, module.name, diagnostic);
            if (!checkCoreFile(*file, *scan, module_enums, diagnostic)) {
                return false;
            }
            ++checked;
        }
    }
    LOG_INFO("Core bans: %zu core files clean", checked);
    return true;
}

auto CoreBanValidator::checkCoreFile(const SourceFile& file, const FileScan& scan,
                                     const std::set<std::string>& module_enums, Diagnostic* diagnostic) const
    -> bool {
    for (const auto& decl : scan.declarations) {
        if (!checkOptionalWrapper(file, decl, diagnostic) ||
            !checkParallelBoolean(file, decl, module_enums, diagnostic) ||
            !checkOptionalDuration(file, decl, diagnostic) || !checkBannedVariants(file, decl, diagnostic)) {
            return false;
        }
    }
    return true;
}

// ========== Individual bans ==========

auto CoreBanValidator::checkOptionalWrapper(const SourceFile& file, const Declaration& decl,
                                            Diagnostic* diagnostic) const -> bool {
    switch (decl.kind) {
        case DeclKind::AGGREGATE:
        case DeclKind::ENUMERATION:
            for (const auto& member : decl.members) {
                if (hasOptional(member.text)) {
                    return violation(diagnostic, file, member.line,
                                     std::string("optional wrapper in ") + memberNoun(member.kind) + " '" +
                                         member.name + "' of " + declKindToString(decl.kind) + " '" + decl.name +
                                         "'");
                }
            }
            break;
        case DeclKind::FUNCTION:
            if (hasOptional(decl.header)) {
                return violation(diagnostic, file, decl.line,
                                 "optional wrapper in signature of function '" + decl.name + "'");
            }
            break;
        case DeclKind::IMPL_BLOCK:
            if (!decl.isInherentImpl()) break;
            for (const auto& member : decl.members) {
                if (member.kind == MemberKind::METHOD && hasOptional(member.text)) {
                    return violation(diagnostic, file, member.line,
                                     "optional wrapper in signature of method '" + decl.self_type +
                                         "::" + member.name + "'");
                }
            }
            break;
        default:
            break;
    }
    return true;
}

auto CoreBanValidator::checkParallelBoolean(const SourceFile& file, const Declaration& decl,
                                            const std::set<std::string>& module_enums, Diagnostic* diagnostic) const
    -> bool {
    if (decl.kind != DeclKind::AGGREGATE || decl.is_tuple) {
        return true;
    }
    const Member* flag = nullptr;
    const Member* state = nullptr;
    for (const auto& member : decl.members) {
        if (member.kind != MemberKind::FIELD) continue;
        if (!flag && isBool(member.text)) {
            flag = &member;
        } else if (!state && module_enums.count(StructuralScanner::baseTypeName(member.text)) > 0) {
            state = &member;
        }
    }
    if (flag && state) {
        return violation(diagnostic, file, decl.line,
                         "aggregate '" + decl.name + "' pairs bool field '" + flag->name +
                             "' with enumeration field '" + state->name + ": " + state->text + "'");
    }
    return true;
}

auto CoreBanValidator::checkOptionalDuration(const SourceFile& file, const Declaration& decl,
                                             Diagnostic* diagnostic) const -> bool {
    if (decl.kind != DeclKind::INTERFACE && !decl.isInterfaceImpl()) {
        return true;
    }
    for (const auto& member : decl.members) {
        if (member.kind == MemberKind::METHOD && std::regex_search(member.text, optionalDurationPattern())) {
            const std::string owner = decl.kind == DeclKind::INTERFACE ? decl.name : decl.interface_name;
            return violation(diagnostic, file, member.line,
                             "interface method '" + owner + "::" + member.name + "' returns an optional duration");
        }
    }
    return true;
}

auto CoreBanValidator::checkBannedVariants(const SourceFile& file, const Declaration& decl,
                                           Diagnostic* diagnostic) const -> bool {
    if (decl.kind != DeclKind::ENUMERATION) {
        return true;
    }
    for (const auto& member : decl.members) {
        if (std::find(bans_.banned_variants.begin(), bans_.banned_variants.end(), member.name) !=
            bans_.banned_variants.end()) {
            return violation(diagnostic, file, member.line,
                             "enumeration '" + decl.name + "' declares placeholder variant '" + member.name + "'");
        }
    }
    return true;
}

// ========== Engine flags ==========

auto CoreBanValidator::checkEngineFlags(const WorkspaceModel& workspace, SourceCache& cache,
                                        Diagnostic* diagnostic) const -> bool {
    for (const auto& name : bans_.engine_modules) {
        const Module* module = workspace.findModule(name);
        if (!module) {
            LOG_DEBUG("Engine module %s not in workspace", name.c_str());
            continue;
        }
        for (const auto& path : module->files) {
            const FileScan* scan = cache.scan(path, module->name, diagnostic);
            if (!scan) {
                return false;
            }
            if (!checkEngineFile(*cache.file(path, module->name, diagnostic), *scan, diagnostic)) {
                return false;
            }
        }
    }
    return true;
}

auto CoreBanValidator::checkEngineFile(const SourceFile& file, const FileScan& scan, Diagnostic* diagnostic) const
    -> bool {
    for (const auto& decl : scan.declarations) {
        if (decl.kind != DeclKind::AGGREGATE) continue;
        for (const auto& member : decl.members) {
            if (member.kind != MemberKind::FIELD || !isBool(member.text)) continue;
            const std::string name = lowercase(member.name);
            for (const auto& marker : bans_.warned_flag_markers) {
                if (name.find(lowercase(marker)) != std::string::npos) {
                    return violation(diagnostic, file, member.line,
                                     "bool field '" + member.name + "' of '" + decl.name +
                                         "' tracks an already-emitted warning");
                }
            }
        }
    }
    return true;
}

} // namespace ArchGate
