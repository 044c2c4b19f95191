#include "policy_validators.h"

#include <algorithm>
#include <map>
#include <set>

#include "common/logging.h"
#include "scanner/source_text.h"

namespace ArchGate {

using Common::VisibilityRung;

namespace {

auto field(const std::string& list, size_t idx, const char* name) -> std::string {
    return list + "[" + std::to_string(idx) + "]." + name;
}

// Move a resolver diagnostic (located at the path) onto the document field
void relocate(Diagnostic* d, const std::string& source, const std::string& field_path) {
    d->message = field_path + " '" + d->location + "': " + d->message;
    d->location = source;
    d->line_number = 0;
}

// First parameter of the parameter list following `fn name`
auto firstParameter(const std::string& signature) -> std::string {
    size_t pos = signature.find("fn ");
    pos = pos == std::string::npos ? 0 : pos + 3;
    while (pos < signature.size() && (isIdentChar(signature[pos]) || signature[pos] == ' ')) ++pos;
    if (pos < signature.size() && signature[pos] == '<') {
        int generics = 0;
        for (; pos < signature.size(); ++pos) {
            if (signature[pos] == '<') {
                ++generics;
            } else if (signature[pos] == '>' && signature[pos - 1] != '-' && --generics == 0) {
                ++pos;
                break;
            }
        }
    }
    size_t open = signature.find('(', pos);
    if (open == std::string::npos) {
        return {};
    }
    int depth = 0;
    int angle = 0;
    size_t i = open;
    for (; i < signature.size(); ++i) {
        const char c = signature[i];
        if (c == '(') {
            ++depth;
        } else if (c == ')') {
            if (--depth == 0) break;
        } else if (c == '<') {
            ++angle;
        } else if (c == '>' && angle > 0 && signature[i - 1] != '-') {
            --angle;
        } else if (c == ',' && depth == 1 && angle == 0) {
            break;
        }
    }
    return std::string(trim(std::string_view(signature).substr(open + 1, i - open - 1)));
}

} // namespace

auto PolicyValidators::consumesReceiver(const std::string& signature) -> bool {
    std::string param = firstParameter(signature);
    param.erase(std::remove(param.begin(), param.end(), ' '), param.end());
    if (param.compare(0, 3, "mut") == 0 && param.size() > 3 && param[3] == 's') {
        param.erase(0, 3);
    }
    return param == "self" || param == "self:Self" || param == "self:Box<Self>";
}

auto PolicyValidators::resolveSymbolAt(const std::string& path, const std::string& source, const std::string& field,
                                       Diagnostic* diagnostic) -> bool {
    std::vector<SymbolMatch> matches;
    if (!resolver_.resolve(path, &matches, diagnostic)) {
        relocate(diagnostic, source, field);
        return false;
    }
    return true;
}

auto PolicyValidators::resolveModuleAt(const std::string& path, const std::string& source, const std::string& field,
                                       Diagnostic* diagnostic) -> bool {
    if (!resolver_.resolveModulePath(path, diagnostic)) {
        relocate(diagnostic, source, field);
        return false;
    }
    return true;
}

// ========== Invariant Registry ==========

auto PolicyValidators::validateRegistry(const InvariantRegistry& registry, Diagnostic* diagnostic) -> bool {
    for (size_t i = 0; i < registry.invariants.size(); ++i) {
        const auto& inv = registry.invariants[i];
        if (!resolveSymbolAt(inv.canonical_proof_type_path, registry.source,
                             field("invariants", i, "canonical_proof_type_path"), diagnostic) ||
            !resolveModuleAt(inv.authority_boundary_module_path, registry.source,
                             field("invariants", i, "authority_boundary_module_path"), diagnostic)) {
            return false;
        }
    }
    LOG_INFO("Invariant registry: %zu invariants resolve", registry.invariants.size());
    return true;
}

// ========== Authority Boundary Map ==========

auto PolicyValidators::validateAuthorityMap(const AuthorityBoundaryMap& map, Diagnostic* diagnostic) -> bool {
    for (size_t i = 0; i < map.entries.size(); ++i) {
        const auto& entry = map.entries[i];
        if (!resolveSymbolAt(entry.controlled_type_path, map.source, field("entries", i, "controlled_type_path"),
                             diagnostic) ||
            !resolveModuleAt(entry.boundary_module_path, map.source, field("entries", i, "boundary_module_path"),
                             diagnostic)) {
            return false;
        }
        for (size_t k = 0; k < entry.constructor_paths.size(); ++k) {
            const std::string where = field("entries", i, "constructor_paths") + "[" + std::to_string(k) + "]";
            if (!resolveSymbolAt(entry.constructor_paths[k], map.source, where, diagnostic)) {
                return false;
            }
        }
        for (size_t k = 0; k < entry.allowed_caller_module_paths.size(); ++k) {
            const std::string where =
                field("entries", i, "allowed_caller_module_paths") + "[" + std::to_string(k) + "]";
            if (!resolveModuleAt(entry.allowed_caller_module_paths[k], map.source, where, diagnostic)) {
                return false;
            }
        }
    }
    LOG_INFO("Authority boundary map: %zu entries resolve", map.entries.size());
    return true;
}

auto PolicyValidators::validateUnforgeability(const AuthorityBoundaryMap& map, Diagnostic* diagnostic) -> bool {
    for (size_t i = 0; i < map.entries.size(); ++i) {
        const auto& entry = map.entries[i];
        SymbolMatch type;
        if (!resolver_.findTypeDeclaration(entry.controlled_type_path, &type, diagnostic)) {
            relocate(diagnostic, map.source, field("entries", i, "controlled_type_path"));
            return false;
        }
        const Declaration& decl = *type.declaration;
        if (decl.kind != DeclKind::AGGREGATE) {
            LOG_DEBUG("Controlled type %s is a %s; no fields to check", entry.controlled_type_path.c_str(),
                      declKindToString(decl.kind));
            continue;
        }
        for (const auto& member : decl.members) {
            if (member.kind != MemberKind::FIELD && member.kind != MemberKind::SLOT) continue;
            if (member.visibility == VisibilityRung::PUBLIC ||
                Common::rungExceeds(member.visibility, entry.max_constructor_visibility_rung)) {
                return fail(diagnostic, ErrorKind::BAN_VIOLATION, type.file->path, member.line,
                            std::string(member.kind == MemberKind::FIELD ? "field '" : "positional slot '") +
                                member.name + "' of controlled type '" + decl.name + "' is " +
                                Common::rungToString(member.visibility) + " (ceiling " +
                                Common::rungToString(entry.max_constructor_visibility_rung) +
                                "); the type can be built outside its authority boundary");
            }
        }
    }
    return true;
}

auto PolicyValidators::validateConstructorRungs(const AuthorityBoundaryMap& map, Diagnostic* diagnostic) -> bool {
    for (size_t i = 0; i < map.entries.size(); ++i) {
        const auto& entry = map.entries[i];
        for (size_t k = 0; k < entry.constructor_paths.size(); ++k) {
            const std::string where = field("entries", i, "constructor_paths") + "[" + std::to_string(k) + "]";
            VisibilityRung rung = VisibilityRung::PRIVATE;
            if (!resolver_.constructorRung(entry.constructor_paths[k], &rung, diagnostic)) {
                relocate(diagnostic, map.source, where);
                return false;
            }
            if (Common::rungExceeds(rung, entry.max_constructor_visibility_rung)) {
                return fail(diagnostic, ErrorKind::VISIBILITY_EXCEEDANCE, map.source, 0,
                            where + " '" + entry.constructor_paths[k] + "': visibility " +
                                Common::rungToString(rung) + " exceeds ceiling " +
                                Common::rungToString(entry.max_constructor_visibility_rung));
            }
            LOG_DEBUG("Constructor %s at %s (ceiling %s)", entry.constructor_paths[k].c_str(),
                      Common::rungToString(rung), Common::rungToString(entry.max_constructor_visibility_rung));
        }
    }
    return true;
}

// ========== Parametricity Rules ==========

auto PolicyValidators::validateParametricity(const ParametricityRules& rules, Diagnostic* diagnostic) -> bool {
    if (rules.banned_patterns.empty() || rules.required_interface_disclosures.empty()) {
        return fail(diagnostic, ErrorKind::SCHEMA, rules.source, 0,
                    "banned_patterns and required_interface_disclosures must be non-empty");
    }
    LOG_INFO("Parametricity rules: %zu banned patterns, %zu required disclosures", rules.banned_patterns.size(),
             rules.required_interface_disclosures.size());
    return true;
}

// ========== Move Semantics Rules ==========

auto PolicyValidators::validateMoveSemantics(const MoveSemanticsRules& rules, Diagnostic* diagnostic) -> bool {
    for (size_t i = 0; i < rules.state_bearing_types.size(); ++i) {
        const auto& type = rules.state_bearing_types[i];
        if (!resolveSymbolAt(type.type_path, rules.source, field("state_bearing_types", i, "type_path"),
                             diagnostic)) {
            return false;
        }

        for (size_t k = 0; k < type.consumed_transition_methods.size(); ++k) {
            const auto& method = type.consumed_transition_methods[k];
            const std::string where = "state_bearing_types[" + std::to_string(i) + "].consumed_transition_methods[" +
                                      std::to_string(k) + "]";
            if (trim(method.post_move_unusability_guarantee).empty()) {
                return fail(diagnostic, ErrorKind::SCHEMA, rules.source, 0,
                            where + ".post_move_unusability_guarantee: must be non-empty");
            }

            std::vector<SymbolMatch> matches;
            if (!resolver_.resolve(method.method_path, &matches, diagnostic)) {
                relocate(diagnostic, rules.source, where + ".method_path");
                return false;
            }
            bool found_method = false;
            for (const auto& m : matches) {
                if (!m.member || m.member->kind != MemberKind::METHOD) continue;
                found_method = true;
                if (!consumesReceiver(m.member->text)) {
                    return fail(diagnostic, ErrorKind::BAN_VIOLATION, m.file->path, m.line,
                                "transition '" + method.method_path + "' does not consume its receiver (" +
                                    firstParameter(m.member->text) + ")");
                }
            }
            if (!found_method) {
                return fail(diagnostic, ErrorKind::UNRESOLVED_SYMBOL, rules.source, 0,
                            where + ".method_path '" + method.method_path + "': does not name a method");
            }
        }
    }
    LOG_INFO("Move semantics rules: %zu state-bearing types", rules.state_bearing_types.size());
    return true;
}

// ========== DRY Proof Map ==========

auto PolicyValidators::validateDryMap(const DryProofMap& map, const InvariantRegistry& registry,
                                      Diagnostic* diagnostic) -> bool {
    std::set<std::string> registered;
    for (const auto& inv : registry.invariants) {
        registered.insert(inv.id);
    }

    std::set<std::string> seen;
    std::map<std::string, std::string> proof_owner;  // proof type path -> invariant id
    for (size_t i = 0; i < map.entries.size(); ++i) {
        const auto& entry = map.entries[i];
        const std::string where = "entries[" + std::to_string(i) + "]";

        if (registered.count(entry.invariant_id) == 0) {
            return fail(diagnostic, ErrorKind::CONSISTENCY, map.source, 0,
                        where + ".invariant_id: '" + entry.invariant_id + "' is not in the invariant registry");
        }
        if (!seen.insert(entry.invariant_id).second) {
            return fail(diagnostic, ErrorKind::CONSISTENCY, map.source, 0,
                        where + ".invariant_id: '" + entry.invariant_id + "' is mapped more than once");
        }
        auto [owner, inserted] = proof_owner.emplace(entry.canonical_proof_type_path, entry.invariant_id);
        if (!inserted) {
            return fail(diagnostic, ErrorKind::CONSISTENCY, map.source, 0,
                        where + ".canonical_proof_type_path: '" + entry.canonical_proof_type_path +
                            "' already proves invariant '" + owner->second + "'");
        }
    }

    std::string missing;
    for (const auto& inv : registry.invariants) {
        if (seen.count(inv.id) == 0) {
            if (!missing.empty()) missing += ", ";
            missing += inv.id;
        }
    }
    if (!missing.empty()) {
        return fail(diagnostic, ErrorKind::CONSISTENCY, map.source, 0,
                    "registry invariants without a DRY proof entry: " + missing);
    }

    for (size_t i = 0; i < map.entries.size(); ++i) {
        const auto& entry = map.entries[i];
        if (!resolveSymbolAt(entry.canonical_proof_type_path, map.source,
                             field("entries", i, "canonical_proof_type_path"), diagnostic) ||
            !resolveModuleAt(entry.authority_boundary_module_path, map.source,
                             field("entries", i, "authority_boundary_module_path"), diagnostic)) {
            return false;
        }
    }
    LOG_INFO("DRY proof map: %zu entries cover the registry", map.entries.size());
    return true;
}

} // namespace ArchGate
