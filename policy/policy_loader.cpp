#include "policy_loader.h"

#include <set>
#include <system_error>

#include "common/logging.h"
#include "config/toml_reader.h"

namespace ArchGate {

auto documentFileName(DocumentKind kind) noexcept -> const char* {
    switch (kind) {
        case DocumentKind::CLASSIFICATION_MAP:     return "classification_map.toml";
        case DocumentKind::INVARIANT_REGISTRY:     return "invariant_registry.toml";
        case DocumentKind::AUTHORITY_BOUNDARY_MAP: return "authority_boundary_map.toml";
        case DocumentKind::PARAMETRICITY_RULES:    return "parametricity_rules.toml";
        case DocumentKind::MOVE_SEMANTICS_RULES:   return "move_semantics_rules.toml";
        case DocumentKind::DRY_PROOF_MAP:          return "dry_proof_map.toml";
    }
    return "";
}

namespace {

using Common::TomlValue;

// Field-level helpers. `where` is the field path inside the document
// ("entries[2].constructor_paths"); the document path is the location.

auto schemaError(Diagnostic* d, const std::string& source, const std::string& where, const std::string& what)
    -> bool {
    return fail(d, ErrorKind::SCHEMA, source, 0, "field '" + where + "' " + what);
}

auto indexed(const std::string& list, size_t idx) -> std::string {
    return list + "[" + std::to_string(idx) + "]";
}

auto loadDocument(const std::filesystem::path& path, TomlValue* doc, int64_t* version, Diagnostic* d) -> bool {
    const std::string source = path.string();
    Common::TomlParseError parse_error;
    if (!Common::TomlReader::parseFile(path, doc, &parse_error)) {
        return fail(d, ErrorKind::SCHEMA, source, static_cast<uint32_t>(parse_error.line),
                    "not a valid TOML document: " + parse_error.message);
    }
    if (!doc->isTable()) {
        return fail(d, ErrorKind::SCHEMA, source, 0, "top-level value must be a table");
    }
    const TomlValue* v = doc->find("version");
    if (!v || !v->isInteger() || v->asInteger() <= 0) {
        return schemaError(d, source, "version", "must be a positive integer");
    }
    *version = v->asInteger();
    LOG_DEBUG("Loaded %s (version %lld)", source.c_str(), static_cast<long long>(*version));
    return true;
}

auto requireString(const TomlValue& table, const char* key, const std::string& source, const std::string& prefix,
                   std::string* out, Diagnostic* d) -> bool {
    const std::string where = prefix.empty() ? std::string(key) : prefix + "." + key;
    const TomlValue* v = table.find(key);
    if (!v) {
        return schemaError(d, source, where, "is missing");
    }
    if (!v->isString()) {
        return schemaError(d, source, where, "must be a string");
    }
    const std::string& s = v->asString();
    if (s.find_first_not_of(" \t\r\n") == std::string::npos) {
        return schemaError(d, source, where, "must be a non-empty string");
    }
    *out = s;
    return true;
}

auto requireList(const TomlValue& table, const char* key, const std::string& source, const std::string& prefix,
                 const TomlValue** out, Diagnostic* d) -> bool {
    const std::string where = prefix.empty() ? std::string(key) : prefix + "." + key;
    const TomlValue* v = table.find(key);
    if (!v) {
        return schemaError(d, source, where, "is missing");
    }
    if (!v->isArray() || v->size() == 0) {
        return schemaError(d, source, where, "must be a non-empty list");
    }
    *out = v;
    return true;
}

auto requireStringList(const TomlValue& table, const char* key, const std::string& source,
                       const std::string& prefix, std::vector<std::string>* out, Diagnostic* d) -> bool {
    const TomlValue* list = nullptr;
    if (!requireList(table, key, source, prefix, &list, d)) {
        return false;
    }
    const std::string where = prefix.empty() ? std::string(key) : prefix + "." + key;
    size_t idx = 0;
    for (const auto& item : list->asArray()) {
        if (!item.isString() || item.asString().find_first_not_of(" \t") == std::string::npos) {
            return schemaError(d, source, indexed(where, idx), "must be a non-empty string");
        }
        out->push_back(item.asString());
        ++idx;
    }
    return true;
}

auto requireTable(const TomlValue& item, const std::string& source, const std::string& where, Diagnostic* d)
    -> bool {
    if (!item.isTable()) {
        return schemaError(d, source, where, "must be a table");
    }
    return true;
}

// Parametricity lists hold either pattern strings or descriptive tables
auto readRuleList(const TomlValue& doc, const char* key, const std::string& source,
                  std::vector<std::string>* out, Diagnostic* d) -> bool {
    const TomlValue* list = nullptr;
    if (!requireList(doc, key, source, "", &list, d)) {
        return false;
    }
    size_t idx = 0;
    for (const auto& item : list->asArray()) {
        if (item.isString() && item.asString().find_first_not_of(" \t") != std::string::npos) {
            out->push_back(item.asString());
        } else if (item.isTable() && !item.keys().empty()) {
            std::string label;
            for (const auto& k : item.keys()) {
                const TomlValue* field = item.find(k);
                if (field && field->isString() && !field->asString().empty()) {
                    label = field->asString();
                    break;
                }
            }
            out->push_back(label.empty() ? item.keys().front() : label);
        } else {
            return schemaError(d, source, indexed(key, idx), "must be a non-empty string or table");
        }
        ++idx;
    }
    return true;
}

auto isTraversalFree(const std::string& prefix) noexcept -> bool {
    if (prefix.empty() || prefix[0] == '/' || prefix.find('\\') != std::string::npos) {
        return false;
    }
    if (prefix.size() >= 2 && prefix[1] == ':') {
        return false;  // drive letter
    }
    size_t start = 0;
    while (start <= prefix.size()) {
        size_t slash = prefix.find('/', start);
        std::string segment = prefix.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
        if (segment == "..") {
            return false;
        }
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }
    return true;
}

} // namespace

auto PolicyLoader::checkRequiredDocuments(const std::filesystem::path& policy_dir, Diagnostic* diagnostic) noexcept
    -> bool {
    for (DocumentKind kind : ALL_DOCUMENT_KINDS) {
        const auto path = documentPath(policy_dir, kind);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            return fail(diagnostic, ErrorKind::MISSING_DOCUMENT, path.string(), 0,
                        "missing required policy document");
        }
    }
    return true;
}

auto PolicyLoader::loadInvariantRegistry(const std::filesystem::path& path, InvariantRegistry* out,
                                         Diagnostic* diagnostic) noexcept -> bool {
    TomlValue doc;
    out->source = path.string();
    if (!loadDocument(path, &doc, &out->version, diagnostic)) {
        return false;
    }

    const TomlValue* list = nullptr;
    if (!requireList(doc, "invariants", out->source, "", &list, diagnostic)) {
        return false;
    }

    std::set<std::string> ids;
    size_t idx = 0;
    for (const auto& item : list->asArray()) {
        const std::string where = indexed("invariants", idx++);
        if (!requireTable(item, out->source, where, diagnostic)) {
            return false;
        }
        InvariantEntry entry;
        if (!requireString(item, "id", out->source, where, &entry.id, diagnostic) ||
            !requireString(item, "predicate", out->source, where, &entry.predicate, diagnostic) ||
            !requireString(item, "canonical_proof_type_path", out->source, where,
                           &entry.canonical_proof_type_path, diagnostic) ||
            !requireString(item, "authority_boundary_module_path", out->source, where,
                           &entry.authority_boundary_module_path, diagnostic)) {
            return false;
        }
        if (!ids.insert(entry.id).second) {
            return schemaError(diagnostic, out->source, where + ".id", "duplicates invariant id '" + entry.id + "'");
        }
        out->invariants.push_back(std::move(entry));
    }
    return true;
}

auto PolicyLoader::loadAuthorityBoundaryMap(const std::filesystem::path& path, AuthorityBoundaryMap* out,
                                            Diagnostic* diagnostic) noexcept -> bool {
    TomlValue doc;
    out->source = path.string();
    if (!loadDocument(path, &doc, &out->version, diagnostic)) {
        return false;
    }

    const TomlValue* list = nullptr;
    if (!requireList(doc, "entries", out->source, "", &list, diagnostic)) {
        return false;
    }

    size_t idx = 0;
    for (const auto& item : list->asArray()) {
        const std::string where = indexed("entries", idx++);
        if (!requireTable(item, out->source, where, diagnostic)) {
            return false;
        }
        AuthorityEntry entry;
        std::string ceiling;
        if (!requireString(item, "controlled_type_path", out->source, where, &entry.controlled_type_path,
                           diagnostic) ||
            !requireString(item, "boundary_module_path", out->source, where, &entry.boundary_module_path,
                           diagnostic) ||
            !requireStringList(item, "constructor_paths", out->source, where, &entry.constructor_paths,
                               diagnostic) ||
            !requireStringList(item, "allowed_caller_module_paths", out->source, where,
                               &entry.allowed_caller_module_paths, diagnostic) ||
            !requireString(item, "max_constructor_visibility_rung", out->source, where, &ceiling, diagnostic)) {
            return false;
        }
        if (!Common::parseRung(ceiling, &entry.max_constructor_visibility_rung)) {
            return schemaError(diagnostic, out->source, where + ".max_constructor_visibility_rung",
                               "must be one of private, pub(super), pub(crate), pub (got '" + ceiling + "')");
        }
        out->entries.push_back(std::move(entry));
    }
    return true;
}

auto PolicyLoader::loadParametricityRules(const std::filesystem::path& path, ParametricityRules* out,
                                          Diagnostic* diagnostic) noexcept -> bool {
    TomlValue doc;
    out->source = path.string();
    if (!loadDocument(path, &doc, &out->version, diagnostic)) {
        return false;
    }
    return readRuleList(doc, "banned_patterns", out->source, &out->banned_patterns, diagnostic) &&
           readRuleList(doc, "required_interface_disclosures", out->source, &out->required_interface_disclosures,
                        diagnostic);
}

auto PolicyLoader::loadMoveSemanticsRules(const std::filesystem::path& path, MoveSemanticsRules* out,
                                          Diagnostic* diagnostic) noexcept -> bool {
    TomlValue doc;
    out->source = path.string();
    if (!loadDocument(path, &doc, &out->version, diagnostic)) {
        return false;
    }

    const TomlValue* list = nullptr;
    if (!requireList(doc, "state_bearing_types", out->source, "", &list, diagnostic)) {
        return false;
    }

    size_t idx = 0;
    for (const auto& item : list->asArray()) {
        const std::string where = indexed("state_bearing_types", idx++);
        if (!requireTable(item, out->source, where, diagnostic)) {
            return false;
        }
        StateBearingType type;
        if (!requireString(item, "type_path", out->source, where, &type.type_path, diagnostic)) {
            return false;
        }

        const TomlValue* transitions = nullptr;
        if (!requireList(item, "consumed_transition_methods", out->source, where, &transitions, diagnostic)) {
            return false;
        }
        size_t t_idx = 0;
        for (const auto& t : transitions->asArray()) {
            const std::string t_where = indexed(where + ".consumed_transition_methods", t_idx++);
            if (!requireTable(t, out->source, t_where, diagnostic)) {
                return false;
            }
            TransitionMethod method;
            if (!requireString(t, "method_path", out->source, t_where, &method.method_path, diagnostic)) {
                return false;
            }
            const TomlValue* consumes = t.find("consumes_self");
            if (!consumes || !consumes->isBoolean() || !consumes->asBoolean()) {
                return schemaError(diagnostic, out->source, t_where + ".consumes_self",
                                   "must be true for transition '" + method.method_path + "'");
            }
            method.consumes_self = true;
            if (!requireString(t, "post_move_unusability_guarantee", out->source, t_where,
                               &method.post_move_unusability_guarantee, diagnostic)) {
                return false;
            }
            type.consumed_transition_methods.push_back(std::move(method));
        }
        out->state_bearing_types.push_back(std::move(type));
    }
    return true;
}

auto PolicyLoader::loadDryProofMap(const std::filesystem::path& path, DryProofMap* out,
                                   Diagnostic* diagnostic) noexcept -> bool {
    TomlValue doc;
    out->source = path.string();
    if (!loadDocument(path, &doc, &out->version, diagnostic)) {
        return false;
    }

    const TomlValue* list = nullptr;
    if (!requireList(doc, "entries", out->source, "", &list, diagnostic)) {
        return false;
    }

    size_t idx = 0;
    for (const auto& item : list->asArray()) {
        const std::string where = indexed("entries", idx++);
        if (!requireTable(item, out->source, where, diagnostic)) {
            return false;
        }
        DryEntry entry;
        if (!requireString(item, "invariant_id", out->source, where, &entry.invariant_id, diagnostic) ||
            !requireString(item, "canonical_proof_type_path", out->source, where,
                           &entry.canonical_proof_type_path, diagnostic) ||
            !requireString(item, "authority_boundary_module_path", out->source, where,
                           &entry.authority_boundary_module_path, diagnostic)) {
            return false;
        }
        out->entries.push_back(std::move(entry));
    }
    return true;
}

auto PolicyLoader::loadClassificationMap(const std::filesystem::path& path, ClassificationMap* out,
                                         Diagnostic* diagnostic) noexcept -> bool {
    TomlValue doc;
    out->source = path.string();
    if (!loadDocument(path, &doc, &out->version, diagnostic)) {
        return false;
    }

    const TomlValue* list = nullptr;
    if (!requireList(doc, "rules", out->source, "", &list, diagnostic)) {
        return false;
    }

    size_t idx = 0;
    for (const auto& item : list->asArray()) {
        const std::string where = indexed("rules", idx++);
        if (!requireTable(item, out->source, where, diagnostic)) {
            return false;
        }
        ClassificationRule rule;
        std::string classification;
        if (!requireString(item, "prefix", out->source, where, &rule.prefix, diagnostic) ||
            !requireString(item, "classification", out->source, where, &classification, diagnostic)) {
            return false;
        }
        if (!isTraversalFree(rule.prefix)) {
            return schemaError(diagnostic, out->source, where + ".prefix",
                               "must be workspace-relative without '..' segments (got '" + rule.prefix + "')");
        }
        if (!Common::parseClassification(classification, &rule.classification)) {
            return schemaError(diagnostic, out->source, where + ".classification",
                               "must be one of core, boundary (got '" + classification + "')");
        }
        out->rules.push_back(std::move(rule));
    }
    return true;
}

} // namespace ArchGate
