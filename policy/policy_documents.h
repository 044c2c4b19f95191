#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "common/types.h"

namespace ArchGate {

/// The six policy document kinds, in the order the gate consumes them.
enum class DocumentKind : uint8_t {
    CLASSIFICATION_MAP = 0,
    INVARIANT_REGISTRY = 1,
    AUTHORITY_BOUNDARY_MAP = 2,
    PARAMETRICITY_RULES = 3,
    MOVE_SEMANTICS_RULES = 4,
    DRY_PROOF_MAP = 5
};

constexpr size_t DOCUMENT_KIND_COUNT = 6;

constexpr std::array<DocumentKind, DOCUMENT_KIND_COUNT> ALL_DOCUMENT_KINDS = {
    DocumentKind::CLASSIFICATION_MAP,
    DocumentKind::INVARIANT_REGISTRY,
    DocumentKind::AUTHORITY_BOUNDARY_MAP,
    DocumentKind::PARAMETRICITY_RULES,
    DocumentKind::MOVE_SEMANTICS_RULES,
    DocumentKind::DRY_PROOF_MAP
};

[[nodiscard]] auto documentFileName(DocumentKind kind) noexcept -> const char*;

[[nodiscard]] inline auto documentPath(const std::filesystem::path& policy_dir, DocumentKind kind)
    -> std::filesystem::path {
    return policy_dir / documentFileName(kind);
}

// ========== Invariant Registry ==========

struct InvariantEntry {
    std::string id;
    std::string predicate;
    std::string canonical_proof_type_path;
    std::string authority_boundary_module_path;
};

struct InvariantRegistry {
    std::string source;
    int64_t version{0};
    std::vector<InvariantEntry> invariants;
};

// ========== Authority Boundary Map ==========

struct AuthorityEntry {
    std::string controlled_type_path;
    std::string boundary_module_path;
    std::vector<std::string> constructor_paths;
    std::vector<std::string> allowed_caller_module_paths;
    Common::VisibilityRung max_constructor_visibility_rung{Common::VisibilityRung::PRIVATE};
};

struct AuthorityBoundaryMap {
    std::string source;
    int64_t version{0};
    std::vector<AuthorityEntry> entries;
};

// ========== Parametricity Rules ==========

struct ParametricityRules {
    std::string source;
    int64_t version{0};
    // String entries verbatim; table entries by their first string value
    std::vector<std::string> banned_patterns;
    std::vector<std::string> required_interface_disclosures;
};

// ========== Move Semantics Rules ==========

struct TransitionMethod {
    std::string method_path;
    bool consumes_self{false};
    std::string post_move_unusability_guarantee;
};

struct StateBearingType {
    std::string type_path;
    std::vector<TransitionMethod> consumed_transition_methods;
};

struct MoveSemanticsRules {
    std::string source;
    int64_t version{0};
    std::vector<StateBearingType> state_bearing_types;
};

// ========== DRY Proof Map ==========

struct DryEntry {
    std::string invariant_id;
    std::string canonical_proof_type_path;
    std::string authority_boundary_module_path;
};

struct DryProofMap {
    std::string source;
    int64_t version{0};
    std::vector<DryEntry> entries;
};

// ========== Classification Map ==========

struct ClassificationRule {
    std::string prefix;
    Common::Classification classification{Common::Classification::CORE};
};

struct ClassificationMap {
    std::string source;
    int64_t version{0};
    std::vector<ClassificationRule> rules;  // document order
};

} // namespace ArchGate
