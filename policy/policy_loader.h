#pragma once

#include <filesystem>

#include "gate/diagnostic.h"
#include "policy/policy_documents.h"

namespace ArchGate {

/// Loads policy documents into their typed schema. Every document is a TOML
/// table with a positive-integer `version`; any shape error is a SchemaError
/// naming the document and the field path.
class PolicyLoader {
public:
    /// MissingDocument on the first absent document, in ALL_DOCUMENT_KINDS order.
    [[nodiscard]] static auto checkRequiredDocuments(const std::filesystem::path& policy_dir,
                                                     Diagnostic* diagnostic) noexcept -> bool;

    [[nodiscard]] static auto loadInvariantRegistry(const std::filesystem::path& path, InvariantRegistry* out,
                                                    Diagnostic* diagnostic) noexcept -> bool;

    [[nodiscard]] static auto loadAuthorityBoundaryMap(const std::filesystem::path& path, AuthorityBoundaryMap* out,
                                                       Diagnostic* diagnostic) noexcept -> bool;

    [[nodiscard]] static auto loadParametricityRules(const std::filesystem::path& path, ParametricityRules* out,
                                                     Diagnostic* diagnostic) noexcept -> bool;

    [[nodiscard]] static auto loadMoveSemanticsRules(const std::filesystem::path& path, MoveSemanticsRules* out,
                                                     Diagnostic* diagnostic) noexcept -> bool;

    [[nodiscard]] static auto loadDryProofMap(const std::filesystem::path& path, DryProofMap* out,
                                              Diagnostic* diagnostic) noexcept -> bool;

    [[nodiscard]] static auto loadClassificationMap(const std::filesystem::path& path, ClassificationMap* out,
                                                    Diagnostic* diagnostic) noexcept -> bool;

    PolicyLoader() = delete;
};

} // namespace ArchGate
