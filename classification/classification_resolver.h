#pragma once

#include <map>
#include <string>
#include <vector>

#include "common/types.h"
#include "gate/diagnostic.h"
#include "policy/policy_documents.h"

namespace ArchGate {

/// Total file -> classification map of one run.
struct ClassificationAssignment {
    std::map<std::string, Common::Classification> by_file;

    [[nodiscard]] auto isCore(const std::string& file) const noexcept -> bool {
        auto it = by_file.find(file);
        return it != by_file.end() && it->second == Common::Classification::CORE;
    }
};

/// Longest-prefix classification of workspace files.
class ClassificationResolver {
public:
    /// Indices of the rules matching `file` at the maximal prefix length.
    /// ClassificationError when no rule matches or the tied rules disagree on
    /// the classification.
    [[nodiscard]] static auto classifyFile(const ClassificationMap& map, const std::string& file,
                                           std::vector<size_t>* winners, Diagnostic* diagnostic) noexcept -> bool;

    /// Classify every file, then reject rules that never won a file. Every
    /// rule of an agreeing tie counts as a winner.
    [[nodiscard]] static auto classify(const ClassificationMap& map, const std::vector<std::string>& files,
                                       ClassificationAssignment* out, Diagnostic* diagnostic) noexcept -> bool;

    ClassificationResolver() = delete;
};

} // namespace ArchGate
