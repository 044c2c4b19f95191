#pragma once

#include <string>

#include "gate/diagnostic.h"
#include "policy/policy_documents.h"
#include "scanner/symbol_resolver.h"

namespace ArchGate {

/// Document-driven checks. Each stops at its first violation; locations are
/// the document plus the offending field path, or the source file and line
/// for structural findings.
class PolicyValidators {
public:
    explicit PolicyValidators(SymbolResolver& resolver) noexcept : resolver_(resolver) {}

    /// Proof type paths resolve; boundary module paths resolve as module paths.
    [[nodiscard]] auto validateRegistry(const InvariantRegistry& registry, Diagnostic* diagnostic) -> bool;

    /// Controlled types, boundary modules, constructors and allowed callers resolve.
    [[nodiscard]] auto validateAuthorityMap(const AuthorityBoundaryMap& map, Diagnostic* diagnostic) -> bool;

    /// No field or positional slot of a controlled aggregate is `pub` or
    /// more visible than the entry's ceiling.
    [[nodiscard]] auto validateUnforgeability(const AuthorityBoundaryMap& map, Diagnostic* diagnostic) -> bool;

    /// Each constructor's derived rung stays within the ceiling.
    [[nodiscard]] auto validateConstructorRungs(const AuthorityBoundaryMap& map, Diagnostic* diagnostic) -> bool;

    /// Schema only; the loader already enforced it.
    [[nodiscard]] auto validateParametricity(const ParametricityRules& rules, Diagnostic* diagnostic) -> bool;

    /// Types and transitions resolve; every transition takes `self` by value.
    [[nodiscard]] auto validateMoveSemantics(const MoveSemanticsRules& rules, Diagnostic* diagnostic) -> bool;

    /// DRY map ids equal registry ids; paths agree with the registry, proof
    /// types are not shared, every path resolves.
    [[nodiscard]] auto validateDryMap(const DryProofMap& map, const InvariantRegistry& registry,
                                      Diagnostic* diagnostic) -> bool;

    /// True when `signature` takes its receiver by value (`self`, `mut self`,
    /// `self: Self`, `self: Box<Self>`).
    [[nodiscard]] static auto consumesReceiver(const std::string& signature) -> bool;

private:
    [[nodiscard]] auto resolveSymbolAt(const std::string& path, const std::string& source, const std::string& field,
                                       Diagnostic* diagnostic) -> bool;
    [[nodiscard]] auto resolveModuleAt(const std::string& path, const std::string& source, const std::string& field,
                                       Diagnostic* diagnostic) -> bool;

    SymbolResolver& resolver_;
};

} // namespace ArchGate
