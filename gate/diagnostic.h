#pragma once

#include <cstdint>
#include <string>

#include "common/macros.h"

namespace ArchGate {

/// Failure categories. Every one is fatal to the run.
enum class ErrorKind : uint8_t {
    NONE = 0,
    MISSING_DOCUMENT = 1,       // required policy document absent
    SCHEMA = 2,                 // malformed policy document
    CONFIG = 3,                 // malformed root manifest or gate config
    WORKSPACE_HEALTH = 4,       // missing sources or README-equivalents (batched)
    CLASSIFICATION = 5,         // ambiguous, missing or dead classification rule
    UNKNOWN_MODULE = 6,         // path names a module the workspace lacks
    UNRESOLVED_SYMBOL = 7,      // path does not resolve to source evidence
    BAN_VIOLATION = 8,          // structural ban violated
    VISIBILITY_EXCEEDANCE = 9,  // constructor rung above its declared ceiling
    CONSISTENCY = 10,           // DRY map / registry bijection broken
    PREREQUISITE = 11           // gate cannot start (arguments, unreadable roots)
};

/// Exit statuses of the gate process.
namespace ExitCode {
    constexpr int PASS = 0;
    constexpr int FAILURE = 1;
    constexpr int PREREQUISITE_MISSING = 2;
}

/// The single actionable diagnostic of a failed run: which kind, where
/// (document field path or workspace-relative file), which line (0 when the
/// location is a document field) and what.
struct Diagnostic {
    ErrorKind kind{ErrorKind::NONE};
    std::string location;
    uint32_t line_number{0};
    std::string message;

    [[nodiscard]] auto failed() const noexcept -> bool { return kind != ErrorKind::NONE; }
    void clear() noexcept;
};

[[nodiscard]] auto errorKindName(ErrorKind kind) noexcept -> const char*;

[[nodiscard]] auto exitCodeFor(const Diagnostic& diagnostic) noexcept -> int;

/// Fill `out` and return false, so validators can `return fail(...)`.
COLD_FUNCTION auto fail(Diagnostic* out, ErrorKind kind, std::string location, uint32_t line_number,
          std::string message) -> bool;

/// `error: [Kind] location:line: message`
[[nodiscard]] auto formatDiagnostic(const Diagnostic& diagnostic) -> std::string;

/// Compact single-line JSON object for CI annotations.
[[nodiscard]] auto formatDiagnosticJson(const Diagnostic& diagnostic) -> std::string;

} // namespace ArchGate
