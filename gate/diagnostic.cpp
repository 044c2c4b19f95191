#include "diagnostic.h"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <utility>

namespace ArchGate {

void Diagnostic::clear() noexcept {
    kind = ErrorKind::NONE;
    location.clear();
    line_number = 0;
    message.clear();
}

auto errorKindName(ErrorKind kind) noexcept -> const char* {
    switch (kind) {
        case ErrorKind::NONE:                  return "None";
        case ErrorKind::MISSING_DOCUMENT:      return "MissingDocument";
        case ErrorKind::SCHEMA:                return "SchemaError";
        case ErrorKind::CONFIG:                return "ConfigError";
        case ErrorKind::WORKSPACE_HEALTH:      return "WorkspaceHealthError";
        case ErrorKind::CLASSIFICATION:        return "ClassificationError";
        case ErrorKind::UNKNOWN_MODULE:        return "UnknownModuleError";
        case ErrorKind::UNRESOLVED_SYMBOL:     return "UnresolvedSymbolError";
        case ErrorKind::BAN_VIOLATION:         return "BanViolationError";
        case ErrorKind::VISIBILITY_EXCEEDANCE: return "VisibilityExceedanceError";
        case ErrorKind::CONSISTENCY:           return "ConsistencyError";
        case ErrorKind::PREREQUISITE:          return "PrerequisiteError";
    }
    return "UnknownError";
}

auto exitCodeFor(const Diagnostic& diagnostic) noexcept -> int {
    if (!diagnostic.failed()) {
        return ExitCode::PASS;
    }
    if (diagnostic.kind == ErrorKind::PREREQUISITE) {
        return ExitCode::PREREQUISITE_MISSING;
    }
    return ExitCode::FAILURE;
}

auto fail(Diagnostic* out, ErrorKind kind, std::string location, uint32_t line_number,
          std::string message) -> bool {
    out->kind = kind;
    out->location = std::move(location);
    out->line_number = line_number;
    out->message = std::move(message);
    return false;
}

auto formatDiagnostic(const Diagnostic& diagnostic) -> std::string {
    std::string line = "error: [";
    line += errorKindName(diagnostic.kind);
    line += "] ";
    line += diagnostic.location;
    if (diagnostic.line_number > 0) {
        line += ":";
        line += std::to_string(diagnostic.line_number);
    }
    line += ": ";
    line += diagnostic.message;

    // Exactly one line on the error stream
    for (char& c : line) {
        if (c == '\n' || c == '\r') {
            c = ' ';
        }
    }
    return line;
}

auto formatDiagnosticJson(const Diagnostic& diagnostic) -> std::string {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("kind");
    writer.String(errorKindName(diagnostic.kind));
    writer.Key("location");
    writer.String(diagnostic.location.c_str(), static_cast<rapidjson::SizeType>(diagnostic.location.size()));
    writer.Key("line");
    writer.Uint(diagnostic.line_number);
    writer.Key("message");
    writer.String(diagnostic.message.c_str(), static_cast<rapidjson::SizeType>(diagnostic.message.size()));
    writer.EndObject();

    return std::string(buffer.GetString(), buffer.GetSize());
}

} // namespace ArchGate
