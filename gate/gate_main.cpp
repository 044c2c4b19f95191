#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "common/logging.h"
#include "common/macros.h"
#include "config/gate_config.h"
#include "gate/diagnostic.h"
#include "gate/gate_orchestrator.h"

COLD_FUNCTION static void printUsage(const char* program) {
    const char* usage = R"(
USAGE: %s [OPTIONS]

archgate - architectural conformance gate for Cargo workspaces

OPTIONS:
    --root <dir>            Workspace root (default: .)
    --policy-dir <dir>      Policy documents (default: <root>/policy)
    --config <file>         Gate config (default: <policy-dir>/gate.toml if present)
    --log-file <file>       Write a run log (default: $ARCHGATE_LOG_FILE, else none)
    --log-level <level>     DEBUG, INFO, WARN or ERROR (default: INFO)
    --json                  Report a failure as one JSON object
    --help                  Show this help message

EXIT CODES:
    0 - Gate passed
    1 - Validation failure or missing policy document
    2 - Prerequisite unavailable (arguments, unreadable root or policy dir, bad config)
)";
    fprintf(stdout, usage, program);
}

static void report(const ArchGate::Diagnostic& diagnostic, bool json) {
    const std::string line = json ? ArchGate::formatDiagnosticJson(diagnostic) : ArchGate::formatDiagnostic(diagnostic);
    fprintf(stderr, "%s\n", line.c_str());
}

COLD_FUNCTION static auto usageError(const char* program, const std::string& message, bool json) -> int {
    ArchGate::Diagnostic diagnostic;
    ArchGate::fail(&diagnostic, ArchGate::ErrorKind::PREREQUISITE, program, 0, message);
    report(diagnostic, json);
    return ArchGate::ExitCode::PREREQUISITE_MISSING;
}

int main(int argc, char* argv[]) {
    ArchGate::GateConfig config;

    // --json decides the error format even for argument errors
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--json") == 0) {
            config.json_diagnostics = true;
        }
    }

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            printUsage(argv[0]);
            return ArchGate::ExitCode::PASS;
        }
        else if (std::strcmp(argv[i], "--root") == 0 && i + 1 < argc) {
            config.paths.root = argv[++i];
        }
        else if (std::strcmp(argv[i], "--policy-dir") == 0 && i + 1 < argc) {
            config.paths.policy_dir = argv[++i];
        }
        else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config.paths.config_file = argv[++i];
            config.paths.config_file_explicit = true;
        }
        else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            config.logging.file = argv[++i];
        }
        else if (std::strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            const char* level = argv[++i];
            if (!Common::Logger::parseLevel(level, &config.logging.level)) {
                return usageError(argv[0], std::string("unknown log level '") + level + "'", config.json_diagnostics);
            }
            config.logging.level_explicit = true;
        }
        else if (std::strcmp(argv[i], "--json") == 0) {
            continue;
        }
        else {
            return usageError(argv[0], std::string("unknown or incomplete option '") + argv[i] + "'",
                              config.json_diagnostics);
        }
    }

    ArchGate::Diagnostic diagnostic;
    if (!ArchGate::GateConfigLoader::load(&config, &diagnostic)) {
        report(diagnostic, config.json_diagnostics);
        return ArchGate::exitCodeFor(diagnostic);
    }

    if (config.logging.file.empty()) {
        const char* env_log = std::getenv("ARCHGATE_LOG_FILE");
        if (env_log) {
            config.logging.file = env_log;
        }
    }
    if (!Common::initLogging(config.logging.file, config.logging.level)) {
        return usageError(argv[0], "cannot open log file '" + config.logging.file + "'", config.json_diagnostics);
    }
    ArchGate::GateConfigLoader::printConfig(config);

    ArchGate::GateOrchestrator gate(config);
    const bool passed = gate.run(&diagnostic);
    if (passed) {
        fprintf(stdout, "archgate: conformance gate passed\n");
        LOG_INFO("Gate passed (%u stages)", gate.stagesPassed());
    } else {
        report(diagnostic, config.json_diagnostics);
    }

    Common::shutdownLogging();
    return ArchGate::exitCodeFor(diagnostic);
}
