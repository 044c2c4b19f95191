#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "common/logging.h"
#include "gate/diagnostic.h"

namespace ArchGate {

// Complete gate configuration: command line over gate.toml over defaults
struct GateConfig {
    // Locations
    struct Paths {
        std::filesystem::path root{"."};
        std::filesystem::path policy_dir;   // empty: <root>/policy
        std::filesystem::path config_file;  // empty: <policy_dir>/gate.toml if present
        bool config_file_explicit{false};
    } paths;

    // Workspace layout
    struct Workspace {
        std::string manifest{"Cargo.toml"};
        std::string source_dir{"src"};
        std::vector<std::string> source_extensions{".rs"};
        std::vector<std::string> readme_names{"README.md", "README", "README.txt", "readme.md"};
    } workspace;

    // Structural ban vocabulary
    struct Bans {
        std::vector<std::string> engine_modules{"engine"};
        std::vector<std::string> banned_variants{"Unknown", "Other", "Placeholder", "Unspecified",
                                                 "Todo", "Tbd", "Misc"};
        std::vector<std::string> warned_flag_markers{"warned", "warning_shown", "warning_emitted",
                                                     "warning_logged"};
    } bans;

    // Logging
    struct Logging {
        std::string file;
        Common::Logger::Level level{Common::Logger::INFO};
        bool level_explicit{false};
    } logging;

    // Output
    bool json_diagnostics{false};

    [[nodiscard]] auto policyDir() const -> std::filesystem::path;
    [[nodiscard]] auto configFile() const -> std::filesystem::path;
};

// Loader for the optional gate.toml
class GateConfigLoader {
public:
    /// Merge gate.toml into `config`. A defaulted config file that does not
    /// exist is not an error; an explicitly named one must exist and parse.
    [[nodiscard]] static auto load(GateConfig* config, Diagnostic* diagnostic) noexcept -> bool;

    /// Log the effective configuration at INFO.
    static auto printConfig(const GateConfig& config) noexcept -> void;

    GateConfigLoader() = delete;
};

} // namespace ArchGate
