#include "gate_config.h"

#include <system_error>

#include "config/toml_reader.h"

namespace ArchGate {

namespace {

auto joinList(const std::vector<std::string>& items) -> std::string {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out;
}

// Reads an optional string list; a present key of the wrong shape is an error
auto readStringList(const Common::TomlValue& doc, const char* dotted, const std::string& location,
                    std::vector<std::string>* out, Diagnostic* diagnostic) -> bool {
    const Common::TomlValue* value = doc.findPath(dotted);
    if (!value) {
        return true;
    }
    if (!value->isArray()) {
        return fail(diagnostic, ErrorKind::PREREQUISITE, location, 0,
                    std::string("'") + dotted + "' must be a list of strings");
    }
    std::vector<std::string> items;
    for (const auto& item : value->asArray()) {
        if (!item.isString() || item.asString().empty()) {
            return fail(diagnostic, ErrorKind::PREREQUISITE, location, 0,
                        std::string("'") + dotted + "' must contain only non-empty strings");
        }
        items.push_back(item.asString());
    }
    *out = std::move(items);
    return true;
}

auto readString(const Common::TomlValue& doc, const char* dotted, const std::string& location,
                std::string* out, Diagnostic* diagnostic) -> bool {
    const Common::TomlValue* value = doc.findPath(dotted);
    if (!value) {
        return true;
    }
    if (!value->isString()) {
        return fail(diagnostic, ErrorKind::PREREQUISITE, location, 0,
                    std::string("'") + dotted + "' must be a string");
    }
    *out = value->asString();
    return true;
}

} // namespace

auto GateConfig::policyDir() const -> std::filesystem::path {
    if (!paths.policy_dir.empty()) {
        return paths.policy_dir;
    }
    return paths.root / "policy";
}

auto GateConfig::configFile() const -> std::filesystem::path {
    if (!paths.config_file.empty()) {
        return paths.config_file;
    }
    return policyDir() / "gate.toml";
}

auto GateConfigLoader::load(GateConfig* config, Diagnostic* diagnostic) noexcept -> bool {
    const std::filesystem::path file = config->configFile();
    const std::string location = file.string();

    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        if (config->paths.config_file_explicit) {
            return fail(diagnostic, ErrorKind::PREREQUISITE, location, 0, "config file does not exist");
        }
        LOG_DEBUG("No gate config at %s, using defaults", location.c_str());
        return true;
    }

    Common::TomlValue doc;
    Common::TomlParseError parse_error;
    if (!Common::TomlReader::parseFile(file, &doc, &parse_error)) {
        return fail(diagnostic, ErrorKind::PREREQUISITE, location, static_cast<uint32_t>(parse_error.line),
                    "cannot parse gate config: " + parse_error.message);
    }

    auto& ws = config->workspace;
    auto& bans = config->bans;
    if (!readString(doc, "workspace.manifest", location, &ws.manifest, diagnostic) ||
        !readString(doc, "workspace.source_dir", location, &ws.source_dir, diagnostic) ||
        !readStringList(doc, "workspace.source_extensions", location, &ws.source_extensions, diagnostic) ||
        !readStringList(doc, "workspace.readme_names", location, &ws.readme_names, diagnostic) ||
        !readStringList(doc, "bans.engine_modules", location, &bans.engine_modules, diagnostic) ||
        !readStringList(doc, "bans.banned_variants", location, &bans.banned_variants, diagnostic) ||
        !readStringList(doc, "bans.warned_flag_markers", location, &bans.warned_flag_markers, diagnostic)) {
        return false;
    }

    // Command line wins over the file for logging
    if (config->logging.file.empty()) {
        if (!readString(doc, "logging.file", location, &config->logging.file, diagnostic)) {
            return false;
        }
    }
    std::string level_text;
    if (!readString(doc, "logging.level", location, &level_text, diagnostic)) {
        return false;
    }
    if (!level_text.empty() && !config->logging.level_explicit) {
        Common::Logger::Level level;
        if (!Common::Logger::parseLevel(level_text, &level)) {
            return fail(diagnostic, ErrorKind::PREREQUISITE, location, 0,
                        "'logging.level' must be one of DEBUG, INFO, WARN, ERROR");
        }
        config->logging.level = level;
    }

    if (ws.source_extensions.empty() || ws.readme_names.empty()) {
        return fail(diagnostic, ErrorKind::PREREQUISITE, location, 0,
                    "'workspace.source_extensions' and 'workspace.readme_names' must not be empty");
    }
    return true;
}

auto GateConfigLoader::printConfig(const GateConfig& config) noexcept -> void {
    LOG_INFO("=== Gate Configuration ===");
    LOG_INFO("Root: %s", config.paths.root.string().c_str());
    LOG_INFO("Policy dir: %s", config.policyDir().string().c_str());
    LOG_INFO("Manifest: %s", config.workspace.manifest.c_str());
    LOG_INFO("Source dir: %s (%s)", config.workspace.source_dir.c_str(),
             joinList(config.workspace.source_extensions).c_str());
    LOG_INFO("Engine modules: %s", joinList(config.bans.engine_modules).c_str());
    LOG_INFO("Banned variants: %s", joinList(config.bans.banned_variants).c_str());
    LOG_INFO("==========================");
}

} // namespace ArchGate
