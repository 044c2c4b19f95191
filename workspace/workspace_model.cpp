#include "workspace_model.h"

#include <algorithm>
#include <set>
#include <system_error>

#include "common/logging.h"
#include "config/toml_reader.h"

namespace ArchGate {

namespace fs = std::filesystem;

auto joinRelative(const std::string& base, const std::string& child) -> std::string {
    if (base.empty() || base == ".") return child;
    if (child.empty()) return base;
    return base + "/" + child;
}

namespace {

auto normalizeModuleName(std::string name) -> std::string {
    std::replace(name.begin(), name.end(), '-', '_');
    return name;
}

auto isDirectory(const fs::path& path) noexcept -> bool {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

auto isRegularFile(const fs::path& path) noexcept -> bool {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

// Member directories named by workspace.members, `dir/*` globs expanded
auto expandMembers(const fs::path& root, const std::string& manifest_name, const std::vector<std::string>& members,
                   const std::string& manifest_location, std::vector<std::string>* out, Diagnostic* d) -> bool {
    for (const auto& raw : members) {
        std::string member = raw;
        while (member.size() > 1 && member.back() == '/') member.pop_back();
        if (member.rfind("./", 0) == 0) member = member.substr(2);

        if (member.empty() || member == ".") {
            out->emplace_back();
            continue;
        }

        if (member.size() >= 2 && member.compare(member.size() - 2, 2, "/*") == 0) {
            const std::string base = member.substr(0, member.size() - 2);
            std::vector<std::string> found;
            std::error_code ec;
            for (fs::directory_iterator it(root / base, ec), end; !ec && it != end; it.increment(ec)) {
                const auto& entry = *it;
                if (isDirectory(entry.path()) && isRegularFile(entry.path() / manifest_name)) {
                    found.push_back(joinRelative(base, entry.path().filename().string()));
                }
            }
            if (ec) {
                return fail(d, ErrorKind::CONFIG, manifest_location, 0,
                            "cannot list workspace member glob '" + raw + "': " + ec.message());
            }
            std::sort(found.begin(), found.end());
            out->insert(out->end(), found.begin(), found.end());
            continue;
        }

        if (member.find('*') != std::string::npos || member.find('?') != std::string::npos) {
            return fail(d, ErrorKind::CONFIG, manifest_location, 0,
                        "unsupported workspace member pattern '" + raw + "' (only a trailing '/*' is allowed)");
        }
        if (!isDirectory(root / member)) {
            return fail(d, ErrorKind::CONFIG, manifest_location, 0,
                        "workspace member '" + raw + "' is not a directory");
        }
        out->push_back(member);
    }
    return true;
}

auto listSources(const fs::path& root, const std::string& source_root, const std::vector<std::string>& extensions,
                 std::vector<std::string>* files) -> void {
    const fs::path dir = root / source_root;
    std::error_code ec;
    const auto options = fs::directory_options::skip_permission_denied;
    for (fs::recursive_directory_iterator it(dir, options, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        if (!isRegularFile(entry.path())) continue;
        const std::string ext = entry.path().extension().string();
        if (std::find(extensions.begin(), extensions.end(), ext) == extensions.end()) continue;
        files->push_back(joinRelative(source_root, entry.path().lexically_relative(dir).generic_string()));
    }
    if (ec) {
        LOG_WARN("Source listing of %s stopped early: %s", dir.string().c_str(), ec.message().c_str());
    }
    std::sort(files->begin(), files->end());
}

} // namespace

auto WorkspaceModel::load(const GateConfig& config, WorkspaceModel* out, Diagnostic* diagnostic) noexcept -> bool {
    out->root_ = config.paths.root;
    out->modules_.clear();

    const std::string& manifest_name = config.workspace.manifest;
    const fs::path manifest_path = out->root_ / manifest_name;

    Common::TomlValue manifest;
    Common::TomlParseError parse_error;
    if (!Common::TomlReader::parseFile(manifest_path, &manifest, &parse_error)) {
        return fail(diagnostic, ErrorKind::CONFIG, manifest_name, static_cast<uint32_t>(parse_error.line),
                    "cannot read workspace manifest: " + parse_error.message);
    }

    const Common::TomlValue* members = manifest.findPath("workspace.members");
    if (!members || !members->isArray() || members->size() == 0) {
        return fail(diagnostic, ErrorKind::CONFIG, manifest_name, 0,
                    "workspace.members must be a non-empty list of strings");
    }
    std::vector<std::string> member_names;
    for (const auto& m : members->asArray()) {
        if (!m.isString()) {
            return fail(diagnostic, ErrorKind::CONFIG, manifest_name, 0,
                        "workspace.members must be a non-empty list of strings");
        }
        member_names.push_back(m.asString());
    }

    std::vector<std::string> directories;
    if (!expandMembers(out->root_, manifest_name, member_names, manifest_name, &directories, diagnostic)) {
        return false;
    }

    std::set<std::string> seen;
    for (const auto& directory : directories) {
        Module module;
        module.directory = directory;

        const std::string member_manifest = joinRelative(directory, manifest_name);
        std::string package_name;
        if (directory.empty()) {
            package_name = manifest.getString("package.name", "");
        } else if (isRegularFile(out->root_ / member_manifest)) {
            Common::TomlValue member_doc;
            if (!Common::TomlReader::parseFile(out->root_ / member_manifest, &member_doc, &parse_error)) {
                return fail(diagnostic, ErrorKind::CONFIG, member_manifest, static_cast<uint32_t>(parse_error.line),
                            "cannot read member manifest: " + parse_error.message);
            }
            package_name = member_doc.getString("package.name", "");
        }
        if (package_name.empty()) {
            std::error_code ec;
            fs::path dir = fs::weakly_canonical(fs::absolute(out->resolvePath(directory), ec), ec);
            package_name = dir.filename().string();
        }
        module.name = normalizeModuleName(package_name);
        if (module.name.empty()) {
            return fail(diagnostic, ErrorKind::CONFIG, member_manifest, 0, "cannot derive a module name");
        }
        if (!seen.insert(module.name).second) {
            return fail(diagnostic, ErrorKind::CONFIG, manifest_name, 0,
                        "duplicate module name '" + module.name + "' (member '" +
                            (directory.empty() ? std::string(".") : directory) + "')");
        }

        module.source_root = joinRelative(directory, config.workspace.source_dir);
        module.source_root_present = isDirectory(out->resolvePath(module.source_root));
        if (module.source_root_present) {
            listSources(out->root_, module.source_root, config.workspace.source_extensions, &module.files);
        }
        for (const auto& readme : config.workspace.readme_names) {
            if (isRegularFile(out->resolvePath(joinRelative(directory, readme)))) {
                module.readme_present = true;
                break;
            }
        }

        LOG_DEBUG("Module %s at '%s': %zu source files", module.name.c_str(), module.directory.c_str(),
                  module.files.size());
        out->modules_.push_back(std::move(module));
    }

    LOG_INFO("Workspace %s: %zu modules", out->root_.string().c_str(), out->modules_.size());
    return true;
}

auto WorkspaceModel::checkHealth(Diagnostic* diagnostic) const noexcept -> bool {
    std::string problems;
    auto add = [&problems](const std::string& text) {
        if (!problems.empty()) problems += "; ";
        problems += text;
    };

    for (const auto& module : modules_) {
        if (!module.source_root_present) {
            add(module.name + ": missing source directory " + module.source_root);
        } else if (module.files.empty()) {
            add(module.name + ": no source files under " + module.source_root);
        }
        if (!module.readme_present) {
            add(module.name + ": missing README");
        }
    }

    if (!problems.empty()) {
        return fail(diagnostic, ErrorKind::WORKSPACE_HEALTH, "workspace", 0, problems);
    }
    return true;
}

auto WorkspaceModel::findModule(std::string_view name) const noexcept -> const Module* {
    for (const auto& module : modules_) {
        if (module.name == name) return &module;
    }
    return nullptr;
}

auto WorkspaceModel::allFiles() const -> std::vector<std::string> {
    std::vector<std::string> files;
    for (const auto& module : modules_) {
        files.insert(files.end(), module.files.begin(), module.files.end());
    }
    std::sort(files.begin(), files.end());
    files.erase(std::unique(files.begin(), files.end()), files.end());
    return files;
}

} // namespace ArchGate
