#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include "config/gate_config.h"

/// Synthetic Cargo workspace in a temporary directory. `writeConforming()`
/// lays down a two-module workspace plus a policy set that passes the gate;
/// tests then overwrite single files to provoke one failure at a time.
class WorkspaceFixture {
public:
    explicit WorkspaceFixture(const std::string& tag) {
        static int counter = 0;
        const auto stamp = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        root_ = std::filesystem::temp_directory_path() /
                ("archgate_" + tag + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(root_);
    }

    ~WorkspaceFixture() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    WorkspaceFixture(const WorkspaceFixture&) = delete;
    WorkspaceFixture& operator=(const WorkspaceFixture&) = delete;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }
    [[nodiscard]] auto path(const std::string& relative) const -> std::filesystem::path { return root_ / relative; }

    void write(const std::string& relative, const std::string& content) const {
        const auto file = root_ / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out << content;
    }

    void remove(const std::string& relative) const {
        std::error_code ec;
        std::filesystem::remove_all(root_ / relative, ec);
    }

    [[nodiscard]] auto config() const -> ArchGate::GateConfig {
        ArchGate::GateConfig config;
        config.paths.root = root_;
        return config;
    }

    // ========== Conforming workspace ==========

    void writeConforming() const {
        write("Cargo.toml", R"([workspace]
members = ["engine", "tui"]
resolver = "2"
)");

        write("engine/Cargo.toml", "[package]\nname = \"engine\"\nversion = \"0.1.0\"\n");
        write("engine/README.md", "# engine\n");
        write("engine/src/lib.rs", LIB_RS);
        write("engine/src/session.rs", SESSION_RS);
        write("engine/src/io/mod.rs", IO_RS);

        write("tui/Cargo.toml", "[package]\nname = \"tui\"\nversion = \"0.1.0\"\n");
        write("tui/README.md", "# tui\n");
        write("tui/src/main.rs", "fn main() {\n    println!(\"{}\", engine::VERSION);\n}\n");

        writePolicies();
    }

    void writePolicies() const {
        write("policy/classification_map.toml", CLASSIFICATION_MAP);
        write("policy/invariant_registry.toml", INVARIANT_REGISTRY);
        write("policy/authority_boundary_map.toml", AUTHORITY_MAP);
        write("policy/parametricity_rules.toml", PARAMETRICITY_RULES);
        write("policy/move_semantics_rules.toml", MOVE_SEMANTICS_RULES);
        write("policy/dry_proof_map.toml", DRY_PROOF_MAP);
    }

    static constexpr const char* LIB_RS = R"(//! Engine crate root.
pub mod io;
pub mod session;

pub const VERSION: &str = "0.1.0";

/// Proof that a session was issued by the engine.
pub struct SessionToken {
    id: u64,
}

impl SessionToken {
    pub(crate) fn issue(id: u64) -> Self {
        SessionToken { id }
    }

    pub fn id(&self) -> u64 {
        self.id
    }
}
)";

    static constexpr const char* SESSION_RS = R"(use crate::SessionToken;

pub enum SessionState {
    Idle,
    Running { since_ms: u64 },
    Closed(u32),
}

pub struct Session {
    token: SessionToken,
    state: SessionState,
}

pub struct Report {
    pub lines: u32,
}

impl Session {
    pub(crate) fn open(token: SessionToken) -> Self {
        Session { token, state: SessionState::Idle }
    }

    pub fn render_header(&self) -> String {
        format!("session {{{}}}", self.token.id())
    }

    pub fn finish(self) -> Report {
        Report { lines: 0 }
    }
}

pub fn draw_widget() {}
)";

    static constexpr const char* IO_RS = R"(pub struct Reader {
    pub path: Option<String>,
}
)";

    static constexpr const char* CLASSIFICATION_MAP = R"(version = 1

[[rules]]
prefix = "engine/src/"
classification = "core"

[[rules]]
prefix = "engine/src/io/"
classification = "boundary"

[[rules]]
prefix = "tui/"
classification = "boundary"
)";

    static constexpr const char* INVARIANT_REGISTRY = R"(version = 1

[[invariants]]
id = "SESSION_AUTHORITY"
predicate = "sessions are issued only by the engine"
canonical_proof_type_path = "engine::SessionToken"
authority_boundary_module_path = "engine::session"
)";

    static constexpr const char* AUTHORITY_MAP = R"toml(version = 1

[[entries]]
controlled_type_path = "engine::SessionToken"
boundary_module_path = "engine::session"
constructor_paths = ["engine::SessionToken::issue"]
allowed_caller_module_paths = ["engine", "tui"]
max_constructor_visibility_rung = "pub(crate)"
)toml";

    static constexpr const char* PARAMETRICITY_RULES = R"(version = 1
banned_patterns = ["Box<dyn Any>"]
required_interface_disclosures = ["clock source"]
)";

    static constexpr const char* MOVE_SEMANTICS_RULES = R"(version = 1

[[state_bearing_types]]
type_path = "engine::session::Session"

[[state_bearing_types.consumed_transition_methods]]
method_path = "engine::session::Session::finish"
consumes_self = true
post_move_unusability_guarantee = "a finished session cannot be reused"
)";

    static constexpr const char* DRY_PROOF_MAP = R"(version = 1

[[entries]]
invariant_id = "SESSION_AUTHORITY"
canonical_proof_type_path = "engine::SessionToken"
authority_boundary_module_path = "engine::session"
)";

private:
    std::filesystem::path root_;
};
