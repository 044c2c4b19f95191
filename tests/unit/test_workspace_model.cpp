#include <gtest/gtest.h>

#include <string>

#include "workspace/source_cache.h"
#include "workspace/workspace_model.h"
#include "workspace_fixture.h"

using namespace ArchGate;

class WorkspaceModelTest : public ::testing::Test {
protected:
    WorkspaceModelTest() : fixture_("workspace") {}

    void SetUp() override {
        fixture_.writeConforming();
        config_ = fixture_.config();
    }

    WorkspaceFixture fixture_;
    GateConfig config_;
};

TEST_F(WorkspaceModelTest, LoadsModulesAndSortedSources) {
    WorkspaceModel workspace;
    Diagnostic diag;
    ASSERT_TRUE(WorkspaceModel::load(config_, &workspace, &diag)) << formatDiagnostic(diag);

    ASSERT_EQ(workspace.modules().size(), 2u);
    const Module* engine = workspace.findModule("engine");
    ASSERT_NE(engine, nullptr);
    EXPECT_EQ(engine->source_root, "engine/src");
    ASSERT_EQ(engine->files.size(), 3u);
    EXPECT_EQ(engine->files[0], "engine/src/io/mod.rs");
    EXPECT_EQ(engine->files[1], "engine/src/lib.rs");
    EXPECT_EQ(engine->files[2], "engine/src/session.rs");

    EXPECT_EQ(workspace.allFiles().size(), 4u);
    EXPECT_TRUE(workspace.checkHealth(&diag));
}

TEST_F(WorkspaceModelTest, PackageNameNormalized) {
    fixture_.write("tui/Cargo.toml", "[package]\nname = \"terminal-ui\"\n");
    WorkspaceModel workspace;
    Diagnostic diag;
    ASSERT_TRUE(WorkspaceModel::load(config_, &workspace, &diag));
    EXPECT_NE(workspace.findModule("terminal_ui"), nullptr);
    EXPECT_EQ(workspace.findModule("tui"), nullptr);
}

TEST_F(WorkspaceModelTest, MemberGlobExpands) {
    fixture_.write("Cargo.toml", "[workspace]\nmembers = [\"crates/*\"]\n");
    fixture_.write("crates/alpha/Cargo.toml", "[package]\nname = \"alpha\"\n");
    fixture_.write("crates/alpha/src/lib.rs", "pub fn a() {}\n");
    fixture_.write("crates/beta/Cargo.toml", "[package]\nname = \"beta\"\n");
    fixture_.write("crates/beta/src/lib.rs", "pub fn b() {}\n");
    fixture_.write("crates/notes/readme.txt", "not a crate\n");

    WorkspaceModel workspace;
    Diagnostic diag;
    ASSERT_TRUE(WorkspaceModel::load(config_, &workspace, &diag)) << formatDiagnostic(diag);
    ASSERT_EQ(workspace.modules().size(), 2u);
    EXPECT_EQ(workspace.modules()[0].name, "alpha");
    EXPECT_EQ(workspace.modules()[1].name, "beta");
    EXPECT_EQ(workspace.modules()[1].files[0], "crates/beta/src/lib.rs");
}

TEST_F(WorkspaceModelTest, MissingMembersIsConfigError) {
    fixture_.write("Cargo.toml", "[package]\nname = \"solo\"\n");
    WorkspaceModel workspace;
    Diagnostic diag;
    EXPECT_FALSE(WorkspaceModel::load(config_, &workspace, &diag));
    EXPECT_EQ(diag.kind, ErrorKind::CONFIG);
}

TEST_F(WorkspaceModelTest, MalformedManifestIsConfigError) {
    fixture_.write("Cargo.toml", "[workspace\nmembers = [\"engine\"]\n");
    WorkspaceModel workspace;
    Diagnostic diag;
    EXPECT_FALSE(WorkspaceModel::load(config_, &workspace, &diag));
    EXPECT_EQ(diag.kind, ErrorKind::CONFIG);
    EXPECT_EQ(diag.location, "Cargo.toml");
}

TEST_F(WorkspaceModelTest, DuplicateModuleNamesRejected) {
    fixture_.write("tui/Cargo.toml", "[package]\nname = \"engine\"\n");
    WorkspaceModel workspace;
    Diagnostic diag;
    EXPECT_FALSE(WorkspaceModel::load(config_, &workspace, &diag));
    EXPECT_EQ(diag.kind, ErrorKind::CONFIG);
    EXPECT_NE(diag.message.find("duplicate module name 'engine'"), std::string::npos);
}

TEST_F(WorkspaceModelTest, HealthCheckBatchesEveryProblem) {
    fixture_.remove("engine/README.md");
    fixture_.remove("tui/src/main.rs");

    WorkspaceModel workspace;
    Diagnostic diag;
    ASSERT_TRUE(WorkspaceModel::load(config_, &workspace, &diag));
    EXPECT_FALSE(workspace.checkHealth(&diag));
    EXPECT_EQ(diag.kind, ErrorKind::WORKSPACE_HEALTH);
    EXPECT_EQ(diag.message, "engine: missing README; tui: no source files under tui/src");
}

TEST_F(WorkspaceModelTest, SourceCacheReadsOnce) {
    WorkspaceModel workspace;
    Diagnostic diag;
    ASSERT_TRUE(WorkspaceModel::load(config_, &workspace, &diag));

    SourceCache cache(workspace);
    const SourceFile* first = cache.file("engine/src/lib.rs", "engine", &diag);
    ASSERT_NE(first, nullptr);
    const FileScan* scan_a = cache.scan("engine/src/lib.rs", "engine", &diag);
    const FileScan* scan_b = cache.scan("engine/src/lib.rs", "engine", &diag);
    ASSERT_NE(scan_a, nullptr);
    EXPECT_EQ(scan_a, scan_b);
    EXPECT_EQ(first, cache.file("engine/src/lib.rs", "engine", &diag));

    const auto stats = cache.getStats();
    EXPECT_EQ(stats.files_read, 1u);
    EXPECT_EQ(stats.scans_computed, 1u);
    EXPECT_EQ(first->lines[0], "");

    EXPECT_EQ(cache.file("engine/src/missing.rs", "engine", &diag), nullptr);
    EXPECT_EQ(diag.kind, ErrorKind::WORKSPACE_HEALTH);
}
