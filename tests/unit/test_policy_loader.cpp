#include <gtest/gtest.h>

#include <string>

#include "policy/policy_loader.h"
#include "workspace_fixture.h"

using namespace ArchGate;
using Common::Classification;
using Common::VisibilityRung;

class PolicyLoaderTest : public ::testing::Test {
protected:
    PolicyLoaderTest() : fixture_("policy") {}

    void SetUp() override { fixture_.writePolicies(); }

    auto policy(DocumentKind kind) const -> std::filesystem::path {
        return documentPath(fixture_.path("policy"), kind);
    }

    void rewrite(DocumentKind kind, const std::string& content) {
        fixture_.write(std::string("policy/") + documentFileName(kind), content);
    }

    WorkspaceFixture fixture_;
};

TEST_F(PolicyLoaderTest, AllDocumentsPresent) {
    Diagnostic diag;
    EXPECT_TRUE(PolicyLoader::checkRequiredDocuments(fixture_.path("policy"), &diag));
}

TEST_F(PolicyLoaderTest, FirstMissingDocumentReported) {
    fixture_.remove("policy/dry_proof_map.toml");
    fixture_.remove("policy/parametricity_rules.toml");

    Diagnostic diag;
    EXPECT_FALSE(PolicyLoader::checkRequiredDocuments(fixture_.path("policy"), &diag));
    EXPECT_EQ(diag.kind, ErrorKind::MISSING_DOCUMENT);
    EXPECT_EQ(diag.location, policy(DocumentKind::PARAMETRICITY_RULES).string());
    EXPECT_EQ(exitCodeFor(diag), ExitCode::FAILURE);
}

TEST_F(PolicyLoaderTest, LoadsConformingSet) {
    Diagnostic diag;

    InvariantRegistry registry;
    ASSERT_TRUE(PolicyLoader::loadInvariantRegistry(policy(DocumentKind::INVARIANT_REGISTRY), &registry, &diag))
        << formatDiagnostic(diag);
    ASSERT_EQ(registry.invariants.size(), 1u);
    EXPECT_EQ(registry.version, 1);
    EXPECT_EQ(registry.invariants[0].id, "SESSION_AUTHORITY");
    EXPECT_EQ(registry.invariants[0].canonical_proof_type_path, "engine::SessionToken");

    AuthorityBoundaryMap authority;
    ASSERT_TRUE(PolicyLoader::loadAuthorityBoundaryMap(policy(DocumentKind::AUTHORITY_BOUNDARY_MAP), &authority,
                                                       &diag));
    ASSERT_EQ(authority.entries.size(), 1u);
    EXPECT_EQ(authority.entries[0].max_constructor_visibility_rung, VisibilityRung::UNIT_SCOPED);
    EXPECT_EQ(authority.entries[0].allowed_caller_module_paths.size(), 2u);

    ParametricityRules parametricity;
    ASSERT_TRUE(PolicyLoader::loadParametricityRules(policy(DocumentKind::PARAMETRICITY_RULES), &parametricity,
                                                     &diag));
    EXPECT_EQ(parametricity.banned_patterns.size(), 1u);

    MoveSemanticsRules move;
    ASSERT_TRUE(PolicyLoader::loadMoveSemanticsRules(policy(DocumentKind::MOVE_SEMANTICS_RULES), &move, &diag));
    ASSERT_EQ(move.state_bearing_types.size(), 1u);
    ASSERT_EQ(move.state_bearing_types[0].consumed_transition_methods.size(), 1u);
    EXPECT_TRUE(move.state_bearing_types[0].consumed_transition_methods[0].consumes_self);

    DryProofMap dry;
    ASSERT_TRUE(PolicyLoader::loadDryProofMap(policy(DocumentKind::DRY_PROOF_MAP), &dry, &diag));
    EXPECT_EQ(dry.entries.size(), 1u);

    ClassificationMap classification;
    ASSERT_TRUE(PolicyLoader::loadClassificationMap(policy(DocumentKind::CLASSIFICATION_MAP), &classification,
                                                    &diag));
    ASSERT_EQ(classification.rules.size(), 3u);
    EXPECT_EQ(classification.rules[1].prefix, "engine/src/io/");
    EXPECT_EQ(classification.rules[1].classification, Classification::BOUNDARY);
}

TEST_F(PolicyLoaderTest, VersionMustBePositiveInteger) {
    rewrite(DocumentKind::DRY_PROOF_MAP, "version = \"1\"\n[[entries]]\ninvariant_id = \"A\"\n");
    DryProofMap dry;
    Diagnostic diag;
    EXPECT_FALSE(PolicyLoader::loadDryProofMap(policy(DocumentKind::DRY_PROOF_MAP), &dry, &diag));
    EXPECT_EQ(diag.kind, ErrorKind::SCHEMA);
    EXPECT_EQ(diag.message, "field 'version' must be a positive integer");

    rewrite(DocumentKind::DRY_PROOF_MAP, "version = 0\n");
    EXPECT_FALSE(PolicyLoader::loadDryProofMap(policy(DocumentKind::DRY_PROOF_MAP), &dry, &diag));
    EXPECT_EQ(diag.kind, ErrorKind::SCHEMA);
}

TEST_F(PolicyLoaderTest, MissingFieldNamesItsPath) {
    rewrite(DocumentKind::INVARIANT_REGISTRY, R"(version = 1

[[invariants]]
id = "A"
predicate = "a holds"
canonical_proof_type_path = "engine::A"
authority_boundary_module_path = "engine"

[[invariants]]
id = "B"
canonical_proof_type_path = "engine::B"
authority_boundary_module_path = "engine"
)");
    InvariantRegistry registry;
    Diagnostic diag;
    EXPECT_FALSE(PolicyLoader::loadInvariantRegistry(policy(DocumentKind::INVARIANT_REGISTRY), &registry, &diag));
    EXPECT_EQ(diag.kind, ErrorKind::SCHEMA);
    EXPECT_EQ(diag.location, policy(DocumentKind::INVARIANT_REGISTRY).string());
    EXPECT_EQ(diag.message, "field 'invariants[1].predicate' is missing");
}

TEST_F(PolicyLoaderTest, DuplicateInvariantIdRejected) {
    rewrite(DocumentKind::INVARIANT_REGISTRY, R"(version = 1

[[invariants]]
id = "A"
predicate = "a holds"
canonical_proof_type_path = "engine::A"
authority_boundary_module_path = "engine"

[[invariants]]
id = "A"
predicate = "a holds again"
canonical_proof_type_path = "engine::B"
authority_boundary_module_path = "engine"
)");
    InvariantRegistry registry;
    Diagnostic diag;
    EXPECT_FALSE(PolicyLoader::loadInvariantRegistry(policy(DocumentKind::INVARIANT_REGISTRY), &registry, &diag));
    EXPECT_EQ(diag.kind, ErrorKind::SCHEMA);
    EXPECT_NE(diag.message.find("invariants[1].id"), std::string::npos);
}

TEST_F(PolicyLoaderTest, CeilingOutsideEnumerationRejected) {
    rewrite(DocumentKind::AUTHORITY_BOUNDARY_MAP, R"toml(version = 1

[[entries]]
controlled_type_path = "engine::SessionToken"
boundary_module_path = "engine::session"
constructor_paths = ["engine::SessionToken::issue"]
allowed_caller_module_paths = ["engine"]
max_constructor_visibility_rung = "pub(workspace)"
)toml");
    AuthorityBoundaryMap authority;
    Diagnostic diag;
    EXPECT_FALSE(PolicyLoader::loadAuthorityBoundaryMap(policy(DocumentKind::AUTHORITY_BOUNDARY_MAP), &authority,
                                                        &diag));
    EXPECT_EQ(diag.kind, ErrorKind::SCHEMA);
    EXPECT_NE(diag.message.find("entries[0].max_constructor_visibility_rung"), std::string::npos);
}

TEST_F(PolicyLoaderTest, EmptyConstructorListRejected) {
    rewrite(DocumentKind::AUTHORITY_BOUNDARY_MAP, R"(version = 1

[[entries]]
controlled_type_path = "engine::SessionToken"
boundary_module_path = "engine::session"
constructor_paths = []
allowed_caller_module_paths = ["engine"]
max_constructor_visibility_rung = "pub"
)");
    AuthorityBoundaryMap authority;
    Diagnostic diag;
    EXPECT_FALSE(PolicyLoader::loadAuthorityBoundaryMap(policy(DocumentKind::AUTHORITY_BOUNDARY_MAP), &authority,
                                                        &diag));
    EXPECT_EQ(diag.message, "field 'entries[0].constructor_paths' must be a non-empty list");
}

TEST_F(PolicyLoaderTest, TransitionMustConsumeSelf) {
    rewrite(DocumentKind::MOVE_SEMANTICS_RULES, R"(version = 1

[[state_bearing_types]]
type_path = "engine::session::Session"

[[state_bearing_types.consumed_transition_methods]]
method_path = "engine::session::Session::finish"
consumes_self = false
post_move_unusability_guarantee = "gone"
)");
    MoveSemanticsRules move;
    Diagnostic diag;
    EXPECT_FALSE(PolicyLoader::loadMoveSemanticsRules(policy(DocumentKind::MOVE_SEMANTICS_RULES), &move, &diag));
    EXPECT_EQ(diag.kind, ErrorKind::SCHEMA);
    EXPECT_NE(diag.message.find("state_bearing_types[0].consumed_transition_methods[0].consumes_self"),
              std::string::npos);
}

TEST_F(PolicyLoaderTest, ParametricityAcceptsTableEntries) {
    rewrite(DocumentKind::PARAMETRICITY_RULES, R"(version = 1
banned_patterns = [
    "Box<dyn Any>",
    { name = "ambient clock", pattern = "Instant::now" },
]
required_interface_disclosures = ["clock source"]
)");
    ParametricityRules rules;
    Diagnostic diag;
    ASSERT_TRUE(PolicyLoader::loadParametricityRules(policy(DocumentKind::PARAMETRICITY_RULES), &rules, &diag))
        << formatDiagnostic(diag);
    ASSERT_EQ(rules.banned_patterns.size(), 2u);
    EXPECT_EQ(rules.banned_patterns[1], "ambient clock");

    rewrite(DocumentKind::PARAMETRICITY_RULES, "version = 1\nbanned_patterns = [1]\n"
                                               "required_interface_disclosures = [\"x\"]\n");
    ParametricityRules bad;
    EXPECT_FALSE(PolicyLoader::loadParametricityRules(policy(DocumentKind::PARAMETRICITY_RULES), &bad, &diag));
    EXPECT_EQ(diag.message, "field 'banned_patterns[0]' must be a non-empty string or table");
}

TEST_F(PolicyLoaderTest, ClassificationPrefixMustStayInsideWorkspace) {
    rewrite(DocumentKind::CLASSIFICATION_MAP, R"(version = 1

[[rules]]
prefix = "../outside/"
classification = "core"
)");
    ClassificationMap map;
    Diagnostic diag;
    EXPECT_FALSE(PolicyLoader::loadClassificationMap(policy(DocumentKind::CLASSIFICATION_MAP), &map, &diag));
    EXPECT_NE(diag.message.find("rules[0].prefix"), std::string::npos);

    rewrite(DocumentKind::CLASSIFICATION_MAP, R"(version = 1

[[rules]]
prefix = "engine/"
classification = "shell"
)");
    ClassificationMap second;
    EXPECT_FALSE(PolicyLoader::loadClassificationMap(policy(DocumentKind::CLASSIFICATION_MAP), &second, &diag));
    EXPECT_NE(diag.message.find("rules[0].classification"), std::string::npos);
}

TEST_F(PolicyLoaderTest, MalformedTomlIsSchemaError) {
    rewrite(DocumentKind::CLASSIFICATION_MAP, "version = 1\n[[rules]\n");
    ClassificationMap map;
    Diagnostic diag;
    EXPECT_FALSE(PolicyLoader::loadClassificationMap(policy(DocumentKind::CLASSIFICATION_MAP), &map, &diag));
    EXPECT_EQ(diag.kind, ErrorKind::SCHEMA);
    EXPECT_EQ(diag.line_number, 2u);
}
