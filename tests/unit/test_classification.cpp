#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "classification/classification_resolver.h"

using namespace ArchGate;
using Common::Classification;

class ClassificationTest : public ::testing::Test {
protected:
    void addRule(const std::string& prefix, Classification c) {
        map_.rules.push_back(ClassificationRule{prefix, c});
    }

    void SetUp() override {
        map_.source = "policy/classification_map.toml";
        map_.version = 1;
    }

    ClassificationMap map_;
};

TEST_F(ClassificationTest, LongestPrefixWins) {
    addRule("engine/src/", Classification::CORE);
    addRule("engine/src/io/", Classification::BOUNDARY);

    std::vector<size_t> winners;
    Diagnostic diag;
    ASSERT_TRUE(ClassificationResolver::classifyFile(map_, "engine/src/io/reader.rs", &winners, &diag));
    EXPECT_EQ(winners, (std::vector<size_t>{1}));
    ASSERT_TRUE(ClassificationResolver::classifyFile(map_, "engine/src/lib.rs", &winners, &diag));
    EXPECT_EQ(winners, (std::vector<size_t>{0}));
}

TEST_F(ClassificationTest, PrefixIsLiteralNotComponentWise) {
    addRule("engine/src/io", Classification::BOUNDARY);
    addRule("engine/", Classification::CORE);

    std::vector<size_t> winners;
    Diagnostic diag;
    ASSERT_TRUE(ClassificationResolver::classifyFile(map_, "engine/src/ioctl.rs", &winners, &diag));
    EXPECT_EQ(winners, (std::vector<size_t>{0}));
}

TEST_F(ClassificationTest, NoMatchingRule) {
    addRule("engine/", Classification::CORE);

    std::vector<size_t> winners;
    Diagnostic diag;
    EXPECT_FALSE(ClassificationResolver::classifyFile(map_, "tui/src/main.rs", &winners, &diag));
    EXPECT_EQ(diag.kind, ErrorKind::CLASSIFICATION);
    EXPECT_EQ(diag.location, "tui/src/main.rs");
}

TEST_F(ClassificationTest, TieAtMaximalLengthIsAmbiguous) {
    addRule("engine/", Classification::CORE);
    addRule("engine/", Classification::BOUNDARY);

    std::vector<size_t> winners;
    Diagnostic diag;
    EXPECT_FALSE(ClassificationResolver::classifyFile(map_, "engine/src/lib.rs", &winners, &diag));
    EXPECT_EQ(diag.kind, ErrorKind::CLASSIFICATION);
    EXPECT_NE(diag.message.find("rules[0] and rules[1]"), std::string::npos);
}

TEST_F(ClassificationTest, AgreeingTieIsNotAmbiguous) {
    addRule("engine/", Classification::CORE);
    addRule("engine/", Classification::CORE);

    std::vector<size_t> winners;
    Diagnostic diag;
    ASSERT_TRUE(ClassificationResolver::classifyFile(map_, "engine/src/lib.rs", &winners, &diag))
        << formatDiagnostic(diag);
    EXPECT_EQ(winners, (std::vector<size_t>{0, 1}));

    // Both tied rules win the file, so neither is reported dead
    const std::vector<std::string> files = {"engine/src/lib.rs"};
    ClassificationAssignment out;
    ASSERT_TRUE(ClassificationResolver::classify(map_, files, &out, &diag)) << formatDiagnostic(diag);
    EXPECT_TRUE(out.isCore("engine/src/lib.rs"));
}

TEST_F(ClassificationTest, TieBelowTheWinnerIsHarmless) {
    addRule("engine/", Classification::CORE);
    addRule("engine/", Classification::CORE);
    addRule("engine/src/", Classification::BOUNDARY);

    std::vector<size_t> winners;
    Diagnostic diag;
    ASSERT_TRUE(ClassificationResolver::classifyFile(map_, "engine/src/lib.rs", &winners, &diag));
    EXPECT_EQ(winners, (std::vector<size_t>{2}));
}

TEST_F(ClassificationTest, ClassifyAssignsEveryFile) {
    addRule("engine/src/", Classification::CORE);
    addRule("engine/src/io/", Classification::BOUNDARY);
    addRule("tui/", Classification::BOUNDARY);

    const std::vector<std::string> files = {
        "engine/src/io/mod.rs", "engine/src/lib.rs", "engine/src/session.rs", "tui/src/main.rs"};
    ClassificationAssignment out;
    Diagnostic diag;
    ASSERT_TRUE(ClassificationResolver::classify(map_, files, &out, &diag)) << formatDiagnostic(diag);

    EXPECT_EQ(out.by_file.size(), 4u);
    EXPECT_TRUE(out.isCore("engine/src/lib.rs"));
    EXPECT_TRUE(out.isCore("engine/src/session.rs"));
    EXPECT_FALSE(out.isCore("engine/src/io/mod.rs"));
    EXPECT_FALSE(out.isCore("tui/src/main.rs"));
    EXPECT_FALSE(out.isCore("not/listed.rs"));
}

TEST_F(ClassificationTest, DeadRuleRejected) {
    addRule("engine/", Classification::CORE);
    addRule("engine/src/", Classification::CORE);

    const std::vector<std::string> files = {"engine/src/lib.rs"};
    ClassificationAssignment out;
    Diagnostic diag;
    EXPECT_FALSE(ClassificationResolver::classify(map_, files, &out, &diag));
    EXPECT_EQ(diag.kind, ErrorKind::CLASSIFICATION);
    EXPECT_EQ(diag.location, "policy/classification_map.toml");
    EXPECT_NE(diag.message.find("rules[0] (prefix 'engine/')"), std::string::npos);
}
