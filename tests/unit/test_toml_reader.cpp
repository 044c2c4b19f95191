#include <gtest/gtest.h>

#include <string>

#include "config/toml_reader.h"

using namespace Common;

class TomlReaderTest : public ::testing::Test {
protected:
    auto parseOk(const std::string& text) -> TomlValue {
        TomlValue root;
        TomlParseError error;
        EXPECT_TRUE(TomlReader::parse(text, &root, &error)) << "line " << error.line << ": " << error.message;
        return root;
    }

    auto parseError(const std::string& text) -> TomlParseError {
        TomlValue root;
        TomlParseError error;
        EXPECT_FALSE(TomlReader::parse(text, &root, &error));
        return error;
    }
};

TEST_F(TomlReaderTest, ScalarsAndComments) {
    TomlValue root = parseOk(R"(# leading comment
name = "engine"   # trailing
count = 1_000
ratio = 0.5
enabled = true
hex = 0xff
path = 'C:\raw\path'
)");
    EXPECT_EQ(root.getString("name", ""), "engine");
    ASSERT_NE(root.find("count"), nullptr);
    EXPECT_EQ(root.find("count")->asInteger(), 1000);
    EXPECT_DOUBLE_EQ(root.find("ratio")->asFloat(), 0.5);
    EXPECT_TRUE(root.find("enabled")->asBoolean());
    EXPECT_EQ(root.find("hex")->asInteger(), 255);
    EXPECT_EQ(root.getString("path", ""), "C:\\raw\\path");
}

TEST_F(TomlReaderTest, TablesAndDottedLookup) {
    TomlValue root = parseOk(R"([workspace]
members = ["engine", "tui"]

[workspace.metadata]
owner = "core-team"

[package]
name = "gate"
)");
    auto members = root.getStringList("workspace.members", {});
    ASSERT_EQ(members.size(), 2u);
    EXPECT_EQ(members[1], "tui");
    EXPECT_EQ(root.getString("workspace.metadata.owner", ""), "core-team");
    EXPECT_EQ(root.getString("package.missing", "fallback"), "fallback");
    ASSERT_EQ(root.keys().size(), 2u);
    EXPECT_EQ(root.keys()[0], "workspace");
}

TEST_F(TomlReaderTest, ArrayOfTablesWithNestedArrays) {
    TomlValue root = parseOk(R"(version = 1

[[types]]
path = "a::A"

[[types.methods]]
name = "close"

[[types.methods]]
name = "drop"

[[types]]
path = "a::B"
)");
    const TomlValue* types = root.find("types");
    ASSERT_NE(types, nullptr);
    ASSERT_TRUE(types->isArray());
    EXPECT_TRUE(types->isTableArray());
    ASSERT_EQ(types->size(), 2u);

    const TomlValue& first = types->asArray()[0];
    const TomlValue* methods = first.find("methods");
    ASSERT_NE(methods, nullptr);
    ASSERT_EQ(methods->size(), 2u);
    EXPECT_EQ(methods->asArray()[1].getString("name", ""), "drop");
    EXPECT_EQ(types->asArray()[1].find("methods"), nullptr);
}

TEST_F(TomlReaderTest, InlineTablesAndMultilineArrays) {
    TomlValue root = parseOk(R"(patterns = [
    "Box<dyn Any>",   # comment inside array
    { name = "raw clock", pattern = "Instant::now" },
]
dotted.key = "x"
)");
    const TomlValue* patterns = root.find("patterns");
    ASSERT_NE(patterns, nullptr);
    ASSERT_EQ(patterns->size(), 2u);
    EXPECT_TRUE(patterns->asArray()[1].isTable());
    EXPECT_EQ(patterns->asArray()[1].getString("pattern", ""), "Instant::now");
    EXPECT_EQ(root.getString("dotted.key", ""), "x");
}

TEST_F(TomlReaderTest, StringEscapesAndMultiline) {
    TomlValue root = parseOk("a = \"tab\\tquote\\\" \\u00e9\"\nb = \"\"\"\nfirst\nsecond\"\"\"\n");
    EXPECT_EQ(root.getString("a", ""), "tab\tquote\" \xc3\xa9");
    EXPECT_EQ(root.getString("b", ""), "first\nsecond");
}

TEST_F(TomlReaderTest, DatesKeptAsText) {
    TomlValue root = parseOk("released = 2024-05-01T10:00:00Z\n");
    EXPECT_EQ(root.getString("released", ""), "2024-05-01T10:00:00Z");
}

TEST_F(TomlReaderTest, DuplicateKeyRejected) {
    auto error = parseError("name = \"a\"\nname = \"b\"\n");
    EXPECT_EQ(error.line, 2u);
    EXPECT_NE(error.message.find("duplicate key 'name'"), std::string::npos);
}

TEST_F(TomlReaderTest, RedefinedTableRejected) {
    auto error = parseError("[package]\nname = \"a\"\n[package]\nversion = \"1\"\n");
    EXPECT_NE(error.message.find("defined more than once"), std::string::npos);
}

TEST_F(TomlReaderTest, MalformedInputReportsLine) {
    auto error = parseError("ok = 1\n\n[workspace\n");
    EXPECT_EQ(error.line, 3u);

    error = parseError("value = \"unterminated\n");
    EXPECT_EQ(error.line, 1u);

    error = parseError("a = 1 b = 2\n");
    EXPECT_NE(error.message.find("after value"), std::string::npos);
}

TEST_F(TomlReaderTest, MissingFile) {
    TomlValue root;
    TomlParseError error;
    EXPECT_FALSE(TomlReader::parseFile("/nonexistent/archgate/Cargo.toml", &root, &error));
    EXPECT_EQ(error.message, "cannot open file");
}
