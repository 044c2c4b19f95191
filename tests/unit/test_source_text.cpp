#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "scanner/source_text.h"

using namespace ArchGate;

class SourceTextTest : public ::testing::Test {
protected:
    static auto joined(const std::string& raw) -> std::string {
        return joinLines(stripSource(raw));
    }
};

TEST_F(SourceTextTest, LineCommentsRemoved) {
    auto lines = stripSource("let a = 1; // trailing {\n/// doc comment\nlet b = 2;");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "let a = 1; ");
    EXPECT_EQ(lines[1], "");
    EXPECT_EQ(lines[2], "let b = 2;");
}

TEST_F(SourceTextTest, NestedBlockCommentsKeepLineCount) {
    const std::string raw = "a /* one /* two\n } */ still comment\n */ b\nc";
    auto lines = stripSource(raw);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0].find('}'), std::string::npos);
    EXPECT_EQ(lines[1].find('}'), std::string::npos);
    EXPECT_NE(lines[2].find('b'), std::string::npos);
    EXPECT_EQ(lines[3], "c");
}

TEST_F(SourceTextTest, StringContentsBlanked) {
    std::string out = joined(R"(let s = "{ // not a comment }";)");
    EXPECT_EQ(out.find('{'), std::string::npos);
    EXPECT_EQ(out.find("//"), std::string::npos);
    EXPECT_EQ(out.size(), std::string(R"(let s = "{ // not a comment }";)").size());
    EXPECT_EQ(out.back(), ';');
}

TEST_F(SourceTextTest, EscapedQuoteDoesNotEndString) {
    std::string out = joined(R"(let s = "a \" { b"; x)");
    EXPECT_EQ(out.find('{'), std::string::npos);
    EXPECT_NE(out.find(" x"), std::string::npos);
}

TEST_F(SourceTextTest, RawStringsBlanked) {
    std::string out = joined("let s = r#\"contains \"quote\" and { brace\"#; y");
    EXPECT_EQ(out.find('{'), std::string::npos);
    EXPECT_NE(out.find("; y"), std::string::npos);
}

TEST_F(SourceTextTest, MultilineStringPreservesLines) {
    auto lines = stripSource("let s = \"line one {\nline two }\";\nnext");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[2], "next");
    EXPECT_EQ(lines[1].find('}'), std::string::npos);
}

TEST_F(SourceTextTest, CharLiteralsBlankedLifetimesKept) {
    std::string out = joined("let c = '{'; let e = '\\''; fn f<'a>(x: &'a str) {}");
    EXPECT_EQ(std::count(out.begin(), out.end(), '{'), 1);
    EXPECT_NE(out.find("<'a>"), std::string::npos);
    EXPECT_NE(out.find("&'a str"), std::string::npos);
}

TEST_F(SourceTextTest, CommentMarkersInsideStringsAreInert) {
    std::string out = joined("let url = \"http://example\"; let z = 1;");
    EXPECT_NE(out.find("let z = 1;"), std::string::npos);
}

TEST_F(SourceTextTest, WordAndWhitespaceHelpers) {
    EXPECT_TRUE(containsWord("let session = open();", "session"));
    EXPECT_FALSE(containsWord("let sessions = open();", "session"));
    EXPECT_FALSE(containsWord("my_session", "session"));
    EXPECT_EQ(collapseWhitespace("  pub \n  fn   x ( )  "), "pub fn x ( )");
    EXPECT_EQ(leadingIdentifier("  r#type: u8"), "type");
    EXPECT_EQ(leadingIdentifier("9lives"), "");
}
