#include <gtest/gtest.h>
#include <rpn2tex/diagnostic.hpp>
#include <rpn2tex/error.hpp>
#include <rpn2tex/lexer.hpp>

#include <string>

namespace {

using rpn2tex::ErrorFormatter;

TEST(Diagnostic, SingleLineWithCaret) {
    ErrorFormatter f("2 3 ^");
    EXPECT_EQ(f.format_error("Unexpected character '^'", 1, 5),
              "Error: Unexpected character '^'\n"
              "1 | 2 3 ^\n"
              "  |     ^\n");
}

TEST(Diagnostic, CaretAtFirstColumn) {
    ErrorFormatter f("0123456789");
    EXPECT_EQ(f.format_error("x", 1, 1), "Error: x\n1 | 0123456789\n  | ^\n");
    EXPECT_EQ(f.format_error("x", 1, 10), "Error: x\n1 | 0123456789\n  |          ^\n");
}

TEST(Diagnostic, OneLineOfContextEachSide) {
    ErrorFormatter f("line1\nline2\nline3\nline4\nline5");
    EXPECT_EQ(f.format_error("here", 3, 2),
              "Error: here\n"
              "2 | line2\n"
              "3 | line3\n"
              "  |  ^\n"
              "4 | line4\n");
}

TEST(Diagnostic, ContextClampedAtEdges) {
    ErrorFormatter f("line1\nline2\nline3");
    EXPECT_EQ(f.format_error("start", 1, 1), "Error: start\n1 | line1\n  | ^\n2 | line2\n");
    EXPECT_EQ(f.format_error("end", 3, 5), "Error: end\n2 | line2\n3 | line3\n  |     ^\n");
}

TEST(Diagnostic, ZeroContextShowsOnlyErrorLine) {
    ErrorFormatter f("a\nb\nc");
    EXPECT_EQ(f.format_error("m", 2, 1, 0), "Error: m\n2 | b\n  | ^\n");
}

TEST(Diagnostic, GutterWidthFollowsLargestLineNumber) {
    std::string src;
    for (int i = 1; i <= 15; ++i) {
        if (i > 1) src += '\n';
        src += "line" + std::to_string(i);
    }
    ErrorFormatter f(src);
    std::string out = f.format_error("Test", 10, 1, 2);
    EXPECT_NE(out.find(" 8 | line8\n"), std::string::npos);
    EXPECT_NE(out.find(" 9 | line9\n"), std::string::npos);
    EXPECT_NE(out.find("10 | line10\n   | ^\n"), std::string::npos);
    EXPECT_NE(out.find("12 | line12\n"), std::string::npos);
    EXPECT_EQ(out.find("line7"), std::string::npos);
    EXPECT_EQ(out.find("line13"), std::string::npos);
}

TEST(Diagnostic, LinePastEndGivesHeaderOnly) {
    ErrorFormatter f("5 3\n");
    EXPECT_EQ(f.lines().size(), 1u);
    EXPECT_EQ(f.format_error("Invalid RPN", 2, 1), "Error: Invalid RPN\n");
}

TEST(Diagnostic, EmptySourceGivesHeaderOnly) {
    ErrorFormatter f("");
    EXPECT_EQ(f.format_error("Empty expression", 1, 1), "Error: Empty expression\n");
}

TEST(Diagnostic, CarriageReturnsStripped) {
    ErrorFormatter f("1 2\r\n+ ?\r\n");
    ASSERT_EQ(f.lines().size(), 2u);
    EXPECT_EQ(f.lines()[0], "1 2");
    EXPECT_EQ(f.lines()[1], "+ ?");
}

TEST(Diagnostic, FormatsSourceErrors) {
    const std::string src = "1 2 +\n3 $";
    try {
        rpn2tex::tokenize(src);
        FAIL() << "expected LexError";
    } catch (const rpn2tex::LexError& e) {
        ErrorFormatter f(src);
        EXPECT_EQ(f.format_error(e),
                  "Error: Unexpected character '$'\n"
                  "1 | 1 2 +\n"
                  "2 | 3 $\n"
                  "  |   ^\n");
    }
}

} // namespace
