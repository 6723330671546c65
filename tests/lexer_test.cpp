#include <gtest/gtest.h>
#include "sforth.h"

static vector<string> lexemes(const string &line) {
    FV<string> lx = lex(line);
    return vector<string>(lx.begin(), lx.end());
}

TEST(Lexer, SplitsOnWhitespace) {
    EXPECT_EQ(lexemes("1 2 +"), (vector<string>{ "1", "2", "+" }));
    EXPECT_EQ(lexemes("1\t2"),  (vector<string>{ "1", "2" }));
}

TEST(Lexer, FoldsCase) {
    EXPECT_EQ(lexemes("DUP Swap 2DROP"), (vector<string>{ "dup", "swap", "2drop" }));
}

TEST(Lexer, EmptyLineGivesNothing) {
    EXPECT_TRUE(lex("").empty());
}

TEST(Lexer, RunsOfWhitespaceGiveEmptyLexemes) {
    EXPECT_EQ(lexemes("1  2"), (vector<string>{ "1", "", "2" }));
    EXPECT_EQ(lexemes("dup "), (vector<string>{ "dup", "" }));
}

TEST(ParseNumber, Decimal) {
    DU n = DU0;
    EXPECT_TRUE(parse_number("42", &n));    EXPECT_DOUBLE_EQ(n, 42.0);
    EXPECT_TRUE(parse_number("-3.5", &n));  EXPECT_DOUBLE_EQ(n, -3.5);
    EXPECT_TRUE(parse_number(".25", &n));   EXPECT_DOUBLE_EQ(n, 0.25);
    EXPECT_TRUE(parse_number("1e3", &n));   EXPECT_DOUBLE_EQ(n, 1000.0);
}

TEST(ParseNumber, RadixPrefix) {
    DU n = DU0;
    EXPECT_TRUE(parse_number("$ff", &n));   EXPECT_DOUBLE_EQ(n, 255.0);
    EXPECT_TRUE(parse_number("%101", &n));  EXPECT_DOUBLE_EQ(n, 5.0);
    EXPECT_TRUE(parse_number("#12", &n));   EXPECT_DOUBLE_EQ(n, 12.0);
    EXPECT_FALSE(parse_number("$", &n));
    EXPECT_FALSE(parse_number("%102", &n));
}

TEST(ParseNumber, RejectsWords) {
    DU n = DU0;
    EXPECT_FALSE(parse_number("", &n));
    EXPECT_FALSE(parse_number("-", &n));
    EXPECT_FALSE(parse_number(".", &n));
    EXPECT_FALSE(parse_number(".s", &n));
    EXPECT_FALSE(parse_number("2dup", &n));
    EXPECT_FALSE(parse_number("-rot", &n));
    EXPECT_FALSE(parse_number("/mod", &n));
    EXPECT_FALSE(parse_number("foo", &n));
}

TEST(ParseNumber, OutOfRangeFloats) {
    DU n = DU0;
    EXPECT_TRUE(parse_number("1e400", &n));     EXPECT_TRUE(isinf(n));
    EXPECT_TRUE(parse_number("-1e400", &n));    EXPECT_TRUE(isinf(n) && n < DU0);
    EXPECT_TRUE(parse_number("4.9e-324", &n));  EXPECT_GT(n, DU0);
}

TEST(ParseNumber, NoCHexFloats) {
    DU n = DU0;
    EXPECT_FALSE(parse_number("0x10", &n));
    EXPECT_FALSE(parse_number("-0x10", &n));
    EXPECT_FALSE(parse_number("0x1p4", &n));
    EXPECT_TRUE(parse_number("$10", &n));       EXPECT_DOUBLE_EQ(n, 16.0);
}
