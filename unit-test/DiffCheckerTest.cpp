#include "gtest/gtest.h"
#include "judge/checker.hpp"

using namespace std;
using namespace pocketjudge;

class DiffCheckerTest : public ::testing::Test {
protected:
    check_result check(const string &output, const string &answer) {
        return diff_checker{}.check("", output, answer, "");
    }
};

TEST_F(DiffCheckerTest, IdenticalOutputIsAccepted) {
    EXPECT_EQ(verdict::ACCEPTED, check("1 2 3\n4 5 6\n", "1 2 3\n4 5 6\n").status);
}

TEST_F(DiffCheckerTest, EmptyOutputMatchesEmptyAnswer) {
    EXPECT_EQ(verdict::ACCEPTED, check("", "").status);
    EXPECT_EQ(verdict::ACCEPTED, check("\n\n", "").status);
}

TEST_F(DiffCheckerTest, TrailingWhitespaceIsIgnored) {
    EXPECT_EQ(verdict::ACCEPTED, check("1 2  \t\r\n3\r\n\n\n", "1 2\n3").status);
}

TEST_F(DiffCheckerTest, LeadingWhitespaceIsSignificant) {
    EXPECT_EQ(verdict::WRONG_ANSWER, check(" 1\n", "1\n").status);
}

TEST_F(DiffCheckerTest, ReportsFirstMismatchedLine) {
    check_result result = check("1\n3\n3\n", "1\n2\n3\n");
    EXPECT_EQ(verdict::WRONG_ANSWER, result.status);
    EXPECT_EQ("line 2: expected \"2\", found \"3\"", result.detail);
}

TEST_F(DiffCheckerTest, MissingLinesAreWrongAnswer) {
    check_result result = check("1\n", "1\n2\n");
    EXPECT_EQ(verdict::WRONG_ANSWER, result.status);
    EXPECT_EQ("line 2: expected \"2\", found end of output", result.detail);
}

TEST_F(DiffCheckerTest, ExtraLinesAreWrongAnswer) {
    check_result result = check("1\n2\n", "1\n");
    EXPECT_EQ(verdict::WRONG_ANSWER, result.status);
    EXPECT_EQ("line 2: expected end of output, found \"2\"", result.detail);
}

TEST_F(DiffCheckerTest, OutputWithoutExpectedOutputIsNotPresentationError) {
    EXPECT_EQ(verdict::WRONG_ANSWER, check("something", "").status);
    EXPECT_EQ(verdict::WRONG_ANSWER, check("", "something").status);
}

TEST_F(DiffCheckerTest, LongLinesAreTruncatedInDetail) {
    string expected(1000, 'a');
    string found(1000, 'b');
    check_result result = check(found, expected);
    EXPECT_EQ(verdict::WRONG_ANSWER, result.status);
    EXPECT_LT(result.detail.size(), 200u);
}

TEST(CheckerVariantTest, DispatchesToAlternative) {
    checker c = float_checker{0.5};
    EXPECT_STREQ("float", get_checker_name(c));
    EXPECT_EQ(verdict::ACCEPTED, check(c, "", "1.4", "1", "").status);

    c = diff_checker{};
    EXPECT_STREQ("diff", get_checker_name(c));
    EXPECT_EQ(verdict::WRONG_ANSWER, check(c, "", "1.4", "1", "").status);
}
