#include "gtest/gtest.h"
#include "judge/checker.hpp"

using namespace std;
using namespace pocketjudge;

static check_result check_float(const string &output, const string &answer, double tolerance = 1e-6) {
    return float_checker{tolerance}.check("", output, answer, "");
}

TEST(FloatCheckerTest, WithinToleranceIsAccepted) {
    EXPECT_EQ(verdict::ACCEPTED, check_float("3.141592\n", "3.1415927\n").status);
}

TEST(FloatCheckerTest, ToleranceBoundaryIsInclusive) {
    EXPECT_EQ(verdict::ACCEPTED, check_float("1.5", "1", 0.5).status);
    EXPECT_EQ(verdict::WRONG_ANSWER, check_float("1.5000001", "1", 0.5).status);
}

TEST(FloatCheckerTest, BeyondToleranceReportsToken) {
    check_result result = check_float("1.0 2.0 3.5", "1.0 2.0 3.0");
    EXPECT_EQ(verdict::WRONG_ANSWER, result.status);
    EXPECT_NE(string::npos, result.detail.find("token 3"));
}

TEST(FloatCheckerTest, WhitespaceLayoutIsIgnored) {
    EXPECT_EQ(verdict::ACCEPTED, check_float("1\n2\t3  \n", "1 2 3").status);
}

TEST(FloatCheckerTest, TokenCountMismatch) {
    check_result result = check_float("1 2", "1 2 3");
    EXPECT_EQ(verdict::WRONG_ANSWER, result.status);
    EXPECT_NE(string::npos, result.detail.find("token count differs"));
}

TEST(FloatCheckerTest, NonNumericTokensMustMatchExactly) {
    EXPECT_EQ(verdict::ACCEPTED, check_float("YES 0.5", "YES 0.5000001").status);
    EXPECT_EQ(verdict::WRONG_ANSWER, check_float("yes 0.5", "YES 0.5").status);
}

TEST(FloatCheckerTest, InfinityIsNotTreatedAsNumber) {
    EXPECT_EQ(verdict::WRONG_ANSWER, check_float("inf", "1e308").status);
}

TEST(FloatCheckerTest, EmptyOutputMatchesEmptyAnswer) {
    EXPECT_EQ(verdict::ACCEPTED, check_float("", "\n").status);
}
