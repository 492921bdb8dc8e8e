#include <sstream>
#include "gtest/gtest.h"
#include "hindsight/comparator.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace hindsight;

static comparison_result compare(const comparator &cmp, const string &expected, const string &actual) {
    istringstream e(expected), a(actual);
    return cmp.compare(e, a);
}

TEST(ComparatorTest, ExactTest) {
    exact_comparator cmp;
    EXPECT_EQ(compare(cmp, "1 2\n", "1 2\n"), comparison_result::PASS);
    EXPECT_EQ(compare(cmp, "1 2\n", "1 2"), comparison_result::FAIL);
    EXPECT_EQ(compare(cmp, "1 2\n", "1  2\n"), comparison_result::FAIL);
    EXPECT_EQ(compare(cmp, "", ""), comparison_result::PASS);
}

TEST(ComparatorTest, WhitespaceTest) {
    whitespace_comparator cmp;
    EXPECT_EQ(compare(cmp, "1 2\n3\n", "1 2   \n3\t\n\n\n"), comparison_result::PASS);
    EXPECT_EQ(compare(cmp, "1 2\r\n", "1 2\n"), comparison_result::PASS);
    // 行首和行中的空白字符仍然需要一致
    EXPECT_EQ(compare(cmp, "1 2\n", " 1 2\n"), comparison_result::FAIL);
    EXPECT_EQ(compare(cmp, "1 2\n", "1  2\n"), comparison_result::FAIL);
    // 中间的空行不能省略
    EXPECT_EQ(compare(cmp, "1\n2\n", "1\n\n2\n"), comparison_result::FAIL);
}

TEST(ComparatorTest, NumericTest) {
    numeric_comparator cmp(1e-4, 1e-4);
    EXPECT_EQ(compare(cmp, "3.14159 2.71828", "3.14160 2.71829"), comparison_result::PASS);
    EXPECT_EQ(compare(cmp, "3.14159 2.71828", "3.2 2.7"), comparison_result::FAIL);
}

TEST(ComparatorTest, NumericTokenTest) {
    numeric_comparator cmp(1e-6, 1e-6);
    // 非数字的单词需要完全一致
    EXPECT_EQ(compare(cmp, "YES 1.0\n", "YES\n1.0000001"), comparison_result::PASS);
    EXPECT_EQ(compare(cmp, "YES 1.0", "yes 1.0"), comparison_result::FAIL);
    // 单词数量不一致总是失败
    EXPECT_EQ(compare(cmp, "1 2", "1 2 3"), comparison_result::FAIL);
    EXPECT_EQ(compare(cmp, "1 2 3", "1 2"), comparison_result::FAIL);
    // 相对误差
    EXPECT_EQ(compare(cmp, "1000000000", "1000000500"), comparison_result::PASS);
    EXPECT_EQ(compare(cmp, "1000000000", "1000002000"), comparison_result::FAIL);
    EXPECT_EQ(compare(cmp, "nan", "nan"), comparison_result::PASS);
    EXPECT_EQ(compare(cmp, "nan", "inf"), comparison_result::FAIL);
}

TEST(ComparatorTest, MissingFileTest) {
    auto dir = test::make_test_directory("ComparatorTest");
    test::write_test_file(dir / "expected.txt", "1\n");
    exact_comparator cmp;
    EXPECT_EQ(cmp.compare_files(dir / "expected.txt", dir / "missing.txt"), comparison_result::INCONCLUSIVE);
    test::write_test_file(dir / "actual.txt", "1\n");
    EXPECT_EQ(cmp.compare_files(dir / "expected.txt", dir / "actual.txt"), comparison_result::PASS);
    filesystem::remove_all(dir);
}

TEST(ComparatorTest, FactoryTest) {
    comparison_config config;
    config.mode = comparison_mode::WHITESPACE;
    auto cmp = make_comparator(config);
    EXPECT_EQ(compare(*cmp, "a\n", "a  \n"), comparison_result::PASS);

    config.mode = comparison_mode::NUMERIC;
    config.absolute_tolerance = 0.5;
    cmp = make_comparator(config);
    EXPECT_EQ(compare(*cmp, "1", "1.4"), comparison_result::PASS);
}
