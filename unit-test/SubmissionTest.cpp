#include <exception>
#include <fstream>
#include <thread>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "hindsight/submission.hpp"
#include "hindsight/toolchain.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace hindsight;
namespace fs = std::filesystem;

static const char SOURCE[] = "#include <vector>\nint sum(std::vector<int> v) {\n    return 0;\n}\nint main() {}\n";

/**
 * 模拟编译器：把一个 cat 脚本写到 -o 指定的位置
 */
static const char FAKE_COMPILER[] = R"(#!/bin/sh
prev=""
for arg in "$@"; do
    if [ "$prev" = "-o" ]; then out="$arg"; fi
    prev="$arg"
done
sleep 0.2
printf '#!/bin/sh\ncat\n' > "$out"
chmod +x "$out"
echo "compiled $out"
)";

static const char BROKEN_COMPILER[] = R"(#!/bin/sh
sleep 0.2
echo "main.cpp:2:1: error: expected ';' after top level declarator" >&2
exit 1
)";

static const char FAKE_CLANG_TIDY[] = R"(#!/bin/sh
source="$1"
for arg in "$@"; do
    case "$arg" in
        --export-fixes=*) fixes="${arg#--export-fixes=}" ;;
    esac
done
cat > "$fixes" <<YAML
Diagnostics:
  - DiagnosticName: performance-unnecessary-value-param
    DiagnosticMessage:
      Message: "the parameter 'v' is copied for each invocation but only used as a const reference"
      FilePath: '$source'
      FileOffset: 43
YAML
)";

/**
 * 模拟 clang-tidy：broken.cpp 的导出文件格式错误，其余文件正常
 */
static const char PARTIAL_CLANG_TIDY[] = R"(#!/bin/sh
source="$1"
for arg in "$@"; do
    case "$arg" in
        --export-fixes=*) fixes="${arg#--export-fixes=}" ;;
    esac
done
case "$source" in
    *broken.cpp) echo "Diagnostics: [unclosed" > "$fixes" ;;
    *) cat > "$fixes" <<YAML
Diagnostics:
  - DiagnosticName: performance-unnecessary-value-param
    DiagnosticMessage:
      Message: copied
      FilePath: '$source'
      FileOffset: 43
YAML
    ;;
esac
)";

class SubmissionTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = test::make_test_directory("SubmissionTest");
        test::write_test_file(dir / "src" / "main.cpp", SOURCE);
        test::write_test_script(dir / "bin" / "cc", FAKE_COMPILER);
        test::write_test_script(dir / "bin" / "broken-cc", BROKEN_COMPILER);
        test::write_test_script(dir / "bin" / "clang-tidy", FAKE_CLANG_TIDY);
        test::write_test_script(dir / "bin" / "partial-clang-tidy", PARTIAL_CLANG_TIDY);

        config = test::test_config();
        config.compiler = (dir / "bin" / "cc").string();
        config.clang_tidy = (dir / "bin" / "clang-tidy").string();
        config.clang = (dir / "bin" / "no-such-clang").string();
    }

    void TearDown() override {
        sub.reset();
        tc.reset();
        fs::remove_all(dir);
    }

    submission &make_submission() {
        tc = make_unique<toolchain>(config, test::test_catalog());
        sub = tc->new_submission(dir / "src", dir / "out");
        return *sub;
    }

    fs::path dir;
    toolchain_config config;
    unique_ptr<toolchain> tc;
    unique_ptr<submission> sub;
};

TEST_F(SubmissionTest, ConcurrentCompileTest) {
    submission &s = make_submission();

    shared_ptr<const compiled_artifact> first, second;
    thread t1([&] { first = s.ensure_artifact(false); });
    thread t2([&] { second = s.ensure_artifact(false); });
    t1.join();
    t2.join();

    // 两个线程得到同一个编译产物，编译只进行一次
    ASSERT_TRUE(first);
    EXPECT_EQ(first, second);
    EXPECT_EQ(s.compilation_count(), 1);
    EXPECT_FALSE(first->instrumented);
    EXPECT_EQ(first->binary, dir / "out" / "work" / "program");
    EXPECT_TRUE(fs::is_regular_file(first->binary));
    EXPECT_NE(first->compiler_log.find("compiled"), string::npos);
    EXPECT_TRUE(fs::is_regular_file(dir / "out" / "compiler.txt"));

    EXPECT_EQ(s.ensure_artifact(false), first);
    EXPECT_EQ(s.compilation_count(), 1);
}

TEST_F(SubmissionTest, RecompileTest) {
    submission &s = make_submission();
    auto plain = s.ensure_artifact(false);
    EXPECT_EQ(s.compilation_count(), 1);

    // 启用运行时检测的编译产物单独存放
    auto instrumented = s.ensure_artifact(true);
    EXPECT_EQ(s.compilation_count(), 2);
    EXPECT_TRUE(instrumented->instrumented);
    EXPECT_EQ(instrumented->binary, dir / "out" / "work" / "program.instr");
    EXPECT_TRUE(fs::is_regular_file(dir / "out" / "compiler-instr.txt"));
    EXPECT_NE(plain->fingerprint, instrumented->fingerprint);

    // 源代码修改后编译产物失效
    test::write_test_file(dir / "src" / "main.cpp", string(SOURCE) + "// changed\n");
    auto rebuilt = s.ensure_artifact(false);
    EXPECT_EQ(s.compilation_count(), 3);
    EXPECT_NE(rebuilt->fingerprint, plain->fingerprint);
}

TEST_F(SubmissionTest, CompilationFailureTest) {
    config.compiler = (dir / "bin" / "broken-cc").string();
    submission &s = make_submission();

    string logs[2];
    bool failed[2] = {false, false};
    auto build = [&](int i) {
        try {
            s.ensure_artifact(false);
        } catch (compilation_error &e) {
            failed[i] = true;
            logs[i] = e.error_log;
        }
    };
    thread t1(build, 0);
    thread t2(build, 1);
    t1.join();
    t2.join();

    EXPECT_TRUE(failed[0]);
    EXPECT_TRUE(failed[1]);
    EXPECT_EQ(logs[0], logs[1]);
    EXPECT_NE(logs[0].find("expected ';'"), string::npos);
    EXPECT_EQ(s.compilation_count(), 1);

    // 源代码没有变化时不会重新编译
    EXPECT_THROW(s.ensure_artifact(false), compilation_error);
    EXPECT_EQ(s.compilation_count(), 1);
}

TEST_F(SubmissionTest, NoCompilerTest) {
    config.compiler = (dir / "bin" / "no-such-cc").string();
    submission &s = make_submission();
    EXPECT_THROW(s.ensure_artifact(false), configuration_error);
}

TEST_F(SubmissionTest, StaticCheckTest) {
    submission &s = make_submission();
    auto found = s.check_static();
    ASSERT_EQ(found.size(), 1);
    EXPECT_EQ(found[0].rule_id, "performance-unnecessary-value-param");
    ASSERT_TRUE(found[0].location);
    EXPECT_EQ(found[0].location->file, "main.cpp");
    EXPECT_EQ(found[0].location->line, 2);
    EXPECT_EQ(found[0].code, "int sum(std::vector<int> v) {");

    // 重复检查替换之前的结果
    EXPECT_EQ(s.check_static(), found);
    EXPECT_EQ(s.diagnostics(), found);

    ifstream fin(dir / "out" / "static-analysis.json");
    ASSERT_TRUE(fin);
    nlohmann::json dump;
    fin >> dump;
    ASSERT_TRUE(dump.is_array());
    ASSERT_EQ(dump.size(), 1);
    EXPECT_EQ(dump[0]["id"], "performance-unnecessary-value-param");
    EXPECT_EQ(dump[0]["line"], 2);
    EXPECT_EQ(dump[0]["severity"], test::test_catalog().lookup("performance-unnecessary-value-param").severity);

    // 静态检查不需要编译
    EXPECT_EQ(s.compilation_count(), 0);
}

TEST_F(SubmissionTest, UnavailableAnalyzerTest) {
    config.clang_tidy = (dir / "bin" / "no-such-clang-tidy").string();
    submission &s = make_submission();

    try {
        s.check_static();
        FAIL() << "check_static should fail without clang-tidy";
    } catch (analysis_unavailable_error &e) {
        EXPECT_EQ(e.check(), "check_static");
    }

    auto diags = s.diagnostics();
    ASSERT_EQ(diags.size(), 1);
    EXPECT_EQ(diags[0].rule_id, SOURCE_INCOMPLETE);
    EXPECT_EQ(diags[0].source, diagnostic_source::STATIC);
}

TEST_F(SubmissionTest, CustomCheckKeepsStaticResultsTest) {
    submission &s = make_submission();
    auto static_found = s.check_static();
    ASSERT_EQ(static_found.size(), 1);

    // clang 不可用时结构化检查失败，但静态检查的结果保留
    EXPECT_THROW(s.check_custom(), analysis_unavailable_error);
    auto diags = s.diagnostics();
    ASSERT_EQ(diags.size(), 2);
    EXPECT_EQ(diags[0], static_found[0]);
    EXPECT_EQ(diags[1].rule_id, SOURCE_INCOMPLETE);
    EXPECT_EQ(diags[1].source, diagnostic_source::STRUCTURAL);

    // 再次失败时替换而不是累积
    EXPECT_THROW(s.check_custom(), analysis_unavailable_error);
    EXPECT_EQ(s.diagnostics().size(), 2);
}

TEST_F(SubmissionTest, MissingInputTest) {
    submission &s = make_submission();
    try {
        s.check_output(dir / "tests" / "1.in", dir / "tests" / "1.out", dir / "out" / "1.actual");
        FAIL() << "check_output should fail on a missing input file";
    } catch (io_error &e) {
        EXPECT_EQ(e.check(), "check_output");
        EXPECT_EQ(e.test_case(), "1");
    }
    EXPECT_TRUE(s.results().empty());
    EXPECT_EQ(s.compilation_count(), 0);
}

TEST_F(SubmissionTest, UnsafeTestCaseIdTest) {
    submission &s = make_submission();
    test::write_test_file(dir / "tests" / "1.in", "1 2\n");

    check_options options;
    options.test_case_id = "../escape";
    EXPECT_THROW(s.check_output(dir / "tests" / "1.in", dir / "tests" / "1.out", dir / "out" / "1.actual", options), hindsight_exception);
    EXPECT_EQ(s.compilation_count(), 0);
}

TEST_F(SubmissionTest, EmptySummaryTest) {
    submission &s = make_submission();
    summary_report report = s.summary();
    EXPECT_TRUE(report.hypotheses.empty());
}

TEST_F(SubmissionTest, CompilationErrorContextTest) {
    config.compiler = (dir / "bin" / "broken-cc").string();
    submission &s = make_submission();
    test::write_test_file(dir / "tests" / "1.in", "1 2\n");

    // 等待同一次编译的调用方各自得到带有自己测试点编号的异常
    const char *ids[3] = {"case-a", "case-b", "case-c"};
    exception_ptr errors[3];
    auto check = [&](int i) {
        check_options options;
        options.test_case_id = ids[i];
        try {
            s.check_output(dir / "tests" / "1.in", dir / "tests" / "1.out", dir / "out" / (options.test_case_id + ".actual"), options);
        } catch (compilation_error &) {
            errors[i] = current_exception();
        }
    };
    thread t1(check, 0);
    thread t2(check, 1);
    t1.join();
    t2.join();
    // 之后的调用不影响已经得到的异常
    check(2);

    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(errors[i]) << ids[i];
        try {
            rethrow_exception(errors[i]);
        } catch (compilation_error &e) {
            EXPECT_EQ(e.check(), "check_output");
            EXPECT_EQ(e.test_case(), ids[i]);
            EXPECT_NE(string(e.what()).find(ids[i]), string::npos);
            EXPECT_NE(e.error_log.find("expected ';'"), string::npos);
        }
    }
    EXPECT_EQ(s.compilation_count(), 1);
    EXPECT_TRUE(s.results().empty());
}

TEST_F(SubmissionTest, EnvironmentFailureTest) {
    config.runguard_path = dir / "bin" / "no-such-runguard";
    submission &s = make_submission();
    test::write_test_file(dir / "tests" / "1.in", "1 2\n");
    test::write_test_file(dir / "tests" / "1.out", "3\n");

    try {
        s.check_output(dir / "tests" / "1.in", dir / "tests" / "1.out", dir / "out" / "1.actual");
        FAIL() << "check_output should fail without a sandbox";
    } catch (execution_environment_error &e) {
        EXPECT_EQ(e.test_case(), "1");
    }

    // 运行没有结论，但仍然占用分配的测试点编号
    auto results = s.results();
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].test_case_id, "1");
    EXPECT_EQ(results[0].status, termination::ENVIRONMENT_ERROR);
    EXPECT_EQ(results[0].comparison, comparison_result::INCONCLUSIVE);
    EXPECT_EQ(results[0].outcome(), verdict::SYSTEM_ERROR);
    EXPECT_FALSE(results[0].environment_error.empty());

    EXPECT_THROW(s.check_output(dir / "tests" / "1.in", dir / "tests" / "1.out", dir / "out" / "1.actual"), execution_environment_error);
    ASSERT_EQ(s.results().size(), 2);
    EXPECT_EQ(s.results()[1].test_case_id, "1#2");
    EXPECT_TRUE(s.summary().observed_verdicts.empty());
}

TEST_F(SubmissionTest, PartialStaticCheckTest) {
    config.clang_tidy = (dir / "bin" / "partial-clang-tidy").string();
    test::write_test_file(dir / "src" / "broken.cpp", "int broken() { return 0; }\n");
    submission &s = make_submission();

    try {
        s.check_static();
        FAIL() << "check_static should report the unparsable output";
    } catch (analysis_parse_error &e) {
        EXPECT_EQ(e.check(), "check_static");
    }

    // main.cpp 的结果保留，broken.cpp 附加 source-incomplete
    auto diags = s.diagnostics();
    ASSERT_EQ(diags.size(), 2);
    int findings = 0, markers = 0;
    for (auto &diag : diags) {
        ASSERT_TRUE(diag.location);
        if (diag.rule_id == SOURCE_INCOMPLETE) {
            ++markers;
            EXPECT_EQ(diag.location->file, "broken.cpp");
        } else {
            ++findings;
            EXPECT_EQ(diag.rule_id, "performance-unnecessary-value-param");
            EXPECT_EQ(diag.location->file, "main.cpp");
        }
    }
    EXPECT_EQ(findings, 1);
    EXPECT_EQ(markers, 1);
    EXPECT_TRUE(fs::is_regular_file(dir / "out" / "static-analysis.json"));
}
