#include <atomic>
#include <chrono>
#include <thread>
#include "cgroup.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "hindsight/submission.hpp"
#include "hindsight/toolchain.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace hindsight;
namespace fs = std::filesystem;

/**
 * 需要 root 权限、cgroup v2 和 C++ 编译器，条件不满足时跳过
 */
class SandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!test::sandbox_available())
            GTEST_SKIP() << "sandbox is not available in this environment";

        dir = test::make_test_directory("SandboxTest");
        config = test::test_config();
        config.compiler_args = {"-O2", "-std=c++17"};
        config.limits.cpu_time = 1;
        config.limits.wall_time = 3;
        config.limits.memory = 128ll << 20;
        tc = make_unique<toolchain>(config, test::test_catalog());
        if (tc->compiler().empty())
            GTEST_SKIP() << "no C++ compiler found";

        test::write_test_file(dir / "tests" / "1.in", "1 2\n");
        test::write_test_file(dir / "tests" / "1.out", "3\n");
    }

    void TearDown() override {
        sub.reset();
        tc.reset();
        if (!dir.empty()) fs::remove_all(dir);
    }

    submission &make_submission(const string &source) {
        test::write_test_file(dir / "src" / "main.cpp", source);
        sub = tc->new_submission(dir / "src", dir / "out");
        return *sub;
    }

    execution_result run(const check_options &options = check_options()) {
        return sub->check_output(dir / "tests" / "1.in", dir / "tests" / "1.out", dir / "out" / "1.actual", options);
    }

    fs::path dir;
    toolchain_config config;
    unique_ptr<toolchain> tc;
    unique_ptr<submission> sub;
};

TEST_F(SandboxTest, AcceptedTest) {
    make_submission(R"(#include <cstdio>
int main() {
    int a, b;
    scanf("%d%d", &a, &b);
    printf("%d\n", a + b);
    return 0;
}
)");

    execution_result result = run();
    EXPECT_EQ(result.test_case_id, "1");
    EXPECT_EQ(result.status, termination::EXITED);
    EXPECT_EQ(result.exit_status, 0);
    EXPECT_EQ(result.comparison, comparison_result::PASS);
    EXPECT_EQ(result.outcome(), verdict::ACCEPTED);
    EXPECT_GT(result.peak_memory, 0);

    // 同一输入再次运行，编号带有序号
    execution_result again = run();
    EXPECT_EQ(again.test_case_id, "1#2");
    EXPECT_EQ(sub->results().size(), 2);
    EXPECT_EQ(sub->compilation_count(), 1);
}

TEST_F(SandboxTest, WrongAnswerTest) {
    make_submission(R"(#include <cstdio>
int main() {
    int a, b;
    scanf("%d%d", &a, &b);
    printf("%d\n", a - b);
    return 0;
}
)");

    execution_result result = run();
    EXPECT_EQ(result.comparison, comparison_result::FAIL);
    EXPECT_EQ(result.outcome(), verdict::WRONG_ANSWER);
}

TEST_F(SandboxTest, RuntimeErrorTest) {
    make_submission(R"(#include <cstdio>
int main() {
    fprintf(stderr, "bad input\n");
    return 3;
}
)");

    execution_result result = run();
    EXPECT_EQ(result.status, termination::EXITED);
    EXPECT_EQ(result.exit_status, 3);
    EXPECT_EQ(result.comparison, comparison_result::INCONCLUSIVE);
    EXPECT_EQ(result.outcome(), verdict::RUNTIME_ERROR);
    EXPECT_NE(result.stderr_capture.find("bad input"), string::npos);
}

TEST_F(SandboxTest, TimeLimitTest) {
    make_submission(R"(int main() {
    volatile unsigned long x = 0;
    for (;;) ++x;
}
)");

    execution_result result = run();
    EXPECT_EQ(result.status, termination::TIME_LIMIT);
    EXPECT_EQ(result.outcome(), verdict::TIME_LIMIT_EXCEEDED);
}

TEST_F(SandboxTest, MemoryLimitTest) {
    make_submission(R"(#include <cstring>
#include <cstdlib>
int main() {
    for (int i = 0; i < 64; ++i) {
        char *p = (char *) malloc(16 << 20);
        if (!p) return 1;
        memset(p, i, 16 << 20);
    }
    return 0;
}
)");

    execution_result result = run();
    EXPECT_EQ(result.outcome(), verdict::MEMORY_LIMIT_EXCEEDED);
}

TEST_F(SandboxTest, CancelTest) {
    make_submission(R"(#include <unistd.h>
int main() {
    sleep(2);
    return 0;
}
)");
    // 先编译，确保取消发生在运行期间
    sub->ensure_artifact(false);

    atomic_bool cancelled(false);
    thread canceller([&] {
        this_thread::sleep_for(chrono::milliseconds(300));
        cancelled = true;
    });

    check_options options;
    options.cancelled = &cancelled;
    EXPECT_THROW(run(options), execution_environment_error);
    canceller.join();

    // 被取消的运行记录为没有结论的结果
    auto results = sub->results();
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].test_case_id, "1");
    EXPECT_EQ(results[0].status, termination::ENVIRONMENT_ERROR);
    EXPECT_EQ(results[0].comparison, comparison_result::INCONCLUSIVE);
    EXPECT_EQ(results[0].outcome(), verdict::SYSTEM_ERROR);
}

TEST_F(SandboxTest, WallTimeTest) {
    make_submission(R"(#include <unistd.h>
int main() {
    usleep(300000);
    return 0;
}
)");

    // 墙钟时间从选手程序开始运行时计算
    execution_result result = run();
    EXPECT_EQ(result.status, termination::EXITED);
    EXPECT_GE(result.wall_time, 0.3);
    EXPECT_LT(result.wall_time, 1.0);
    EXPECT_LT(result.cpu_time, 0.3);
}

TEST_F(SandboxTest, MissingMetaFileTest) {
    // runguard 没有写入运行结果就退出
    test::write_test_script(dir / "bin" / "runguard", "#!/bin/sh\nexit 0\n");
    config.runguard_path = dir / "bin" / "runguard";
    tc = make_unique<toolchain>(config, test::test_catalog());
    make_submission("int main() { return 0; }\n");

    try {
        run();
        FAIL() << "check_output should fail when runguard writes no results";
    } catch (execution_environment_error &e) {
        EXPECT_EQ(e.check(), "check_output");
        EXPECT_EQ(e.test_case(), "1");
    }

    auto results = sub->results();
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].outcome(), verdict::SYSTEM_ERROR);
    EXPECT_NE(results[0].environment_error.find("without writing results"), string::npos);

    // 没有结论的运行不参与解释
    EXPECT_TRUE(sub->summary().observed_verdicts.empty());
}

TEST(ControlGroupTest, MissingGroupTest) {
    control_group missing("/hindsight-missing-" + random_id());
    EXPECT_NO_THROW(EXPECT_TRUE(missing.kill_all()));
    EXPECT_EQ(missing.name().substr(0, 19), "/hindsight-missing-");
}

TEST_F(SandboxTest, InstrumentationTest) {
    make_submission(R"(#include <cstdio>
#include <vector>
int main() {
    int a, b;
    scanf("%d%d", &a, &b);
    std::vector<int> v = {a, b};
    printf("%d\n", v[0] + v[1]);
    return 0;
}
)");

    try {
        sub->ensure_artifact(true);
    } catch (compilation_error &e) {
        GTEST_SKIP() << "compiler does not support sanitizers: " << e.error_log;
    }

    execution_result plain = run();
    check_options options;
    options.instrument = true;
    execution_result instrumented = run(options);

    // 运行时检测不改变输出比较的结果
    EXPECT_EQ(plain.comparison, comparison_result::PASS);
    EXPECT_EQ(instrumented.comparison, plain.comparison);
    EXPECT_TRUE(instrumented.instrumented);
    EXPECT_FALSE(plain.instrumented);
    EXPECT_TRUE(plain.instrumentation_diagnostics.empty());
    EXPECT_TRUE(fs::is_regular_file(dir / "out" / (instrumented.test_case_id + "-sanitizers.json")));
}

TEST_F(SandboxTest, ConcurrentRunsTest) {
    make_submission(R"(#include <cstdio>
int main() {
    int a, b;
    scanf("%d%d", &a, &b);
    printf("%d\n", a + b);
    return 0;
}
)");

    vector<thread> workers;
    vector<execution_result> results(4);
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([&, i] {
            check_options options;
            options.test_case_id = "case" + to_string(i);
            try {
                results[i] = sub->check_output(dir / "tests" / "1.in", dir / "tests" / "1.out",
                                               dir / "out" / ("case" + to_string(i) + ".actual"), options);
            } catch (hindsight_exception &e) {
                ADD_FAILURE() << e.what();
            }
        });
    }
    for (auto &worker : workers) worker.join();

    for (auto &result : results)
        EXPECT_EQ(result.outcome(), verdict::ACCEPTED) << result.test_case_id;
    EXPECT_EQ(sub->results().size(), 4);
    EXPECT_EQ(sub->compilation_count(), 1);
}
