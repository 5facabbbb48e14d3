#include <limits>
#include <thread>
#include "gtest/gtest.h"
#include "ojudge/common/exceptions.hpp"
#include "ojudge/judge/engine.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace std::filesystem;
using namespace ojudge;
using namespace ojudge::judge;

// 读入一个数，输出它的两倍；输入 2 时故意输出错误答案
static const string DOUBLE_SCRIPT = R"(read n
if [ "$n" = 2 ]; then echo 5; else echo $((n * 2)); fi
)";

class JudgeEngineTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        test::setup_test_environment();
    }

    static void TearDownTestCase() {
    }

    static engine_config engine_test_config() {
        engine_config config = test::test_config();
        config.scratch_dir = test::test_scratch_dir() / "engine";
        return config;
    }

    judge_task prepare(const string &language, const string &source, scoring_policy policy = scoring_policy::ACM) {
        judge_task task;
        task.id = "1001";
        task.language = language;
        task.source = source;
        task.time_limit = chrono::milliseconds(1000);
        task.memory_limit = 256;
        task.policy = policy;
        return task;
    }

    void add_doubling_cases(judge_task &task) {
        for (int n : {1, 2, 3})
            task.cases.push_back(test_case{to_string(n) + "\n", to_string(n * 2) + "\n", 10});
    }

    size_t residual_workspaces() const {
        return test::count_entries(engine.config().scratch_dir);
    }

    judge_engine engine{engine_test_config(), test::test_registry()};
};

TEST_F(JudgeEngineTest, EchoAcceptedTest) {
    judge_task task = prepare("sh", "cat\n");
    task.cases = {{"hello\n", "hello\n", 10}, {"1 2 3\n", "1 2 3\n", 20}, {"", "", 30}};

    judge_result result = engine.judge(task);
    EXPECT_EQ(result.result, status::ACCEPTED);
    EXPECT_EQ(result.score, 60);
    EXPECT_FALSE(result.cancelled);
    ASSERT_EQ(result.cases.size(), 3u);
    for (size_t i = 0; i < result.cases.size(); ++i) {
        EXPECT_EQ(result.cases[i].index, i);
        EXPECT_EQ(result.cases[i].result, status::ACCEPTED);
    }
    EXPECT_EQ(residual_workspaces(), 0u);
}

TEST_F(JudgeEngineTest, AcmFailFastTest) {
    judge_task task = prepare("sh", DOUBLE_SCRIPT, scoring_policy::ACM);
    add_doubling_cases(task);

    judge_result result = engine.judge(task);
    EXPECT_EQ(result.result, status::WRONG_ANSWER);
    EXPECT_EQ(result.score, 0);
    ASSERT_EQ(result.cases.size(), 2u);
    EXPECT_EQ(result.cases[0].result, status::ACCEPTED);
    EXPECT_EQ(result.cases[1].result, status::WRONG_ANSWER);
}

TEST_F(JudgeEngineTest, OiSummationTest) {
    judge_task task = prepare("sh", DOUBLE_SCRIPT, scoring_policy::OI);
    add_doubling_cases(task);

    judge_result result = engine.judge(task);
    EXPECT_EQ(result.result, status::WRONG_ANSWER);
    EXPECT_EQ(result.score, 20);
    ASSERT_EQ(result.cases.size(), 3u);
    EXPECT_EQ(result.cases[2].result, status::ACCEPTED);
}

TEST_F(JudgeEngineTest, PresentationRatioOverrideTest) {
    judge_task task = prepare("sh", "echo '1  2'\n", scoring_policy::OI);
    task.cases = {{"", "1 2\n", 10}};

    EXPECT_EQ(engine.judge(task).score, 8);

    task.presentation_ratio = boost::rational<int>(1, 2);
    judge_result result = engine.judge(task);
    EXPECT_EQ(result.result, status::PRESENTATION_ERROR);
    EXPECT_EQ(result.score, 5);
}

TEST_F(JudgeEngineTest, TimeLimitTest) {
    judge_task task = prepare("sh", "sleep 10\n");
    task.time_limit = chrono::milliseconds(200);
    task.cases = {{"", "", 10}, {"", "", 10}};

    judge_result result = engine.judge(task);
    EXPECT_EQ(result.result, status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(result.cases.size(), 1u);
    EXPECT_GE(result.time.count(), 200);
    EXPECT_EQ(residual_workspaces(), 0u);
}

TEST_F(JudgeEngineTest, RelativeScratchDirTest) {
    engine_config config = engine_test_config();
    config.scratch_dir = relative(test::test_scratch_dir() / "relative", current_path());
    ASSERT_TRUE(config.scratch_dir.is_relative());
    judge_engine relative_engine(config, test::test_registry());

    judge_task task = prepare("sh", "echo 3\n");
    task.cases = {{"", "3\n", 10}};
    judge_result result = relative_engine.judge(task);
    EXPECT_EQ(result.result, status::ACCEPTED) << (result.cases.empty() ? result.error : result.cases[0].message);

    if (test::has_command("g++")) {
        task = prepare("cpp", "#include <cstdio>\nint main() { puts(\"3\"); }\n");
        task.cases = {{"", "3\n", 10}};
        result = relative_engine.judge(task);
        EXPECT_EQ(result.result, status::ACCEPTED) << result.compile_output;
    }
    EXPECT_EQ(test::count_entries(test::test_scratch_dir() / "relative"), 0u);
}

TEST_F(JudgeEngineTest, CppScenarioTest) {
    if (!test::has_command("g++")) GTEST_SKIP() << "g++ is not installed";

    judge_task task = prepare("cpp", "#include <cstdio>\nint main() { printf(\"3\\n\"); }\n");
    task.cases = {{"1 2\n", "3\n", 10}};
    judge_result accepted = engine.judge(task);
    EXPECT_EQ(accepted.result, status::ACCEPTED) << accepted.compile_output;
    EXPECT_EQ(accepted.score, 10);

    task.cases = {{"1 2\n", "4\n", 10}};
    judge_result wrong = engine.judge(task);
    EXPECT_EQ(wrong.result, status::WRONG_ANSWER);
    EXPECT_EQ(wrong.score, 0);

    task.source = "int main() { this is not c++ }\n";
    judge_result compile_error = engine.judge(task);
    EXPECT_EQ(compile_error.result, status::COMPILE_ERROR);
    EXPECT_EQ(compile_error.score, 0);
    EXPECT_TRUE(compile_error.cases.empty());
    EXPECT_FALSE(compile_error.compile_output.empty());

    EXPECT_EQ(residual_workspaces(), 0u);
}

TEST_F(JudgeEngineTest, CompilerSystemErrorTest) {
    language_registry registry;
    language_profile broken;
    broken.id = "broken";
    broken.extension = ".txt";
    broken.compile_command = vector<string>{"/nonexistent/compiler", "{source}"};
    broken.artifact_name = "main";
    broken.run_command = {"{artifact}"};
    registry.add(broken);
    judge_engine broken_engine(engine_test_config(), registry);

    judge_task task = prepare("broken", "");
    task.cases = {{"", "", 10}};
    judge_result result = broken_engine.judge(task);
    EXPECT_EQ(result.result, status::SYSTEM_ERROR);
    EXPECT_TRUE(result.cases.empty());
    EXPECT_FALSE(result.error.empty());
    EXPECT_FALSE(result.cancelled);
}

TEST_F(JudgeEngineTest, PreflightErrorTest) {
    vector<judge_phase> phases;
    engine.on_phase_changed([&](const judge_task &, judge_phase phase, size_t) {
        phases.push_back(phase);
    });

    judge_task task = prepare("brainfuck", "+");
    EXPECT_THROW(engine.judge(task), unsupported_language);
    ASSERT_FALSE(phases.empty());
    EXPECT_EQ(phases.back(), judge_phase::FAILED);

    task = prepare("sh", string(engine.config().max_source_length + 1, '#'));
    EXPECT_THROW(engine.judge(task), invalid_task);

    task = prepare("sh", "cat");
    task.time_limit = chrono::milliseconds(0);
    EXPECT_THROW(engine.judge(task), invalid_task);

    task = prepare("sh", "cat");
    task.memory_limit = -1;
    EXPECT_THROW(engine.judge(task), invalid_task);

    task = prepare("sh", "cat");
    task.time_limit = chrono::hours(1000000);
    EXPECT_THROW(engine.judge(task), invalid_task);

    task = prepare("sh", "cat");
    task.memory_limit = numeric_limits<int64_t>::max();
    EXPECT_THROW(engine.judge(task), invalid_task);

    task = prepare("sh", "cat");
    task.cases = {{"", "", -7}};
    EXPECT_THROW(engine.judge(task), invalid_task);

    task = prepare("sh", "cat");
    task.cases = {{"", "", 1000000001}};
    EXPECT_THROW(engine.judge(task), invalid_task);

    task = prepare("sh", "cat");
    task.id = "../escape";
    EXPECT_THROW(engine.judge(task), workspace_allocation_error);

    EXPECT_EQ(residual_workspaces(), 0u);
}

TEST_F(JudgeEngineTest, CancelBeforeStartTest) {
    judge_task task = prepare("sh", "cat\n");
    task.cases = {{"", "", 10}};
    cancellation_token token;
    token.cancel();

    judge_result result = engine.judge(task, &token);
    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.result, status::SYSTEM_ERROR);
    EXPECT_TRUE(result.cases.empty());
    EXPECT_EQ(residual_workspaces(), 0u);
}

TEST_F(JudgeEngineTest, CancelWhileRunningTest) {
    judge_task task = prepare("sh", "sleep 10\n", scoring_policy::OI);
    task.time_limit = chrono::seconds(5);
    task.cases = {{"", "", 10}, {"", "", 10}, {"", "", 10}};
    cancellation_token token;
    thread canceller([&] {
        this_thread::sleep_for(chrono::milliseconds(200));
        token.cancel();
    });

    auto start = chrono::steady_clock::now();
    judge_result result = engine.judge(task, &token);
    canceller.join();
    EXPECT_LT(chrono::steady_clock::now() - start, chrono::seconds(3));
    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.result, status::SYSTEM_ERROR);
    ASSERT_EQ(result.cases.size(), 1u);
    EXPECT_EQ(result.cases[0].message, "cancelled");
    EXPECT_EQ(residual_workspaces(), 0u);
}

TEST_F(JudgeEngineTest, CallbackTest) {
    vector<size_t> finished_cases;
    vector<judge_phase> phases;
    int judged = 0;
    engine.on_test_case_finished([&](const judge_task &, const test_case_result &result) {
        finished_cases.push_back(result.index);
    });
    engine.on_phase_changed([&](const judge_task &, judge_phase phase, size_t) {
        phases.push_back(phase);
    });
    engine.on_judge_finished([&](const judge_task &task, const judge_result &result) {
        ++judged;
        EXPECT_EQ(result.task_id, task.id);
        // 回调时工作目录已经被删除
        EXPECT_EQ(residual_workspaces(), 0u);
    });

    judge_task task = prepare("sh", DOUBLE_SCRIPT, scoring_policy::OI);
    add_doubling_cases(task);
    engine.judge(task);

    EXPECT_EQ(judged, 1);
    vector<size_t> expected_cases{0, 1, 2};
    EXPECT_EQ(finished_cases, expected_cases);
    vector<judge_phase> expected_phases{judge_phase::PENDING, judge_phase::COMPILING,
                                        judge_phase::RUNNING, judge_phase::RUNNING, judge_phase::RUNNING,
                                        judge_phase::AGGREGATED};
    EXPECT_EQ(phases, expected_phases);
}

TEST_F(JudgeEngineTest, AggregateIdempotentTest) {
    judge_task task = prepare("sh", DOUBLE_SCRIPT, scoring_policy::OI);
    add_doubling_cases(task);
    judge_result result = engine.judge(task);

    judge_result again = result;
    aggregate(task, again);
    aggregate(task, again);
    EXPECT_EQ(again.result, result.result);
    EXPECT_EQ(again.score, result.score);
    EXPECT_EQ(again.time, result.time);
    EXPECT_EQ(again.memory, result.memory);
}

TEST_F(JudgeEngineTest, ConcurrentJudgeTest) {
    vector<judge_result> results(4);
    vector<thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([this, &results, i] {
            judge_task task = prepare("sh", "cat\n");
            task.id = "concurrent" + to_string(i);
            task.cases = {{to_string(i) + "\n", to_string(i) + "\n", 10}};
            results[i] = engine.judge(task);
        });
    }
    for (auto &t : threads) t.join();
    for (auto &result : results) {
        EXPECT_EQ(result.result, status::ACCEPTED);
        EXPECT_EQ(result.score, 10);
    }
    EXPECT_EQ(residual_workspaces(), 0u);
}

TEST(JudgePhaseTest, PhaseNameTest) {
    EXPECT_STREQ(get_phase_name(judge_phase::RUNNING), "Running");
    EXPECT_STREQ(get_phase_name(judge_phase::FAILED), "Failed");
}
