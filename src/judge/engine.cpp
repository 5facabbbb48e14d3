#include "ojudge/judge/engine.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/assign.hpp>
#include <algorithm>
#include <map>
#include "ojudge/common/defer.hpp"
#include "ojudge/common/exceptions.hpp"
#include "ojudge/common/utils.hpp"
#include "ojudge/compiler.hpp"
#include "ojudge/judge/sandbox.hpp"

namespace ojudge::judge {
using namespace std;
namespace fs = std::filesystem;

// clang-format off
const map<judge_phase, const char *> phase_names = boost::assign::map_list_of
    (judge_phase::PENDING, "Pending")
    (judge_phase::COMPILING, "Compiling")
    (judge_phase::RUNNING, "Running")
    (judge_phase::AGGREGATED, "Aggregated")
    (judge_phase::FAILED, "Failed");
// clang-format on

const char *get_phase_name(judge_phase phase) {
    return phase_names.at(phase);
}

static const string CANCELLED_MESSAGE = "cancelled";

// 限制的上界，保证乘上语言倍率后不会溢出
static const int64_t MAX_TIME_LIMIT = 24 * 3600 * 1000;  // 一天，单位毫秒
static const int64_t MAX_MEMORY_LIMIT = 1 << 20;         // 1TB，单位 MB
static const int MAX_POINTS = 1000000;

void aggregate(const judge_task &task, judge_result &result) {
    result.result = status::ACCEPTED;
    result.score = 0;
    result.time = chrono::milliseconds(0);
    result.memory = 0;

    bool all_accepted = true;
    for (auto &testcase : result.cases) {
        if (testcase.result != status::ACCEPTED && all_accepted) {
            result.result = testcase.result;
            all_accepted = false;
        }
        result.score += testcase.score;
        result.time = max(result.time, testcase.time);
        result.memory = max(result.memory, testcase.memory);
    }

    if (task.policy == scoring_policy::ACM && (!all_accepted || result.cases.size() != task.cases.size()))
        result.score = 0;

    if (result.cancelled) {
        result.result = status::SYSTEM_ERROR;
        result.error = CANCELLED_MESSAGE;
    }
}

judge_engine::judge_engine(engine_config config, language_registry registry)
    : conf(move(config)), languages(move(registry)) {}

const engine_config &judge_engine::config() const {
    return conf;
}

const language_registry &judge_engine::registry() const {
    return languages;
}

void judge_engine::on_test_case_finished(function<void(const judge_task &, const test_case_result &)> callback) {
    test_case_finished.push_back(move(callback));
}

void judge_engine::on_judge_finished(function<void(const judge_task &, const judge_result &)> callback) {
    judge_finished.push_back(move(callback));
}

void judge_engine::on_phase_changed(function<void(const judge_task &, judge_phase, size_t)> callback) {
    phase_changed.push_back(move(callback));
}

void judge_engine::fire_test_case_finished(const judge_task &task, const test_case_result &result) const {
    for (auto &f : test_case_finished) f(task, result);
}

void judge_engine::fire_judge_finished(const judge_task &task, const judge_result &result) const {
    for (auto &f : judge_finished) f(task, result);
}

void judge_engine::fire_phase_changed(const judge_task &task, judge_phase phase, size_t index) const {
    for (auto &f : phase_changed) f(task, phase, index);
}

void judge_engine::validate(const judge_task &task) const {
    if (task.source.size() > conf.max_source_length)
        throw invalid_task(fmt::format("source code of task {} is too long ({} bytes, at most {} bytes)",
                                       task.id, task.source.size(), conf.max_source_length));
    if (task.time_limit.count() <= 0 || task.time_limit.count() > MAX_TIME_LIMIT)
        throw invalid_task(fmt::format("time limit of task {} must be in (0, {}] ms, got {}",
                                       task.id, MAX_TIME_LIMIT, task.time_limit.count()));
    if (task.memory_limit <= 0 || task.memory_limit > MAX_MEMORY_LIMIT)
        throw invalid_task(fmt::format("memory limit of task {} must be in (0, {}] MB, got {}",
                                       task.id, MAX_MEMORY_LIMIT, task.memory_limit));
    for (size_t i = 0; i < task.cases.size(); ++i)
        if (task.cases[i].points < 0 || task.cases[i].points > MAX_POINTS)
            throw invalid_task(fmt::format("points of test case {} of task {} must be in [0, {}], got {}",
                                           i, task.id, MAX_POINTS, task.cases[i].points));
}

void judge_engine::run_test_cases(const judge_task &task, const workspace &ws, const language_profile &profile,
                                  const fs::path &artifact, judge_result &result, const cancellation_token *cancel) const {
    run_limits limits;
    limits.time = task.time_limit;
    limits.memory = task.memory_limit;
    limits.pe_ratio = task.presentation_ratio.value_or(conf.presentation_ratio);

    for (size_t i = 0; i < task.cases.size(); ++i) {
        if (cancel && cancel->cancelled()) {
            result.cancelled = true;
            break;
        }

        fire_phase_changed(task, judge_phase::RUNNING, i);
        test_case_result testcase = run(ws, profile, artifact, task.cases[i], i, limits, conf, cancel);
        result.cases.push_back(testcase);
        fire_test_case_finished(task, testcase);

        if (testcase.result == status::SYSTEM_ERROR && cancel && cancel->cancelled()) {
            result.cancelled = true;
            break;
        }

        // ACM 模式下遇到第一个未通过的测试点就停止评测
        if (task.policy == scoring_policy::ACM && testcase.result != status::ACCEPTED)
            break;
    }
}

judge_result judge_engine::judge(const judge_task &task, const cancellation_token *cancel) const {
    LOG(INFO) << "Judging task [" << task.id << "], language " << task.language << ", " << task.cases.size() << " test cases";
    elapsed_time timer;
    fire_phase_changed(task, judge_phase::PENDING);

    const language_profile *profile = nullptr;
    try {
        validate(task);
        profile = &languages.resolve(task.language);
    } catch (judge_exception &e) {
        LOG(WARNING) << "Rejected task [" << task.id << "]: " << e.what();
        fire_phase_changed(task, judge_phase::FAILED);
        throw;
    }

    auto create_workspace = [&]() {
        try {
            return workspace::create(conf.scratch_dir, task.id);
        } catch (workspace_allocation_error &e) {
            LOG(ERROR) << "Task [" << task.id << "]: " << e;
            fire_phase_changed(task, judge_phase::FAILED);
            throw;
        }
    };
    workspace ws = create_workspace();
    defer {
        ws.destroy();
    };

    judge_result result;
    result.task_id = task.id;

    try {
        fs::path source = ws.write_source(*profile, task.source);

        if (cancel && cancel->cancelled()) {
            result.cancelled = true;
        } else {
            fire_phase_changed(task, judge_phase::COMPILING);
            compile_outcome outcome = compile(ws, *profile, source, conf, cancel);

            if (outcome.cancelled) {
                result.cancelled = true;
            } else if (outcome.result == compile_outcome::kind::SYSTEM_ERROR) {
                result.result = status::SYSTEM_ERROR;
                result.error = outcome.diagnostics;
            } else if (outcome.result == compile_outcome::kind::FAILURE) {
                result.result = status::COMPILE_ERROR;
                result.compile_output = outcome.diagnostics;
            } else {
                result.compile_output = outcome.diagnostics;
                run_test_cases(task, ws, *profile, outcome.artifact, result, cancel);
                aggregate(task, result);
            }
        }

        // 编译前或编译中被取消时没有经过汇总
        if (result.cancelled && result.cases.empty()) aggregate(task, result);
    } catch (judge_exception &e) {
        LOG(ERROR) << "Task [" << task.id << "]: " << e;
        result.result = status::SYSTEM_ERROR;
        result.error = e.what();
        result.score = 0;
    } catch (exception &e) {
        LOG(ERROR) << "Task [" << task.id << "]: " << e.what();
        result.result = status::SYSTEM_ERROR;
        result.error = e.what();
        result.score = 0;
    }

    ws.destroy();
    fire_phase_changed(task, judge_phase::AGGREGATED);

    LOG(INFO) << fmt::format("Task [{}] finished in {}ms: {}, score {}, time {}ms, memory {}KB", task.id,
                             timer.duration<chrono::milliseconds>().count(), get_display_message(result.result),
                             result.score, result.time.count(), result.memory);
    fire_judge_finished(task, result);
    return result;
}

}  // namespace ojudge::judge
