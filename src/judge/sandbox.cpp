#include "ojudge/judge/sandbox.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <string.h>
#include <cmath>
#include <stdexcept>
#include <system_error>
#include "ojudge/common/utils.hpp"
#include "ojudge/judge/verdict.hpp"
#include "ojudge/process.hpp"

namespace ojudge::judge {
using namespace std;
namespace fs = std::filesystem;

chrono::milliseconds effective_time_limit(const language_profile &profile, chrono::milliseconds base) {
    return chrono::milliseconds(llround(base.count() * profile.time_multiplier));
}

int64_t effective_memory_limit(const language_profile &profile, int64_t base_mb) {
    return llround(base_mb * profile.memory_multiplier * (1 << 20));
}

static test_case_result system_error_result(size_t index, const string &message) {
    test_case_result result;
    result.index = index;
    result.result = status::SYSTEM_ERROR;
    result.message = message;
    return result;
}

test_case_result run(const workspace &ws, const language_profile &profile, const fs::path &artifact,
                     const test_case &testcase, size_t index, const run_limits &limits,
                     const engine_config &config, const cancellation_token *cancel) {
    run_options opt;
    try {
        opt.command = expand_command(profile.run_command, {{"source", (ws.path() / profile.source_file()).string()},
                                                           {"artifact", artifact.string()},
                                                           {"dir", ws.path().string()}});
    } catch (invalid_argument &e) {
        return system_error_result(index, fmt::format("malformed run command of language {}: {}", profile.id, e.what()));
    }
    opt.work_dir = ws.path();
    opt.stdin_data = testcase.input;
    opt.wall_limit = effective_time_limit(profile, limits.time);
    opt.memory_limit = effective_memory_limit(profile, limits.memory);
    opt.stream_size = config.output_limit;
    opt.kill_on_stream_limit = true;
    opt.sample_interval = config.sample_interval;
    opt.cancel = cancel;

    run_result run;
    try {
        run = run_process(opt);
    } catch (system_error &e) {
        LOG(ERROR) << "Unable to run test case " << index << " in " << ws.path() << ": " << e.what();
        return system_error_result(index, e.what());
    }

    if (!run.started)
        return system_error_result(index, run.spawn_error);

    test_case_result result;
    result.index = index;
    result.time = run.wall_time;
    result.cpu_time = run.cpu_time;
    result.memory = run.memory / 1024;
    result.exitcode = run.exitcode;
    result.signal = run.signal;
    result.output = truncate_text(run.out, config.max_report_size);

    if (run.cancelled) {
        result.result = status::SYSTEM_ERROR;
        result.message = "cancelled";
    } else if (run.time_exceeded) {
        result.result = status::TIME_LIMIT_EXCEEDED;
        result.message = fmt::format("killed after {}ms", opt.wall_limit.count());
    } else if (run.memory_exceeded) {
        result.result = status::MEMORY_LIMIT_EXCEEDED;
        result.message = fmt::format("peak memory {}KB exceeds {}KB", result.memory, opt.memory_limit / 1024);
    } else if (run.killed && run.output_exceeded) {
        result.result = status::OUTPUT_LIMIT_EXCEEDED;
        result.message = fmt::format("output exceeds {} bytes", config.output_limit);
    } else if (run.signal >= 0) {
        result.result = status::RUNTIME_ERROR;
        result.message = fmt::format("terminated with signal {} ({})", run.signal, strsignal(run.signal));
    } else if (run.exitcode != 0) {
        result.result = status::RUNTIME_ERROR;
        result.message = fmt::format("non-zero exit code {}", run.exitcode);
    } else if (run.output_exceeded) {
        result.result = status::OUTPUT_LIMIT_EXCEEDED;
        result.message = fmt::format("output exceeds {} bytes", config.output_limit);
    } else {
        verdict v = compare(run.out, testcase.output, limits.pe_ratio);
        result.result = v.result;
        result.score = v.score(testcase.points);
    }

    if (!run.err.empty() && result.message.empty())
        result.message = truncate_text(run.err, config.max_report_size);

    DLOG(INFO) << fmt::format("Test case {}: {}, time {}ms, memory {}KB", index, get_display_message(result.result),
                              result.time.count(), result.memory);
    return result;
}

}  // namespace ojudge::judge
