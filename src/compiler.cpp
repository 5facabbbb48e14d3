#include "ojudge/compiler.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <stdexcept>
#include <system_error>
#include "ojudge/common/utils.hpp"
#include "ojudge/process.hpp"

namespace ojudge {
using namespace std;
namespace fs = std::filesystem;

bool compile_outcome::succeeded() const {
    return result == kind::SUCCESS;
}

static compile_outcome system_error_outcome(const string &message) {
    compile_outcome outcome;
    outcome.result = compile_outcome::kind::SYSTEM_ERROR;
    outcome.diagnostics = message;
    return outcome;
}

compile_outcome compile(const workspace &ws, const language_profile &profile, const fs::path &source,
                        const engine_config &config, const cancellation_token *cancel) {
    if (!profile.compiled()) {
        compile_outcome outcome;
        outcome.result = compile_outcome::kind::SUCCESS;
        outcome.artifact = source;
        return outcome;
    }

    run_options opt;
    try {
        opt.command = expand_profile_command(*profile.compile_command, profile, ws.path());
    } catch (invalid_argument &e) {
        return system_error_outcome(fmt::format("malformed compile command of language {}: {}", profile.id, e.what()));
    }
    opt.work_dir = ws.path();
    opt.merge_stderr = true;
    opt.wall_limit = config.compile_time_limit;
    opt.stream_size = config.max_compile_output;
    opt.sample_interval = config.sample_interval;
    opt.cancel = cancel;

    run_result result;
    try {
        result = run_process(opt);
    } catch (system_error &e) {
        LOG(ERROR) << "Unable to run compiler for language " << profile.id << ": " << e.what();
        return system_error_outcome(fmt::format("unable to run compiler: {}", e.what()));
    }

    if (!result.started)
        return system_error_outcome(result.spawn_error);

    compile_outcome outcome;
    outcome.time = result.wall_time;
    outcome.diagnostics = truncate_text(result.out, config.max_compile_output);

    if (result.cancelled) {
        outcome.result = compile_outcome::kind::SYSTEM_ERROR;
        outcome.cancelled = true;
        outcome.diagnostics = "cancelled";
        return outcome;
    }

    outcome.result = compile_outcome::kind::FAILURE;
    if (result.time_exceeded) {
        outcome.diagnostics += fmt::format("\nCompilation time limit exceeded ({}ms)", config.compile_time_limit.count());
    } else if (result.signal >= 0) {
        outcome.diagnostics += fmt::format("\nCompiler terminated with signal {}", result.signal);
    } else if (result.exitcode == 0) {
        fs::path artifact = ws.path() / profile.artifact_name;
        error_code ec;
        if (fs::exists(artifact, ec)) {
            outcome.result = compile_outcome::kind::SUCCESS;
            outcome.artifact = artifact;
        } else {
            outcome.diagnostics += fmt::format("\nCompiler did not produce {}", profile.artifact_name);
        }
    }

    DLOG(INFO) << fmt::format("Compiled {} in {}ms, exitcode {}, {}", source.string(), outcome.time.count(), result.exitcode,
                              outcome.succeeded() ? "succeeded" : "failed");
    return outcome;
}

}  // namespace ojudge
