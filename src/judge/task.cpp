#include "ojudge/judge/task.hpp"
#include <stdexcept>
#include "ojudge/common/json_utils.hpp"
#include "ojudge/config.hpp"

namespace ojudge::judge {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, scoring_policy &policy) {
    string str = j.get<string>();
    if (str == "acm" || str == "ACM")
        policy = scoring_policy::ACM;
    else if (str == "oi" || str == "OI")
        policy = scoring_policy::OI;
    else
        throw invalid_argument("Unrecognized scoring policy " + str);
}

void to_json(json &j, const scoring_policy &policy) {
    j = policy == scoring_policy::ACM ? "acm" : "oi";
}

void from_json(const json &j, test_case &value) {
    value.input = get_value<string>(j, "input");
    value.output = get_value<string>(j, "output");
    assign_optional(j, value.points, "points");
}

void from_json(const json &j, judge_task &task) {
    task.id = get_value<string>(j, "id");
    task.language = get_value<string>(j, "language");
    task.source = get_value<string>(j, "source");
    if (exists(j, "timeLimit"))
        task.time_limit = chrono::milliseconds(get_value<int64_t>(j, "timeLimit"));
    assign_optional(j, task.memory_limit, "memoryLimit");
    if (exists(j, "policy"))
        from_json(j.at("policy"), task.policy);
    if (exists(j, "presentationRatio")) {
        auto &ratio = j.at("presentationRatio");
        task.presentation_ratio = parse_ratio(ratio.is_string() ? ratio.get<string>() : ratio.dump());
    }

    task.cases.clear();
    for (auto &item : access(j, "testCases")) {
        test_case value;
        from_json(item, value);
        task.cases.push_back(move(value));
    }
}

void to_json(json &j, const test_case_result &value) {
    j = {{"index", value.index},
         {"status", get_display_message(value.result)},
         {"time", value.time.count()},
         {"cpuTime", value.cpu_time.count()},
         {"memory", value.memory},
         {"exitCode", value.exitcode},
         {"signal", value.signal},
         {"output", value.output},
         {"score", value.score},
         {"message", value.message}};
}

void to_json(json &j, const judge_result &value) {
    j = {{"taskId", value.task_id},
         {"status", get_display_message(value.result)},
         {"score", value.score},
         {"time", value.time.count()},
         {"memory", value.memory},
         {"compileOutput", value.compile_output},
         {"error", value.error},
         {"cancelled", value.cancelled},
         {"testCases", value.cases}};
}

}  // namespace ojudge::judge
