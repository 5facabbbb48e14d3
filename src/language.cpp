#include "ojudge/language.hpp"
#include <fmt/core.h>
#include <stdexcept>
#include "ojudge/common/exceptions.hpp"
#include "ojudge/common/json_utils.hpp"
#include "ojudge/common/utils.hpp"

namespace ojudge {
using namespace std;
using namespace nlohmann;

bool language_profile::compiled() const {
    return compile_command.has_value();
}

string language_profile::source_file() const {
    return source_name + extension;
}

void from_json(const json &j, language_profile &profile) {
    profile.id = get_value<string>(j, "id");
    assign_optional(j, profile.source_name, "sourceName");
    profile.extension = get_value<string>(j, "extension");
    if (exists(j, "compile"))
        profile.compile_command = get_value<vector<string>>(j, "compile");
    else
        profile.compile_command.reset();
    assign_optional(j, profile.artifact_name, "artifact");
    profile.run_command = get_value<vector<string>>(j, "run");
    assign_optional(j, profile.time_multiplier, "timeMultiplier");
    assign_optional(j, profile.memory_multiplier, "memoryMultiplier");
}

void to_json(json &j, const language_profile &profile) {
    j = {{"id", profile.id},
         {"sourceName", profile.source_name},
         {"extension", profile.extension},
         {"run", profile.run_command},
         {"timeMultiplier", profile.time_multiplier},
         {"memoryMultiplier", profile.memory_multiplier}};
    if (profile.compile_command) {
        j["compile"] = *profile.compile_command;
        j["artifact"] = profile.artifact_name;
    }
}

static void validate(const language_profile &profile) {
    if (profile.id.empty())
        throw invalid_argument("language id must not be empty");
    if (profile.source_name.empty() || profile.source_name.find('/') != string::npos)
        throw invalid_argument(fmt::format("language {}: malformed source name", profile.id));
    if (profile.run_command.empty())
        throw invalid_argument(fmt::format("language {}: run command must not be empty", profile.id));
    if (profile.compile_command) {
        if (profile.compile_command->empty())
            throw invalid_argument(fmt::format("language {}: compile command must not be empty", profile.id));
        if (profile.artifact_name.empty())
            throw invalid_argument(fmt::format("language {}: compiled language requires an artifact", profile.id));
    }
    // 倍数小于 1 会让解释型语言的限制比题目声明的更严格，上界保证乘上任务限制后不会溢出
    if (!(profile.time_multiplier >= 1 && profile.time_multiplier <= 100))
        throw invalid_argument(fmt::format("language {}: time multiplier must be in [1, 100]", profile.id));
    if (!(profile.memory_multiplier >= 1 && profile.memory_multiplier <= 100))
        throw invalid_argument(fmt::format("language {}: memory multiplier must be in [1, 100]", profile.id));
}

language_registry language_registry::builtin() {
    language_registry registry;
    {
        language_profile c;
        c.id = "c";
        c.extension = ".c";
        c.compile_command = vector<string>{"gcc", "-o", "{artifact}", "{source}", "-O2", "-std=c99", "-lm"};
        c.artifact_name = "main";
        c.run_command = {"{artifact}"};
        registry.add(move(c));
    }
    {
        language_profile cpp;
        cpp.id = "cpp";
        cpp.extension = ".cpp";
        cpp.compile_command = vector<string>{"g++", "-o", "{artifact}", "{source}", "-O2", "-std=c++17"};
        cpp.artifact_name = "main";
        cpp.run_command = {"{artifact}"};
        registry.add(move(cpp));
    }
    {
        language_profile java;
        java.id = "java";
        java.source_name = "Main";
        java.extension = ".java";
        java.compile_command = vector<string>{"javac", "-encoding", "UTF-8", "{source}"};
        java.artifact_name = "Main.class";
        java.run_command = {"java", "-cp", "{dir}", "Main"};
        java.time_multiplier = 2;
        java.memory_multiplier = 2;
        registry.add(move(java));
    }
    {
        language_profile python;
        python.id = "python";
        python.extension = ".py";
        python.run_command = {"python3", "{source}"};
        python.time_multiplier = 3;
        python.memory_multiplier = 2;
        registry.add(move(python));
    }
    {
        language_profile javascript;
        javascript.id = "javascript";
        javascript.extension = ".js";
        javascript.run_command = {"node", "{source}"};
        javascript.time_multiplier = 2;
        javascript.memory_multiplier = 2;
        registry.add(move(javascript));
    }
    return registry;
}

language_registry language_registry::from_json(const json &j) {
    if (!j.is_array())
        throw invalid_argument("language configuration must be an array");
    language_registry registry;
    for (auto &item : j) {
        language_profile profile;
        item.get_to(profile);
        registry.add(move(profile));
    }
    return registry;
}

void language_registry::add(language_profile profile) {
    validate(profile);
    string id = profile.id;
    if (!profiles.emplace(id, move(profile)).second)
        throw invalid_argument("duplicate language " + id);
}

const language_profile &language_registry::resolve(const string &language) const {
    auto it = profiles.find(language);
    if (it == profiles.end())
        throw unsupported_language(language);
    return it->second;
}

bool language_registry::contains(const string &language) const {
    return profiles.count(language) > 0;
}

vector<string> language_registry::languages() const {
    vector<string> result;
    for (auto &[id, profile] : profiles) result.push_back(id);
    return result;
}

vector<string> expand_profile_command(const vector<string> &templ, const language_profile &profile, const filesystem::path &dir) {
    filesystem::path source = dir / profile.source_file();
    filesystem::path artifact = profile.compiled() ? dir / profile.artifact_name : source;
    return expand_command(templ, {{"source", source.string()},
                                  {"artifact", artifact.string()},
                                  {"dir", dir.string()}});
}

chrono::milliseconds estimate_judge_time(const language_profile &profile, size_t test_cases, chrono::milliseconds time_limit) {
    const chrono::milliseconds compile_time(5000), overhead(2000);
    auto run_time = chrono::milliseconds(static_cast<int64_t>(test_cases * time_limit.count() * profile.time_multiplier));
    return run_time + (profile.compiled() ? compile_time : chrono::milliseconds(0)) + overhead;
}

}  // namespace ojudge
