#include "ojudge/screen.hpp"
#include <fmt/core.h>
#include <map>
#include <regex>
#include <utility>

namespace ojudge {
using namespace std;

using rule = pair<string, regex>;

static const map<string, vector<rule>> &screen_rules() {
    static const map<string, vector<string>> patterns = {
        {"c", {R"(system\s*\()", R"(exec\s*\()", R"(popen\s*\()"}},
        {"cpp", {R"(system\s*\()", R"(exec\s*\()", R"(popen\s*\()"}},
        {"java", {R"(Runtime\.getRuntime\(\))", R"(ProcessBuilder)", R"(System\.exit\()"}},
        {"python", {R"(import\s+os)", R"(import\s+subprocess)", R"(exec\s*\()", R"(eval\s*\()"}},
        {"javascript", {R"(require\s*\()", R"(import\s+.*fs)", R"(process\.)"}}};

    static const map<string, vector<rule>> rules = [] {
        map<string, vector<rule>> result;
        for (auto &[language, sources] : patterns)
            for (auto &source : sources)
                result[language].emplace_back(source, regex(source));
        return result;
    }();
    return rules;
}

screen_report screen_source(const string &code, const string &language, size_t max_length) {
    screen_report report;

    auto &rules = screen_rules();
    if (auto it = rules.find(language); it != rules.end()) {
        for (auto &[source, pattern] : it->second) {
            if (regex_search(code, pattern))
                report.issues.push_back(fmt::format("potentially dangerous code: {}", source));
        }
    }

    if (code.size() > max_length)
        report.issues.push_back(fmt::format("source code exceeds {} bytes", max_length));

    report.safe = report.issues.empty();
    return report;
}

}  // namespace ojudge
