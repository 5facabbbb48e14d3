#include "gtest/gtest.h"
#include "ojudge/common/exceptions.hpp"
#include "ojudge/language.hpp"

using namespace std;
using namespace ojudge;
using nlohmann::json;

TEST(LanguageRegistryTest, BuiltinTest) {
    language_registry registry = language_registry::builtin();
    vector<string> expected{"c", "cpp", "java", "javascript", "python"};
    EXPECT_EQ(registry.languages(), expected);

    auto &cpp = registry.resolve("cpp");
    EXPECT_TRUE(cpp.compiled());
    EXPECT_EQ(cpp.source_file(), "main.cpp");
    EXPECT_EQ(cpp.time_multiplier, 1);

    auto &python = registry.resolve("python");
    EXPECT_FALSE(python.compiled());
    EXPECT_EQ(python.time_multiplier, 3);
    EXPECT_EQ(python.memory_multiplier, 2);

    auto &java = registry.resolve("java");
    EXPECT_EQ(java.source_file(), "Main.java");
    EXPECT_EQ(java.time_multiplier, 2);
}

TEST(LanguageRegistryTest, UnsupportedLanguageTest) {
    language_registry registry = language_registry::builtin();
    EXPECT_FALSE(registry.contains("brainfuck"));
    try {
        registry.resolve("brainfuck");
        FAIL() << "unsupported_language expected";
    } catch (unsupported_language &e) {
        EXPECT_EQ(e.language, "brainfuck");
    }
    // 不区分大小写会把未知语言当成已知语言
    EXPECT_THROW(registry.resolve("CPP"), unsupported_language);
}

TEST(LanguageRegistryTest, FromJsonTest) {
    json j = json::parse(R"([
        {"id": "sh", "extension": ".sh", "run": ["/bin/sh", "{source}"]},
        {"id": "go", "extension": ".go", "compile": ["go", "build", "-o", "{artifact}", "{source}"],
         "artifact": "main", "run": ["{artifact}"], "timeMultiplier": 1.5}
    ])");
    language_registry registry = language_registry::from_json(j);
    EXPECT_TRUE(registry.contains("sh"));
    EXPECT_FALSE(registry.contains("cpp"));
    EXPECT_FALSE(registry.resolve("sh").compiled());
    EXPECT_TRUE(registry.resolve("go").compiled());
    EXPECT_DOUBLE_EQ(registry.resolve("go").time_multiplier, 1.5);
    EXPECT_DOUBLE_EQ(registry.resolve("go").memory_multiplier, 1);
}

TEST(LanguageRegistryTest, InvalidProfileTest) {
    EXPECT_THROW(language_registry::from_json(json::parse(R"({"id": "sh"})")), invalid_argument);
    EXPECT_THROW(language_registry::from_json(json::parse(R"([{"id": "sh", "extension": ".sh"}])")), invalid_argument);
    EXPECT_THROW(language_registry::from_json(json::parse(R"([{"id": "sh", "extension": ".sh", "run": []}])")), invalid_argument);
    EXPECT_THROW(language_registry::from_json(json::parse(
                     R"([{"id": "sh", "extension": ".sh", "run": ["sh"], "timeMultiplier": 0.5}])")),
                 invalid_argument);
    EXPECT_THROW(language_registry::from_json(json::parse(
                     R"([{"id": "sh", "extension": ".sh", "run": ["sh"], "memoryMultiplier": 1e300}])")),
                 invalid_argument);
    EXPECT_THROW(language_registry::from_json(json::parse(
                     R"([{"id": "c", "extension": ".c", "compile": ["gcc", "{source}"], "run": ["./a.out"]}])")),
                 invalid_argument);
    EXPECT_THROW(language_registry::from_json(json::parse(R"([
        {"id": "sh", "extension": ".sh", "run": ["sh"]},
        {"id": "sh", "extension": ".bash", "run": ["bash"]}
    ])")),
                 invalid_argument);
}

TEST(LanguageRegistryTest, ExpandProfileCommandTest) {
    language_registry registry = language_registry::builtin();
    auto &java = registry.resolve("java");
    vector<string> run{"java", "-cp", "/w", "Main"};
    EXPECT_EQ(expand_profile_command(java.run_command, java, "/w"), run);

    auto &cpp = registry.resolve("cpp");
    auto compile = expand_profile_command(*cpp.compile_command, cpp, "/w");
    EXPECT_EQ(compile[2], "/w/main");
    EXPECT_EQ(compile[3], "/w/main.cpp");

    auto &python = registry.resolve("python");
    vector<string> interpreted{"python3", "/w/main.py"};
    EXPECT_EQ(expand_profile_command(python.run_command, python, "/w"), interpreted);
}

TEST(LanguageRegistryTest, EstimateJudgeTimeTest) {
    language_registry registry = language_registry::builtin();
    EXPECT_EQ(estimate_judge_time(registry.resolve("cpp"), 10, chrono::milliseconds(1000)).count(), 10 * 1000 + 5000 + 2000);
    EXPECT_EQ(estimate_judge_time(registry.resolve("python"), 2, chrono::milliseconds(1000)).count(), 2 * 3000 + 2000);
}
