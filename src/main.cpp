#include <glog/logging.h>
#include <signal.h>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include "ojudge/common/cancellation.hpp"
#include "ojudge/common/exceptions.hpp"
#include "ojudge/common/io_utils.hpp"
#include "ojudge/common/utils.hpp"
#include "ojudge/config.hpp"
#include "ojudge/judge/engine.hpp"
#include "ojudge/language.hpp"
#include "ojudge/screen.hpp"
using namespace std;
using namespace ojudge;
using nlohmann::json;

static cancellation_token interrupted;

void cancel_handler(int /* signum */) {
    interrupted.cancel();
}

static json read_json(const string &path) {
    if (path == "-")
        return json::parse(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
    return json::parse(read_file_content(path));
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("ojudge options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("task", po::value<string>(), "judge the task in the given JSON file, - to read from standard input")
        ("config", po::value<string>(), "load engine configuration from the given JSON file")
        ("scratch-dir", po::value<string>(), "set the directory to create workspaces of tasks in. You can either pass it from environ SCRATCHDIR")
        ("languages", po::value<string>(), "load language profiles from the given JSON file instead of the builtin ones. You can either pass it from environ LANGUAGES")
        ("compile-time-limit", po::value<int64_t>(), "set compile time limit in milliseconds, default to 30000")
        ("sample-interval", po::value<int64_t>(), "set memory sampling interval in milliseconds, default to 10")
        ("output-limit", po::value<size_t>(), "set output limit of user programs in bytes, default to 67108864(64MB)")
        ("presentation-ratio", po::value<string>(), "set the score ratio of presentation error, like 4/5 or 0.8")
        ("screen", "reject the task if the source code contains suspicious calls")
        ("estimate", "print the estimated judge time of the task in milliseconds instead of judging it")
        ("list-languages", "list supported languages")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "ojudge: compile and run a submission against its test cases, print the verdict as JSON" << endl
             << "Usage: " << argv[0] << " --task <file> [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "ojudge 1.0" << endl;
        return EXIT_SUCCESS;
    }

    engine_config config;
    language_registry registry = language_registry::builtin();
    try {
        if (vm.count("config"))
            read_json(vm.at("config").as<string>()).get_to(config);

        if (vm.count("scratch-dir")) {
            config.scratch_dir = vm.at("scratch-dir").as<string>();
        } else if (string dir = get_env("SCRATCHDIR", ""); !dir.empty()) {
            config.scratch_dir = dir;
        }

        string languages = vm.count("languages") ? vm.at("languages").as<string>() : get_env("LANGUAGES", "");
        if (!languages.empty())
            registry = language_registry::from_json(read_json(languages));

        if (vm.count("compile-time-limit"))
            config.compile_time_limit = chrono::milliseconds(vm.at("compile-time-limit").as<int64_t>());
        if (vm.count("sample-interval"))
            config.sample_interval = chrono::milliseconds(vm.at("sample-interval").as<int64_t>());
        if (vm.count("output-limit"))
            config.output_limit = vm.at("output-limit").as<size_t>();
        if (vm.count("presentation-ratio"))
            config.presentation_ratio = parse_ratio(vm.at("presentation-ratio").as<string>());
    } catch (exception &e) {
        LOG(ERROR) << "Invalid configuration: " << e.what();
        return EXIT_FAILURE;
    }

    CHECK(config.compile_time_limit.count() > 0) << "Compile time limit should be positive";
    CHECK(config.sample_interval.count() > 0) << "Sample interval should be positive";

    if (vm.count("list-languages")) {
        for (auto &id : registry.languages()) cout << id << endl;
        return EXIT_SUCCESS;
    }

    if (!vm.count("task")) {
        cerr << "--task is required" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    judge::judge_task task;
    try {
        read_json(vm.at("task").as<string>()).get_to(task);
    } catch (exception &e) {
        LOG(ERROR) << "Malformed task: " << e.what();
        return EXIT_FAILURE;
    }

    if (vm.count("estimate")) {
        try {
            auto &profile = registry.resolve(task.language);
            cout << estimate_judge_time(profile, task.cases.size(), task.time_limit).count() << endl;
            return EXIT_SUCCESS;
        } catch (judge_exception &e) {
            LOG(ERROR) << e;
            return EXIT_FAILURE;
        }
    }

    if (vm.count("screen")) {
        screen_report report = screen_source(task.source, task.language, config.max_source_length);
        if (!report.safe) {
            for (auto &issue : report.issues)
                LOG(ERROR) << "Task [" << task.id << "] rejected: " << issue;
            return EXIT_FAILURE;
        }
    }

    signal(SIGINT, cancel_handler);
    signal(SIGTERM, cancel_handler);

    judge::judge_engine engine(config, registry);
    try {
        judge::judge_result result = engine.judge(task, &interrupted);
        cout << json(result).dump(4) << endl;
    } catch (judge_exception &e) {
        LOG(ERROR) << e;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
