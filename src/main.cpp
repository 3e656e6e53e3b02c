#include <curl/curl.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <atomic>
#include <csignal>
#include <iostream>
#include <thread>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "execution/http_sandbox_client.hpp"
#include "execution/session.hpp"
#include "judge/orchestrator.hpp"
#include "store/file_store.hpp"
using namespace std;

static atomic<bool> interrupted{false};

void sigintHandler(int /* signum */) {
    interrupted = true;
}

/**
 * @brief 读取整数配置，命令行参数优先，其次是环境变量
 */
static int int_option(const boost::program_options::variables_map& vm, const string& option, const char* env, int def_value) {
    if (vm.count(option)) return vm.at(option).as<int>();
    if (getenv(env)) return boost::lexical_cast<int>(getenv(env));
    return def_value;
}

static string string_option(const boost::program_options::variables_map& vm, const string& option, const char* env, const string& def_value) {
    if (vm.count(option)) return vm.at(option).as<string>();
    return get_env(env, def_value);
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("exercise-runner options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("input", po::value<string>(), "submission file in JSON: {files, tests, entryPoint, userId, lessonId}")
        ("backend", po::value<string>()->default_value("interpreter"), "execution backend, interpreter or sandbox")
        ("run", "run the project once without tests and print its output")
        ("history", "print submissions saved in the store matching --user and --lesson")
        ("user", po::value<string>(), "filter submissions by user for --history")
        ("lesson", po::value<string>(), "filter submissions by lesson for --history")
        ("store", po::value<string>(), "append finished submissions to this JSON Lines file")
        ("timeout", po::value<int>(), "time limit in milliseconds for one execution, default to 30000. You can either pass it from environ TIMEOUT_MS")
        ("submission-timeout", po::value<int>(), "time limit in milliseconds for a whole submission, default to 120000. You can either pass it from environ SUBMISSION_TIMEOUT_MS")
        ("max-concurrent", po::value<int>(), "executions allowed to run at the same time, default to 1")
        ("sandbox-url", po::value<string>(), "base url of the sandbox service. You can either pass it from environ SANDBOX_URL")
        ("sandbox-api-key", po::value<string>(), "api key of the sandbox service. You can either pass it from environ SANDBOX_API_KEY")
        ("sandbox-template", po::value<string>(), "template used to create sandboxes. You can either pass it from environ SANDBOX_TEMPLATE")
        ("work-dir", po::value<string>(), "set the directory to write user projects to. You can either pass it from environ WORKDIR")
        ("debug", "turn on the debug mode to keep the directories of executions for checking.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "exercise-runner: run a coding exercise submission against its tests" << endl
             << "Usage: " << argv[0] << " --input submission.json [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "exercise-runner 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        runner::DEBUG = true;
    }

    try {
        runner::DEFAULT_TIMEOUT_MS = int_option(vm, "timeout", "TIMEOUT_MS", runner::DEFAULT_TIMEOUT_MS);
        runner::DEFAULT_SUBMISSION_TIMEOUT_MS = int_option(vm, "submission-timeout", "SUBMISSION_TIMEOUT_MS", runner::DEFAULT_SUBMISSION_TIMEOUT_MS);
    } catch (boost::bad_lexical_cast& e) {
        LOG(FATAL) << "TIMEOUT_MS and SUBMISSION_TIMEOUT_MS should be integers";
    }
    CHECK(runner::DEFAULT_TIMEOUT_MS > 0)
        << "Execution time limit should be positive";
    CHECK(runner::DEFAULT_SUBMISSION_TIMEOUT_MS >= runner::DEFAULT_TIMEOUT_MS)
        << "Submission time limit should not be less than the execution time limit";

    if (vm.count("max-concurrent")) {
        runner::DEFAULT_MAX_CONCURRENT = vm["max-concurrent"].as<int>();
    }
    CHECK(runner::DEFAULT_MAX_CONCURRENT > 0)
        << "At least one execution should be allowed";

    if (vm.count("work-dir")) {
        runner::WORK_DIR = filesystem::path(vm.at("work-dir").as<string>());
    } else if (getenv("WORKDIR")) {
        runner::WORK_DIR = filesystem::path(getenv("WORKDIR"));
    }
    runner::WORK_DIR = filesystem::absolute(runner::WORK_DIR);
    filesystem::create_directories(runner::WORK_DIR);
    CHECK(filesystem::is_directory(runner::WORK_DIR))
        << "Work directory " << runner::WORK_DIR << " does not exist";

    runner::SANDBOX_URL = string_option(vm, "sandbox-url", "SANDBOX_URL", runner::SANDBOX_URL);
    runner::SANDBOX_API_KEY = string_option(vm, "sandbox-api-key", "SANDBOX_API_KEY", runner::SANDBOX_API_KEY);
    runner::SANDBOX_TEMPLATE = string_option(vm, "sandbox-template", "SANDBOX_TEMPLATE", runner::SANDBOX_TEMPLATE);

    runner::backend_kind backend = runner::backend_kind::INTERPRETER;
    try {
        backend = runner::parse_backend_kind(vm["backend"].as<string>());
    } catch (std::invalid_argument& e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }
    CHECK(backend != runner::backend_kind::SANDBOX || !runner::SANDBOX_URL.empty())
        << "SANDBOX_URL should be specified to use the sandbox backend";

    unique_ptr<runner::file_submission_store> store;
    if (vm.count("store")) {
        store = make_unique<runner::file_submission_store>(vm["store"].as<string>());
    }

    if (vm.count("history")) {
        CHECK(store) << "--history requires --store";
        runner::submission_filter filter;
        if (vm.count("user")) filter.user_id = vm["user"].as<string>();
        if (vm.count("lesson")) filter.lesson_id = vm["lesson"].as<string>();
        try {
            cout << nlohmann::dump_lossy(nlohmann::json(store->find(filter)), 2) << endl;
        } catch (runner::persistence_error& e) {
            LOG(ERROR) << e.what();
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }

    if (!vm.count("input")) {
        cerr << "--input is required" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    filesystem::path input(vm["input"].as<string>());
    CHECK(filesystem::is_regular_file(input))
        << "Submission file " << input << " does not exist";

    vector<runner::project_file> files;
    vector<runner::test_definition> tests;
    runner::submission_limits limits;
    runner::submission_context context;
    try {
        nlohmann::json j = nlohmann::json::parse(runner::read_file_content(input));
        files = nlohmann::get_value<vector<runner::project_file>>(j, "files");
        tests = nlohmann::get_value_def<vector<runner::test_definition>>(j, {}, "tests");
        limits.entry_point = nlohmann::get_value_def<string>(j, "main.py", "entryPoint");
        context.submission_id = nlohmann::get_value_def<string>(j, "", "submissionId");
        context.user_id = nlohmann::get_value_def<string>(j, "", "userId");
        context.lesson_id = nlohmann::get_value_def<string>(j, "", "lessonId");
    } catch (std::exception& e) {
        LOG(ERROR) << "Submission file " << input << " is malformed: " << e.what();
        return EXIT_FAILURE;
    }
    for (size_t i = 0; i < tests.size(); ++i)
        if (tests[i].id.empty()) tests[i].id = "test-" + to_string(i + 1);
    if (context.submission_id.empty()) context.submission_id = random_uuid();
    limits.max_concurrent = runner::DEFAULT_MAX_CONCURRENT;

    runner::session_options options;
    options.max_concurrent = runner::DEFAULT_MAX_CONCURRENT;
    if (!runner::SANDBOX_URL.empty()) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        options.sandbox = make_shared<runner::http_sandbox_client>(runner::SANDBOX_URL, runner::SANDBOX_API_KEY, runner::SANDBOX_TEMPLATE, runner::SANDBOX_WORKDIR);
    }

    int exit_code = EXIT_SUCCESS;
    {
        runner::session session(options);
        runner::submission_orchestrator orchestrator(session.queue(), store.get());

        // 收到 SIGINT 时取消正在评测的提交，已经完成的测试结果仍然会输出
        signal(SIGINT, sigintHandler);
        atomic<bool> finished{false};
        thread watcher([&] {
            while (!finished) {
                if (interrupted.exchange(false)) {
                    LOG(WARNING) << "Received SIGINT, canceling submission " << context.submission_id;
                    orchestrator.cancel(context.submission_id);
                }
                this_thread::sleep_for(chrono::milliseconds(50));
            }
        });

        try {
            if (vm.count("run")) {
                runner::playground_result result = orchestrator.execute(files, limits.entry_point, backend, runner::DEFAULT_TIMEOUT_MS);
                cout << nlohmann::dump_lossy(nlohmann::json(result), 2) << endl;
                if (result.error) exit_code = EXIT_FAILURE;
            } else {
                runner::submission_result result = orchestrator.run(files, tests, backend, limits, context);
                cout << nlohmann::dump_lossy(nlohmann::json(result), 2) << endl;
                if (!result.success) exit_code = EXIT_FAILURE;
            }
        } catch (runner::contract_violation& e) {
            LOG(ERROR) << e.what() << endl
                       << boost::diagnostic_information(e);
            exit_code = EXIT_FAILURE;
        }

        finished = true;
        watcher.join();
    }

    if (!runner::SANDBOX_URL.empty()) curl_global_cleanup();
    return exit_code;
}
