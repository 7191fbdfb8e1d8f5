#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include "common/io_utils.hpp"
#include "config.hpp"
#include "executor/container.hpp"
#include "judge/judge.hpp"
#include "judge/test_case_runner.hpp"
#include "worker.hpp"
using namespace std;

/**
 * @brief 读取文件内容，"-" 表示标准输入
 */
static string read_input(const string& path) {
    if (path == "-") {
        return string((istreambuf_iterator<char>(cin)), istreambuf_iterator<char>());
    }
    if (!filesystem::is_regular_file(path))
        throw invalid_argument("file " + path + " does not exist");
    return sandbox::read_file_content(path);
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    filesystem::path current(argv[0]);
    filesystem::path repo_dir(filesystem::weakly_canonical(current).parent_path().parent_path());

    namespace po = boost::program_options;
    po::options_description desc("code-sandbox options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("language,l", po::value<string>(), "language of the source code: python, javascript, java, c or cpp")
        ("source,s", po::value<string>(), "path of the source code file, - for standard input")
        ("code,c", po::value<string>(), "source code given directly on the command line")
        ("stdin,i", po::value<string>(), "path of the file fed to the program as standard input")
        ("tests,t", po::value<string>(), "path of a JSON file with an array of {\"input\", \"expected\"} test cases")
        ("workers,w", po::value<size_t>()->default_value(1), "number of test cases executed concurrently")
        ("no-container", "never use the container runtime, run programs as monitored subprocesses. You can either pass it from environ SANDBOX_CONTAINER=never")
        ("memory-limit", po::value<int>(), "set memory limit in MB, default to 256. You can either pass it from environ SANDBOX_MEMORY_LIMIT_MB")
        ("time-limit", po::value<int>(), "set wall clock time limit in seconds, default to 10. You can either pass it from environ SANDBOX_TIMEOUT_SECONDS")
        ("image", po::value<string>(), "set the sandbox image, default to code-sandbox:latest. You can either pass it from environ SANDBOX_IMAGE")
        ("dockerfile-dir", po::value<string>(), "set the directory containing the Dockerfile of the sandbox image. You can either pass it from environ SANDBOX_DOCKERFILE_DIR")
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
        cout << "code-sandbox: compile and run untrusted code under resource limits" << endl
             << "Usage: " << argv[0] << " --language LANG (--source FILE | --code TEXT) [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "code-sandbox 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (!vm.count("language") || (vm.count("source") == 0 && vm.count("code") == 0)) {
        cerr << "--language and one of --source or --code are required" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    sandbox::sandbox_config config;
    try {
        config = sandbox::load_config_from_env();

        if (vm.count("no-container")) config.mode = sandbox::container_mode::NEVER;
        if (vm.count("memory-limit")) config.memory_limit_mb = vm.at("memory-limit").as<int>();
        if (vm.count("time-limit")) config.timeout_seconds = vm.at("time-limit").as<int>();
        if (vm.count("image")) config.image = vm.at("image").as<string>();
        if (vm.count("dockerfile-dir")) config.dockerfile_dir = vm.at("dockerfile-dir").as<string>();

        // 默认情况下，假设运行环境是拉取代码直接编译的环境，此时可以在仓库中找到 Dockerfile
        if (config.dockerfile_dir.is_relative() && !filesystem::exists(config.dockerfile_dir) &&
            filesystem::exists(repo_dir / config.dockerfile_dir))
            config.dockerfile_dir = repo_dir / config.dockerfile_dir;

        sandbox::validate_config(config);
    } catch (exception& ex) {
        cerr << "Invalid configuration: " << ex.what() << endl;
        return EXIT_FAILURE;
    }

    sandbox::execution_request request;
    vector<sandbox::test_case> cases;
    try {
        request.language = vm.at("language").as<string>();
        request.code = vm.count("code") ? vm.at("code").as<string>() : read_input(vm.at("source").as<string>());
        if (vm.count("stdin")) request.stdin_data = read_input(vm.at("stdin").as<string>());
        if (vm.count("tests")) {
            nlohmann::json tests = nlohmann::json::parse(read_input(vm.at("tests").as<string>()));
            if (!tests.is_array())
                throw invalid_argument("test case file must contain a JSON array");
            cases = tests.get<vector<sandbox::test_case>>();
        }
    } catch (exception& ex) {
        LOG(ERROR) << "Unable to read input: " << boost::diagnostic_information(ex);
        return EXIT_FAILURE;
    }

    // 启动时只探测一次容器运行时，之后的所有请求共用探测结果
    sandbox::sandbox_capabilities capabilities = sandbox::probe_capabilities(config);
    sandbox::judge judge(config, capabilities);
    LOG(INFO) << "code-sandbox started with " << judge.strategy_name() << " executor";

    if (vm.count("tests")) {
        size_t workers = vm.at("workers").as<size_t>();
        sandbox::test_report report;
        if (workers > 1) {
            sandbox::execution_pool pool(judge, workers);
            report = sandbox::run_test_cases(pool, request.code, request.language, cases);
        } else {
            report = sandbox::run_test_cases(judge, request.code, request.language, cases);
        }
        cout << nlohmann::json(report).dump(2) << endl;
        return report.passed == report.total ? EXIT_SUCCESS : EXIT_FAILURE;
    } else {
        sandbox::execution_result result = judge.execute(request);
        cout << nlohmann::json(result).dump(2) << endl;
        return result.success ? EXIT_SUCCESS : EXIT_FAILURE;
    }
}
