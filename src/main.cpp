#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <iterator>
#include "common/io_utils.hpp"
#include "config.hpp"
#include "judge/executor.hpp"
#include "judge/judger.hpp"
#include "sandbox/docker_sandbox.hpp"
#include "server/local/local_server.hpp"
#include "worker.hpp"
using namespace std;
using namespace codejudge;

namespace po = boost::program_options;

static string read_source(const po::variables_map& vm, const string& key) {
    string path = vm.at(key).as<string>();
    if (path == "-")
        return string(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
    return read_file_content(path);
}

static int run_command(const po::variables_map& vm, const executor& exec) {
    if (!vm.count("language") || !vm.count("code") || !vm.count("input")) {
        cerr << "run requires --language, --code and --input" << endl;
        return EXIT_FAILURE;
    }

    run_request request;
    request.language = vm.at("language").as<string>();
    request.code = read_source(vm, "code");
    request.input = read_source(vm, "input");
    request.time_limit = vm.at("time-limit").as<double>();

    run_result result = exec.run(request);
    cout << to_run_response(result).dump(2) << endl;
    return EXIT_SUCCESS;
}

static int judge_command(const po::variables_map& vm, const executor& exec) {
    if (!vm.count("problem") || !vm.count("language") || !vm.count("code")) {
        cerr << "judge requires --problem, --language and --code" << endl;
        return EXIT_FAILURE;
    }

    server::local::configuration judge_server(cout);
    problem prob = judge_server.load_problem(vm.at("problem").as<string>());

    submission submit;
    submit.sub_id = "local";
    submit.prob_id = prob.id;
    submit.user_id = vm.at("user").as<string>();
    submit.language = vm.at("language").as<string>();
    submit.code = read_source(vm, "code");

    judger j(exec, judge_server);
    judge_with_retry(j, submit);
    judge_server.summarize(submit);
    return EXIT_SUCCESS;
}

static int serve_command(const po::variables_map& vm, const engine_config& config, const executor& exec) {
    if (!vm.count("problems")) {
        cerr << "serve requires --problems" << endl;
        return EXIT_FAILURE;
    }

    server::local::configuration judge_server(cout);
    size_t count = judge_server.load_problems(vm.at("problems").as<string>());
    LOG(INFO) << "Loaded " << count << " problems";

    judger j(exec, judge_server);
    worker_pool pool(j, judge_server, config.workers);

    string line;
    while (getline(cin, line)) {
        if (line.find_first_not_of(" \t\r") == string::npos) continue;
        auto submit = make_shared<submission>();
        try {
            nlohmann::json::parse(line).get_to(*submit);
        } catch (std::exception& ex) {
            LOG(ERROR) << "Malformed judging request " << line << ": " << ex.what();
            continue;
        }
        pool.submit(move(submit));
    }

    pool.stop();
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    po::options_description desc("codejudge options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("command", po::value<string>(), "run, judge or serve")
        ("config", po::value<string>(), "load engine configuration from the given JSON file")
        ("local", "use local process execution instead of containers. You can either pass it from environ USE_DOCKER=false")
        ("language", po::value<string>(), "language of the source code: python, cpp, c or java")
        ("code", po::value<string>(), "source code file, - for stdin")
        ("input", po::value<string>(), "input file for run, - for stdin")
        ("time-limit", po::value<double>()->default_value(1), "time limit in seconds for run")
        ("problem", po::value<string>(), "problem JSON file for judge")
        ("problems", po::value<string>(), "directory with problem JSON files for serve")
        ("user", po::value<string>()->default_value("local"), "user who owns the submission for judge")
        ("workers", po::value<size_t>(), "number of judge workers for serve, default to the number of CPU cores")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("command", 1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("version")) {
        cout << "codejudge 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("help") || !vm.count("command")) {
        cout << "codejudge: compile, run and judge untrusted source code" << endl
             << "Usage:" << endl
             << "\t" << argv[0] << " run --language L --code FILE --input FILE [--time-limit T]" << endl
             << "\t" << argv[0] << " judge --problem PROBLEM.json --language L --code FILE" << endl
             << "\t" << argv[0] << " serve --problems DIR [--workers N]" << endl;
        cout << desc << endl;
        return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    engine_config config;
    try {
        if (vm.count("config"))
            load_config_file(vm.at("config").as<string>(), config);
    } catch (std::exception& ex) {
        cerr << "Unable to load configuration: " << ex.what() << endl;
        return EXIT_FAILURE;
    }
    apply_environment(config);
    if (vm.count("local")) config.use_sandbox = false;
    if (vm.count("workers")) config.workers = vm.at("workers").as<size_t>();

    CHECK(filesystem::is_directory(config.temp_dir))
        << "Temporary directory " << config.temp_dir << " does not exist";

    if (config.use_sandbox && !docker_sandbox::available(config)) {
        LOG(WARNING) << "Container runtime " << config.container_runtime
                     << " is unavailable, falling back to local process execution without memory and network isolation";
        config.use_sandbox = false;
    }

    auto box = make_sandbox(config);
    sandbox_executor exec(config, *box);
    LOG(INFO) << "Using " << box->name() << " sandbox";

    string command = vm.at("command").as<string>();
    try {
        if (command == "run")
            return run_command(vm, exec);
        else if (command == "judge")
            return judge_command(vm, exec);
        else if (command == "serve")
            return serve_command(vm, config, exec);
    } catch (std::exception& ex) {
        LOG(ERROR) << boost::diagnostic_information(ex);
        cerr << ex.what() << endl;
        return EXIT_FAILURE;
    }

    cerr << "Unknown command " << command << endl;
    return EXIT_FAILURE;
}
