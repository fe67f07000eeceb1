#include <glog/logging.h>
#include <signal.h>
#include <boost/algorithm/string.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/judge_engine.hpp"
#include "judge/report.hpp"
#include "judge/test_storage.hpp"
using namespace std;

// 退出码：0 表示通过，2 表示评测完成但没有通过，1 表示参数或配置错误
const int EXIT_ACCEPTED = 0;
const int EXIT_USAGE_ERROR = 1;
const int EXIT_NOT_ACCEPTED = 2;

static vector<pocketjudge::category> parse_categories(const string& literal) {
    vector<string> names;
    boost::split(names, literal, boost::is_any_of(","), boost::token_compress_on);

    vector<pocketjudge::category> categories;
    for (auto& name : names) {
        boost::trim(name);
        if (name.empty()) continue;
        categories.push_back(pocketjudge::parse_category(name));
    }
    if (categories.empty())
        throw invalid_argument("no category selected");
    return categories;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    // 选手程序提前关闭 stdin 时，不能让评测系统被 SIGPIPE 杀死
    signal(SIGPIPE, SIG_IGN);

    namespace po = boost::program_options;
    po::options_description desc("pocketjudge options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("problem-dir", po::value<string>(), "problem directory containing problem.json and tests/")
        ("source", po::value<string>(), "C++ source file of the submission")
        ("toolchain", po::value<string>(), "toolchain configuration file. You can either pass it from environ POCKETJUDGE_TOOLCHAIN")
        ("categories", po::value<string>(), "comma separated categories to judge, default to samples,pretests,system")
        ("workers", po::value<size_t>()->default_value(0), "number of judge workers, 0 means the number of CPU cores")
        ("sandbox", po::value<string>()->default_value("rlimit"), "resource limiter to use: rlimit or cgroup (requires root)")
        ("input", po::value<string>(), "run the submission with this input file instead of judging, output is not checked")
        ("pin-cores", "bind judge workers to CPU cores")
        ("no-stop-on-failure", "judge all categories even if an earlier category failed")
        ("debug", "print logs to stderr")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("problem-dir", 1).add("source", 1);

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
        return EXIT_USAGE_ERROR;
    }

    if (vm.count("help")) {
        cout << "pocketjudge: Compile a C++ submission and judge it against the tests of a problem" << endl
             << "Usage: " << argv[0] << " <problem-dir> <source.cpp> [options]" << endl
             << "Exit code: 0 if accepted, 2 if not accepted, 1 on usage or configuration error" << endl;
        cout << desc << endl;
        return EXIT_ACCEPTED;
    }

    if (vm.count("version")) {
        cout << "pocketjudge 1.0" << endl;
        return EXIT_ACCEPTED;
    }

    if (vm.count("debug")) {
        FLAGS_logtostderr = true;
    }

    if (!vm.count("problem-dir") || !vm.count("source")) {
        cerr << "Both problem directory and source file are required" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_USAGE_ERROR;
    }

    try {
        filesystem::path problem_dir = vm.at("problem-dir").as<string>();
        filesystem::path source_path = vm.at("source").as<string>();
        if (!filesystem::is_directory(problem_dir))
            throw invalid_argument(fmt::format("problem directory {} does not exist", problem_dir));
        if (!filesystem::is_regular_file(source_path))
            throw invalid_argument(fmt::format("source file {} does not exist", source_path));

        pocketjudge::toolchain_config toolchain;
        string toolchain_path = vm.count("toolchain")
                                    ? vm.at("toolchain").as<string>()
                                    : pocketjudge::get_env("POCKETJUDGE_TOOLCHAIN", "");
        if (!toolchain_path.empty())
            toolchain = pocketjudge::load_toolchain_config(toolchain_path);

        pocketjudge::judge_options options;
        if (vm.count("categories"))
            options.categories = parse_categories(vm.at("categories").as<string>());
        options.stop_on_failure = !vm.count("no-stop-on-failure");

        auto limiter = pocketjudge::make_resource_limiter(vm.at("sandbox").as<string>());
        auto pool = make_shared<pocketjudge::worker_pool>(vm.at("workers").as<size_t>(), vm.count("pin-cores") > 0);

        pocketjudge::problem_config problem = pocketjudge::load_problem(problem_dir);
        string source = pocketjudge::read_file_content(source_path);
        pocketjudge::judge_engine engine(toolchain, limiter, pool);

        LOG(INFO) << "Judging " << source_path << " against " << problem_dir
                  << " with " << limiter->name() << " limiter and " << pool->size() << " workers";

        if (vm.count("input")) {
            string input = pocketjudge::read_file_content(vm.at("input").as<string>());
            pocketjudge::custom_run_result result = engine.run_custom(source, input, problem.limits);
            cout << pocketjudge::render_report(result) << endl;
            return result.status == pocketjudge::verdict::ACCEPTED ? EXIT_ACCEPTED : EXIT_NOT_ACCEPTED;
        }

        pocketjudge::submission_result result = engine.judge(source, problem, options);
        cout << pocketjudge::render_report(result) << endl;
        return result.overall == pocketjudge::verdict::ACCEPTED ? EXIT_ACCEPTED : EXIT_NOT_ACCEPTED;
    } catch (std::exception& e) {
        LOG(ERROR) << "Unable to judge: " << boost::diagnostic_information(e);
        cerr << e.what() << endl;
        return EXIT_USAGE_ERROR;
    }
}
