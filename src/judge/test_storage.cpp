#include "judge/test_storage.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <stdexcept>
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"

namespace pocketjudge {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

vector<test_case> load_tests(const fs::path &dir, category cat) {
    vector<test_case> tests;
    if (!fs::is_directory(dir)) return tests;

    for (auto &entry : fs::directory_iterator(dir)) {
        const fs::path &input_path = entry.path();
        if (!entry.is_regular_file() || input_path.extension() != ".in") continue;

        string stem = input_path.stem().string();
        if (!is_integer(stem)) {
            LOG(WARNING) << "Skipping test " << input_path << ": file name is not a number";
            continue;
        }

        fs::path answer_path = dir / (stem + ".ans");
        test_case test;
        try {
            test.ordinal = boost::lexical_cast<uint32_t>(stem);
        } catch (boost::bad_lexical_cast &) {
            throw invalid_argument(fmt::format("test ordinal {} is out of range", stem));
        }
        test.input = read_file_content(input_path);
        if (fs::is_regular_file(answer_path)) {
            test.answer = read_file_content(answer_path);
        } else {
            LOG(WARNING) << "Test " << input_path << " has no answer file " << answer_path;
            test.has_answer = false;
        }
        test.cat = cat;
        tests.push_back(move(test));
    }

    sort(tests.begin(), tests.end(), [](const test_case &a, const test_case &b) {
        return a.ordinal < b.ordinal;
    });
    return tests;
}

problem_config load_problem(const fs::path &problem_dir) {
    if (!fs::is_directory(problem_dir))
        throw invalid_argument(fmt::format("problem directory {} does not exist", problem_dir.string()));

    problem_config problem;
    fs::path config_path = problem_dir / "problem.json";
    if (fs::exists(config_path)) {
        try {
            json::parse(read_file_content(config_path)).get_to(problem);
        } catch (json::exception &e) {
            throw invalid_argument(fmt::format("malformed problem configuration {}: {}", config_path.string(), e.what()));
        }
    } else {
        LOG(WARNING) << "Problem configuration " << config_path << " does not exist, using defaults";
    }

    auto &checker = problem.checker;
    if (!checker.spj_executable_path.empty() && checker.spj_executable_path.is_relative())
        checker.spj_executable_path = problem_dir / checker.spj_executable_path;
    if (!checker.spj_source_path.empty() && checker.spj_source_path.is_relative())
        checker.spj_source_path = problem_dir / checker.spj_source_path;

    for (category cat : ALL_CATEGORIES) {
        vector<test_case> tests = load_tests(problem_dir / "tests" / get_category_name(cat), cat);
        LOG(INFO) << "Loaded " << tests.size() << " " << get_category_name(cat) << " from " << problem_dir;
        if (!tests.empty()) problem.tests[cat] = move(tests);
    }
    return problem;
}

}  // namespace pocketjudge
