#include "judge/problem.hpp"
#include <boost/assign.hpp>
#include <cmath>
#include <stdexcept>
#include <unordered_map>
#include "common/json_utils.hpp"

namespace pocketjudge {
using namespace std;
using namespace nlohmann;

const vector<category> ALL_CATEGORIES = {category::SAMPLES, category::PRETESTS, category::SYSTEM};

// clang-format off
static const unordered_map<category, const char *> category_names = boost::assign::map_list_of
    (category::SAMPLES, "samples")
    (category::PRETESTS, "pretests")
    (category::SYSTEM, "system");

static const unordered_map<category, const char *> test_nouns = boost::assign::map_list_of
    (category::SAMPLES, "sample")
    (category::PRETESTS, "pretest")
    (category::SYSTEM, "test");
// clang-format on

const char *get_category_name(category cat) {
    return category_names.at(cat);
}

const char *get_test_noun(category cat) {
    return test_nouns.at(cat);
}

category parse_category(const string &name) {
    for (auto &[cat, cat_name] : category_names)
        if (name == cat_name) return cat;
    throw invalid_argument("unknown test category " + name);
}

void from_json(const json &j, resource_limits &limits) {
    assign_optional(j, limits.time_limit_ms, "time_limit_ms");
    assign_optional(j, limits.memory_limit_mb, "memory_limit_mb");
    assign_optional(j, limits.compile_timeout_s, "compile_timeout_s");

    if (limits.time_limit_ms == 0)
        throw invalid_argument("time_limit_ms must be positive");
    if (limits.memory_limit_mb == 0)
        throw invalid_argument("memory_limit_mb must be positive");
    if (limits.compile_timeout_s == 0)
        throw invalid_argument("compile_timeout_s must be positive");
}

void from_json(const json &j, checker_config &checker) {
    string type = get_value_def<string>(j, "diff", "checker_type");
    if (type == "diff") {
        checker.type = checker_type::DIFF;
    } else if (type == "float") {
        checker.type = checker_type::FLOAT;
    } else if (type == "spj") {
        checker.type = checker_type::SPECIAL_JUDGE;
    } else {
        throw invalid_argument("unknown checker type " + type);
    }

    assign_optional(j, checker.float_abs_tol, "float_abs_tol");
    if (!std::isfinite(checker.float_abs_tol) || checker.float_abs_tol <= 0)
        throw invalid_argument("float_abs_tol must be a positive finite number");

    if (j.count("spj_executable_path"))
        checker.spj_executable_path = j.at("spj_executable_path").get<string>();
    if (j.count("spj_source_path"))
        checker.spj_source_path = j.at("spj_source_path").get<string>();

    if (checker.type == checker_type::SPECIAL_JUDGE &&
        checker.spj_executable_path.empty() && checker.spj_source_path.empty())
        throw invalid_argument("special judge requires spj_executable_path or spj_source_path");
}

void from_json(const json &j, problem_config &problem) {
    if (!j.is_object())
        throw invalid_argument("problem configuration must be a json object");
    j.get_to(problem.limits);
    j.get_to(problem.checker);
}

}  // namespace pocketjudge
