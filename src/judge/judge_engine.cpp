#include "judge/judge_engine.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <cmath>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "judge/category_runner.hpp"

namespace pocketjudge {
using namespace std;
namespace fs = std::filesystem;

static judge_stage running_stage(category cat) {
    switch (cat) {
        case category::SAMPLES: return judge_stage::RUNNING_SAMPLES;
        case category::PRETESTS: return judge_stage::RUNNING_PRETESTS;
        case category::SYSTEM: return judge_stage::RUNNING_SYSTEM;
    }
    throw invalid_argument("unknown category");
}

/**
 * @brief 汇总各分类的结果
 * 按 samples、pretests、system 的顺序，测试点编号升序扫描，第一个没有通过的测试点的结果即为提交的结果
 */
static void aggregate(submission_result &result) {
    result.overall = verdict::ACCEPTED;
    result.first_failure.reset();
    statistics &stats = result.stats;
    stats = statistics();

    for (category cat : ALL_CATEGORIES) {
        auto it = result.categories.find(cat);
        if (it == result.categories.end()) continue;
        for (auto &test : it->second.tests) {
            ++stats.total;
            if (test.status == verdict::ACCEPTED) {
                ++stats.passed;
            } else {
                ++stats.failed;
                if (!result.first_failure) {
                    result.overall = test.status;
                    result.first_failure = failure_point{cat, test.ordinal};
                }
            }
            stats.total_time_ms += test.time_ms;
            stats.max_time_ms = max(stats.max_time_ms, test.time_ms);
            stats.max_memory_kb = max(stats.max_memory_kb, test.memory_kb);
        }
    }

    if (stats.total > 0)
        stats.pass_rate = round(stats.passed * 1000.0 / stats.total) / 10;
}

judge_engine::judge_engine(const toolchain_config &config, shared_ptr<const resource_limiter> limiter, shared_ptr<worker_pool> pool)
    : config(config),
      limiter(limiter),
      pool(move(pool)),
      source_compiler(config.compile_command, config, limiter),
      spj_compiler(config.spj_compile_command, config, limiter),
      runner(limiter, config) {}

const toolchain_config &judge_engine::get_config() const {
    return config;
}

checker judge_engine::prepare_checker(const checker_config &checker_conf, const resource_limits &limits, optional<compiled_artifact> &spj_artifact) const {
    switch (checker_conf.type) {
        case checker_type::DIFF:
            return diff_checker{};
        case checker_type::FLOAT:
            return float_checker{checker_conf.float_abs_tol};
        case checker_type::SPECIAL_JUDGE: {
            run_limits spj_limits;
            spj_limits.time_limit_ms = config.spj_time_limit_ms;
            spj_limits.memory_limit_mb = config.spj_memory_limit_mb;
            spj_limits.output_limit_kb = config.output_limit_kb;
            spj_limits.diagnostic_limit = config.diagnostic_limit;

            fs::path executable;
            if (!checker_conf.spj_executable_path.empty() && fs::exists(checker_conf.spj_executable_path)) {
                executable = fs::absolute(checker_conf.spj_executable_path);
            } else if (!checker_conf.spj_source_path.empty()) {
                if (!fs::is_regular_file(checker_conf.spj_source_path))
                    throw internal_error(fmt::format("special judge source {} does not exist", checker_conf.spj_source_path.string()));

                LOG(INFO) << "Compiling special judge " << checker_conf.spj_source_path;
                compile_result spj_compile;
                try {
                    spj_artifact.emplace(spj_compiler.compile(read_file_content(checker_conf.spj_source_path), limits.compile_timeout_s, spj_compile));
                } catch (compilation_error &e) {
                    throw internal_error("special judge failed to compile: " + e.error_log);
                }
                executable = spj_artifact->get_executable();
            } else {
                throw internal_error(fmt::format("special judge {} does not exist", checker_conf.spj_executable_path.string()));
            }
            return special_judge_checker{executable, spj_limits, limiter};
        }
    }
    throw invalid_argument("unknown checker type");
}

submission_result judge_engine::judge(const string &source, const problem_config &problem, const judge_options &options) const {
    submission_result result;
    elapsed_time timer;
    auto enter = [&](judge_stage stage) {
        result.timeline.push_back({stage, timer.milliseconds()});
    };

    enter(judge_stage::COMPILING);
    try {
        optional<compiled_artifact> artifact;
        try {
            artifact.emplace(source_compiler.compile(source, problem.limits.compile_timeout_s, result.compile));
        } catch (compilation_error &e) {
            LOG(INFO) << "Compilation error: " << e.what();
            result.overall = verdict::COMPILATION_ERROR;
            result.compile.success = false;
            result.compile.output = e.error_log;
            enter(judge_stage::DONE);
            return result;
        }

        for (auto &[cat, tests] : problem.tests)
            category_runner::validate(cat, tests);

        optional<compiled_artifact> spj_artifact;
        checker c = prepare_checker(problem.checker, problem.limits, spj_artifact);

        vector<category> selected;
        for (category cat : ALL_CATEGORIES) {
            if (find(options.categories.begin(), options.categories.end(), cat) == options.categories.end()) continue;
            auto it = problem.tests.find(cat);
            if (it == problem.tests.end() || it->second.empty()) continue;
            selected.push_back(cat);
        }

        category_runner categories(runner, *pool);
        for (size_t i = 0; i < selected.size(); ++i) {
            category cat = selected[i];
            enter(running_stage(cat));
            category_result cat_result = categories.run(cat, *artifact, problem.tests.at(cat), problem.limits, c);
            bool failed = cat_result.status != verdict::ACCEPTED;
            result.categories[cat] = move(cat_result);

            if (failed && options.stop_on_failure && i + 1 < selected.size()) {
                LOG(INFO) << get_category_name(cat) << " failed, skipping remaining categories";
                result.stopped_early = true;
                break;
            }
        }

        enter(judge_stage::AGGREGATING);
        aggregate(result);
    } catch (judge_exception &e) {
        LOG(ERROR) << "Judge error: " << e;
        result.overall = verdict::JUDGE_ERROR;
        result.first_failure.reset();
        result.detail = e.what();
    } catch (exception &e) {
        LOG(ERROR) << "Judge error: " << e.what();
        result.overall = verdict::JUDGE_ERROR;
        result.first_failure.reset();
        result.detail = e.what();
    }

    enter(judge_stage::DONE);
    LOG(INFO) << "Judged submission: " << result.summary();
    return result;
}

custom_run_result judge_engine::run_custom(const string &source, const string &input, const resource_limits &limits) const {
    custom_run_result result;
    try {
        compiled_artifact artifact = source_compiler.compile(source, limits.compile_timeout_s, result.compile);
        result.run = runner.run_custom(artifact, input, limits);
        result.status = result.run->status;
    } catch (compilation_error &e) {
        result.status = verdict::COMPILATION_ERROR;
        result.compile.success = false;
        result.compile.output = e.error_log;
    } catch (exception &e) {
        LOG(ERROR) << "Judge error: " << e.what();
        result.status = verdict::JUDGE_ERROR;
        result.detail = e.what();
    }
    return result;
}

}  // namespace pocketjudge
