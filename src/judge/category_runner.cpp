#include "judge/category_runner.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <future>
#include <set>
#include <stdexcept>

namespace pocketjudge {
using namespace std;

category_runner::category_runner(const test_runner &runner, worker_pool &pool)
    : runner(runner), pool(pool) {}

void category_runner::validate(category cat, const vector<test_case> &tests) {
    set<uint32_t> ordinals;
    for (auto &test : tests) {
        if (!ordinals.insert(test.ordinal).second)
            throw invalid_argument(fmt::format("duplicate ordinal {} in {}", test.ordinal, get_category_name(cat)));
    }
}

category_result category_runner::run(category cat, const compiled_artifact &artifact, vector<test_case> tests,
                                     const resource_limits &limits, const checker &c) const {
    validate(cat, tests);
    sort(tests.begin(), tests.end(), [](const test_case &a, const test_case &b) {
        return a.ordinal < b.ordinal;
    });

    LOG(INFO) << "Running " << tests.size() << " " << get_category_name(cat);

    // 结果按下标保存，因此与完成顺序无关
    vector<future<test_result>> futures;
    for (auto &test : tests) {
        futures.push_back(pool.submit([this, &artifact, &test, &limits, &c] {
            return runner.run(artifact, test, limits, c);
        }));
    }

    // 任务引用了 tests，必须等所有任务结束后才能离开作用域
    for (auto &future : futures) future.wait();

    category_result result;
    result.cat = cat;
    for (auto &future : futures) {
        test_result test = future.get();
        if (test.status == verdict::ACCEPTED) {
            ++result.passed;
        } else {
            ++result.failed;
            if (result.status == verdict::ACCEPTED) result.status = test.status;
        }
        result.total_time_ms += test.time_ms;
        result.max_time_ms = max(result.max_time_ms, test.time_ms);
        result.max_memory_kb = max(result.max_memory_kb, test.memory_kb);
        result.tests.push_back(move(test));
    }
    return result;
}

}  // namespace pocketjudge
