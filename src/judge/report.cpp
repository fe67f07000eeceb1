#include "judge/report.hpp"

namespace pocketjudge {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const test_result &result) {
    j = {{"ordinal", result.ordinal},
         {"verdict", get_short_name(result.status)},
         {"time_ms", result.time_ms},
         {"memory_kb", result.memory_kb},
         {"detail", result.detail},
         {"exit_code", result.exit_code},
         {"error_log", result.error_log}};
}

void to_json(json &j, const category_result &result) {
    j = {{"category", get_category_name(result.cat)},
         {"verdict", get_short_name(result.status)},
         {"passed", result.passed},
         {"failed", result.failed},
         {"total_time_ms", result.total_time_ms},
         {"max_time_ms", result.max_time_ms},
         {"max_memory_kb", result.max_memory_kb},
         {"tests", result.tests}};
}

void to_json(json &j, const compile_result &result) {
    j = {{"success", result.success},
         {"output", result.output},
         {"time_ms", result.time_ms}};
}

void to_json(json &j, const statistics &stats) {
    j = {{"total", stats.total},
         {"passed", stats.passed},
         {"failed", stats.failed},
         {"total_time_ms", stats.total_time_ms},
         {"max_time_ms", stats.max_time_ms},
         {"max_memory_kb", stats.max_memory_kb},
         {"pass_rate", stats.pass_rate}};
}

void to_json(json &j, const timeline_entry &entry) {
    j = {{"stage", get_stage_name(entry.stage)},
         {"elapsed_ms", entry.elapsed_ms}};
}

void to_json(json &j, const submission_result &result) {
    json categories = json::object();
    for (auto &[cat, cat_result] : result.categories)
        categories[get_category_name(cat)] = cat_result;

    j = {{"verdict", get_short_name(result.overall)},
         {"summary", result.summary()},
         {"compile", result.compile},
         {"categories", categories},
         {"statistics", result.stats},
         {"stopped_early", result.stopped_early},
         {"timeline", result.timeline}};

    if (result.first_failure)
        j["first_failure"] = {{"category", get_category_name(result.first_failure->cat)},
                              {"ordinal", result.first_failure->ordinal}};
    else
        j["first_failure"] = nullptr;
    if (!result.detail.empty())
        j["detail"] = result.detail;
}

void to_json(json &j, const custom_run_result &result) {
    j = {{"verdict", get_short_name(result.status)},
         {"compile", result.compile}};
    if (result.run)
        j["run"] = *result.run;
    if (!result.detail.empty())
        j["detail"] = result.detail;
}

string render_report(const json &report) {
    return report.dump(2, ' ', false, json::error_handler_t::replace);
}

}  // namespace pocketjudge
