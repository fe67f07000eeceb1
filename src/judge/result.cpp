#include "judge/result.hpp"
#include <fmt/core.h>

namespace pocketjudge {
using namespace std;

const char *get_stage_name(judge_stage stage) {
    switch (stage) {
        case judge_stage::COMPILING: return "compiling";
        case judge_stage::RUNNING_SAMPLES: return "running_samples";
        case judge_stage::RUNNING_PRETESTS: return "running_pretests";
        case judge_stage::RUNNING_SYSTEM: return "running_system";
        case judge_stage::AGGREGATING: return "aggregating";
        case judge_stage::DONE: return "done";
    }
    return "unknown";
}

string submission_result::summary() const {
    if (first_failure)
        return fmt::format("{} on {} {}", get_display_message(overall), get_test_noun(first_failure->cat), first_failure->ordinal);
    return get_display_message(overall);
}

}  // namespace pocketjudge
