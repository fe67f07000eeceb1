#include "common/verdict.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace pocketjudge {
using namespace std;

// clang-format off
static const unordered_map<verdict, const char *> display_string = boost::assign::map_list_of
    (verdict::ACCEPTED, "Accepted")
    (verdict::WRONG_ANSWER, "Wrong Answer")
    (verdict::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (verdict::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (verdict::RUNTIME_ERROR, "Runtime Error")
    (verdict::PRESENTATION_ERROR, "Presentation Error")
    (verdict::COMPILATION_ERROR, "Compilation Error")
    (verdict::JUDGE_ERROR, "Judge Error");

static const unordered_map<verdict, const char *> short_string = boost::assign::map_list_of
    (verdict::ACCEPTED, "AC")
    (verdict::WRONG_ANSWER, "WA")
    (verdict::TIME_LIMIT_EXCEEDED, "TLE")
    (verdict::MEMORY_LIMIT_EXCEEDED, "MLE")
    (verdict::RUNTIME_ERROR, "RTE")
    (verdict::PRESENTATION_ERROR, "PE")
    (verdict::COMPILATION_ERROR, "CE")
    (verdict::JUDGE_ERROR, "JE");
// clang-format on

const char *get_display_message(verdict v) {
    return display_string.at(v);
}

const char *get_short_name(verdict v) {
    return short_string.at(v);
}

verdict parse_verdict(const string &short_name) {
    for (auto &[v, name] : short_string)
        if (short_name == name) return v;
    throw invalid_argument("unknown verdict " + short_name);
}

ostream &operator<<(ostream &os, verdict v) {
    return os << get_short_name(v);
}

}  // namespace pocketjudge
