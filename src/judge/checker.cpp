#include "judge/checker.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <string.h>
#include <boost/algorithm/string.hpp>
#include <cmath>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"

namespace pocketjudge {
using namespace std;
namespace fs = std::filesystem;

// 报告中引用的一行或一个 token 最多保留的字符数
const size_t QUOTE_LIMIT = 64;

static string quote(const string &s) {
    if (s.size() <= QUOTE_LIMIT)
        return "\"" + s + "\"";
    return "\"" + s.substr(0, QUOTE_LIMIT) + "...\"";
}

/**
 * @brief 删除行末空白和文末空行
 */
static vector<string> normalize_lines(const string &text) {
    vector<string> lines = split_lines(text);
    for (auto &line : lines)
        boost::trim_right_if(line, boost::is_any_of(" \t\r"));
    while (!lines.empty() && lines.back().empty())
        lines.pop_back();
    return lines;
}

check_result diff_checker::check(const string &, const string &output, const string &answer, const fs::path &) const {
    vector<string> expected = normalize_lines(answer);
    vector<string> found = normalize_lines(output);

    size_t lines = max(expected.size(), found.size());
    for (size_t i = 0; i < lines; ++i) {
        if (i >= found.size())
            return {verdict::WRONG_ANSWER, fmt::format("line {}: expected {}, found end of output", i + 1, quote(expected[i]))};
        if (i >= expected.size())
            return {verdict::WRONG_ANSWER, fmt::format("line {}: expected end of output, found {}", i + 1, quote(found[i]))};
        if (expected[i] != found[i])
            return {verdict::WRONG_ANSWER, fmt::format("line {}: expected {}, found {}", i + 1, quote(expected[i]), quote(found[i]))};
    }
    return {verdict::ACCEPTED, fmt::format("{} lines matched", expected.size())};
}

check_result float_checker::check(const string &, const string &output, const string &answer, const fs::path &) const {
    vector<string> expected = split_whitespace(answer);
    vector<string> found = split_whitespace(output);

    if (expected.size() != found.size())
        return {verdict::WRONG_ANSWER, fmt::format("token count differs: expected {} tokens, found {}", expected.size(), found.size())};

    for (size_t i = 0; i < expected.size(); ++i) {
        auto expected_value = parse_number(expected[i]);
        auto found_value = parse_number(found[i]);
        if (expected_value && found_value) {
            double diff = fabs(*expected_value - *found_value);
            if (diff > abs_tolerance)
                return {verdict::WRONG_ANSWER, fmt::format("token {}: expected {}, found {}, difference {:g} exceeds {:g}",
                                                           i + 1, expected[i], found[i], diff, abs_tolerance)};
        } else if (expected[i] != found[i]) {
            return {verdict::WRONG_ANSWER, fmt::format("token {}: expected {}, found {}", i + 1, quote(expected[i]), quote(found[i]))};
        }
    }
    return {verdict::ACCEPTED, fmt::format("{} tokens matched", expected.size())};
}

check_result special_judge_checker::check(const string &input, const string &output, const string &answer, const fs::path &run_dir) const {
    fs::path input_path = run_dir / "input.txt";
    fs::path output_path = run_dir / "output.txt";
    fs::path answer_path = run_dir / "answer.txt";
    write_file_content(input_path, input);
    write_file_content(output_path, output);
    write_file_content(answer_path, answer);

    execution_result result;
    try {
        result = limiter->run({executable.string(), input_path.string(), output_path.string(), answer_path.string()},
                              "", limits, run_dir, "checker");
    } catch (spawn_error &e) {
        LOG(ERROR) << "Unable to start special judge " << executable << ": " << e.what();
        return {verdict::JUDGE_ERROR, fmt::format("Judge error: special judge could not be started: {}", e.what())};
    }

    if (result.timed_out)
        return {verdict::JUDGE_ERROR, fmt::format("Judge error: special judge exceeded time limit of {} ms", limits.time_limit_ms)};
    if (result.memory_exceeded)
        return {verdict::JUDGE_ERROR, fmt::format("Judge error: special judge exceeded memory limit of {} MB", limits.memory_limit_mb)};
    if (result.signal != 0)
        return {verdict::JUDGE_ERROR, fmt::format("Judge error: special judge killed by signal {} ({})", result.signal, strsignal(result.signal))};

    // testlib 的 quitf 将消息写入 stderr
    string message = boost::trim_copy(result.error_output);
    if (message.empty()) message = boost::trim_copy(truncate_text(result.output, limits.diagnostic_limit));

    switch (result.exit_code) {
        case 0:
            return {verdict::ACCEPTED, message.empty() ? "Answer accepted by special judge" : message};
        case 1:
            return {verdict::WRONG_ANSWER, message.empty() ? "Wrong answer (no details from special judge)" : message};
        case 2:
            return {verdict::PRESENTATION_ERROR, message.empty() ? "Presentation error (no details from special judge)" : message};
        default:
            return {verdict::JUDGE_ERROR, message.empty() ? fmt::format("Judge error: special judge returned code {}", result.exit_code) : message};
    }
}

check_result check(const checker &c, const string &input, const string &output, const string &answer, const fs::path &run_dir) {
    return visit([&](auto &&impl) { return impl.check(input, output, answer, run_dir); }, c);
}

const char *get_checker_name(const checker &c) {
    return visit(overloaded{
                     [](const diff_checker &) { return "diff"; },
                     [](const float_checker &) { return "float"; },
                     [](const special_judge_checker &) { return "spj"; }},
                 c);
}

}  // namespace pocketjudge
