#include "common/stl_utils.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <cmath>

namespace pocketjudge {
using namespace std;

vector<string> split_whitespace(const string &s) {
    vector<string> tokens;
    boost::split(tokens, s, boost::is_any_of(" \t\r\n\f\v"), boost::token_compress_on);
    tokens.erase(std::remove(tokens.begin(), tokens.end(), ""), tokens.end());
    return tokens;
}

vector<string> split_lines(const string &s) {
    vector<string> lines;
    if (s.empty()) return lines;
    boost::split(lines, s, boost::is_any_of("\n"));
    if (!lines.empty() && lines.back().empty()) lines.pop_back();
    return lines;
}

bool is_integer(const string &s) {
    return !s.empty() && boost::algorithm::all(s, boost::is_digit());
}

optional<double> parse_number(const string &s) {
    try {
        double value = boost::lexical_cast<double>(s);
        if (!std::isfinite(value)) return nullopt;
        return value;
    } catch (boost::bad_lexical_cast &) {
        return nullopt;
    }
}

string truncate_text(const string &s, size_t limit) {
    if (s.size() <= limit) return s;
    return s.substr(0, limit);
}

}  // namespace pocketjudge
