#include "ojudge/judge/verdict.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <cctype>
#include <cstdint>

namespace ojudge::judge {
using namespace std;

static bool is_space(char ch) {
    return isspace(static_cast<unsigned char>(ch)) != 0;
}

int verdict::score(int points) const {
    // 用 64 位计算避免溢出，整除向零取整，负数时再减一
    int64_t numerator = static_cast<int64_t>(factor.numerator()) * points;
    int64_t denominator = factor.denominator();
    int64_t value = numerator / denominator;
    if (numerator % denominator != 0 && numerator < 0) --value;
    return static_cast<int>(value);
}

string strip_trailing_whitespace(const string &text) {
    return boost::algorithm::trim_right_copy_if(text, is_space);
}

string normalize_whitespace(const string &text) {
    string result;
    result.reserve(text.size());
    bool pending_space = false;
    for (char ch : text) {
        if (is_space(ch)) {
            pending_space = !result.empty();
        } else {
            if (pending_space) result += ' ';
            pending_space = false;
            result += ch;
        }
    }
    return result;
}

verdict compare(const string &actual, const string &expected, const boost::rational<int> &pe_ratio) {
    verdict v;
    if (strip_trailing_whitespace(actual) == strip_trailing_whitespace(expected)) {
        v.result = status::ACCEPTED;
        v.factor = 1;
    } else if (normalize_whitespace(actual) == normalize_whitespace(expected)) {
        v.result = status::PRESENTATION_ERROR;
        v.factor = pe_ratio;
    } else {
        v.result = status::WRONG_ANSWER;
        v.factor = 0;
    }
    return v;
}

}  // namespace ojudge::judge
