#include "ojudge/common/utils.hpp"
#include <stdlib.h>
#include <boost/algorithm/string/erase.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <stdexcept>

namespace ojudge {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

string random_uuid() {
    // random_generator 不是线程安全的，每个线程持有自己的生成器
    thread_local boost::uuids::random_generator generator;
    string uuid = boost::lexical_cast<string>(generator());
    boost::algorithm::erase_all(uuid, "-");
    return uuid;
}

vector<string> expand_command(const vector<string> &templ, const map<string, string> &values) {
    vector<string> result;
    result.reserve(templ.size());
    for (const string &arg : templ) {
        string expanded;
        size_t pos = 0;
        while (pos < arg.size()) {
            size_t open = arg.find('{', pos);
            if (open == string::npos) {
                expanded.append(arg, pos, string::npos);
                break;
            }
            size_t close = arg.find('}', open);
            if (close == string::npos) {
                expanded.append(arg, pos, string::npos);
                break;
            }
            expanded.append(arg, pos, open - pos);
            string key = arg.substr(open + 1, close - open - 1);
            auto it = values.find(key);
            if (it == values.end())
                throw invalid_argument("unknown placeholder {" + key + "} in command argument " + arg);
            expanded += it->second;
            pos = close + 1;
        }
        result.push_back(move(expanded));
    }
    return result;
}

string truncate_text(const string &text, size_t limit) {
    if (text.size() <= limit) return text;
    size_t end = limit;
    // 10xxxxxx 是 UTF-8 的后续字节，回退到字符的起始位置
    while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) --end;
    return text.substr(0, end);
}

elapsed_time::elapsed_time() : start(chrono::steady_clock::now()) {}

}  // namespace ojudge
