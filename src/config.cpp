#include "ojudge/config.hpp"
#include <boost/lexical_cast.hpp>
#include <cmath>
#include <stdexcept>
#include "ojudge/common/json_utils.hpp"

namespace ojudge {
using namespace std;
using namespace nlohmann;

boost::rational<int> parse_ratio(const string &text) {
    boost::rational<int> ratio;
    try {
        if (text.find('/') != string::npos) {
            ratio = boost::lexical_cast<boost::rational<int>>(text);
        } else {
            // 小数按千分之一的精度转换成分数
            double value = boost::lexical_cast<double>(text);
            ratio = boost::rational<int>(static_cast<int>(lround(value * 1000)), 1000);
        }
    } catch (boost::bad_lexical_cast &) {
        throw invalid_argument("malformed ratio " + text);
    } catch (boost::bad_rational &) {
        throw invalid_argument("malformed ratio " + text);
    }
    if (ratio < 0 || ratio > 1)
        throw invalid_argument("ratio " + text + " is out of range [0, 1]");
    return ratio;
}

void from_json(const json &j, engine_config &config) {
    if (exists(j, "scratchDir"))
        config.scratch_dir = get_value<string>(j, "scratchDir");
    if (exists(j, "compileTimeLimit"))
        config.compile_time_limit = chrono::milliseconds(get_value<int64_t>(j, "compileTimeLimit"));
    if (exists(j, "sampleInterval"))
        config.sample_interval = chrono::milliseconds(get_value<int64_t>(j, "sampleInterval"));
    assign_optional(j, config.output_limit, "outputLimit");
    assign_optional(j, config.max_compile_output, "maxCompileOutput");
    assign_optional(j, config.max_report_size, "maxReportSize");
    assign_optional(j, config.max_source_length, "maxSourceLength");
    if (exists(j, "presentationRatio")) {
        auto &ratio = j.at("presentationRatio");
        config.presentation_ratio = parse_ratio(ratio.is_string() ? ratio.get<string>() : ratio.dump());
    }

    if (config.compile_time_limit.count() <= 0)
        throw invalid_argument("compileTimeLimit must be positive");
    if (config.sample_interval.count() <= 0)
        throw invalid_argument("sampleInterval must be positive");
}

}  // namespace ojudge
