#include "analysis/suspicion.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace assessor {
using namespace std;

static bool is_comment_line(const string &line, language lang) {
    string trimmed = boost::algorithm::trim_copy(line);
    if (lang == language::python)
        return boost::starts_with(trimmed, "#");
    return boost::starts_with(trimmed, "//") || boost::starts_with(trimmed, "/*");
}

suspicion_signals detect_suspicious_activity(const string &source, language lang, const heuristics &table) {
    suspicion_signals suspicion;

    for (auto &rule : table.suspicion) {
        bool matched;
        try {
            matched = boost::regex_search(source, rule.pattern.expr);
        } catch (std::runtime_error &ex) {
            // 无法完成匹配的规则不设置标记，只记录下来
            LOG(WARNING) << "Suspicion pattern " << rule.pattern.source << " skipped: " << ex.what();
            suspicion.noted_patterns.insert("Pattern check skipped: " + rule.note);
            continue;
        }
        if (!matched) continue;
        switch (rule.signal) {
            case suspicion_kind::copy_paste:
                suspicion.possible_copy_paste = true;
                break;
            case suspicion_kind::ai_assistance:
                suspicion.possible_ai_assistance = true;
                break;
        }
        suspicion.noted_patterns.insert(rule.note);
    }

    vector<string> lines;
    boost::split(lines, source, boost::is_any_of("\n"));
    size_t comments = count_if(lines.begin(), lines.end(), [lang](const string &line) {
        return is_comment_line(line, lang);
    });
    if ((double)comments / lines.size() > table.comment_ratio_threshold)
        suspicion.noted_patterns.insert("Unusually high comment ratio");

    return suspicion;
}

}  // namespace assessor
