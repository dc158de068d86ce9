#include "analysis/heuristics.hpp"
#include <stdexcept>
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace assessor {
using namespace std;
using namespace nlohmann;

heuristic_pattern::heuristic_pattern(const string &source, bool ignore_case)
    : source(source),
      expr(source, ignore_case ? boost::regex::perl | boost::regex::no_mod_s | boost::regex::icase
                               : boost::regex::perl | boost::regex::no_mod_s) {}

static vector<heuristic_pattern> c_family_complexity() {
    return {
        heuristic_pattern(R"(for\s*\()"),
        heuristic_pattern(R"(while\s*\()"),
        heuristic_pattern(R"(if\s*\()"),
        heuristic_pattern(R"(switch\s*\()"),
        heuristic_pattern(R"(function\s+\w+)"),
        heuristic_pattern(R"(=>\s*\{)"),
    };
}

static heuristics build_defaults() {
    heuristics h;
    h.complexity[language::javascript] = c_family_complexity();
    h.complexity[language::java] = c_family_complexity();
    h.complexity[language::python] = {
        heuristic_pattern(R"(\bfor\b)"),
        heuristic_pattern(R"(\bwhile\b)"),
        heuristic_pattern(R"(\b(if|elif)\b)"),
        heuristic_pattern(R"(\bdef\s+\w+)"),
        heuristic_pattern(R"(\blambda\b)"),
    };

    h.practices[language::javascript] = {
        {heuristic_pattern(R"(\b(const|let)\s)"), "Uses modern variable declarations"},
        {heuristic_pattern(R"(=>)"), "Uses arrow functions"},
        {heuristic_pattern(R"(\b(async|await)\b)"), "Uses async/await pattern"},
    };
    h.practices[language::python] = {
        {heuristic_pattern(R"(def\s+\w+\s*\([^)]*\w\s*:\s*\w|\)\s*->)"), "Uses type hints"},
        {heuristic_pattern(R"(\b[fF]["'])"), "Uses f-strings"},
        {heuristic_pattern(R"([\[{(][^\[\]\n]*\bfor\b[^\n]*\bin\b)"), "Uses comprehensions"},
    };
    h.practices[language::java] = {
        {heuristic_pattern(R"(\b[A-Z]\w*\s*<[\w\s,<>?\[\]]*>)"), "Uses generics"},
        {heuristic_pattern(R"(for\s*\([^;()]*\s:\s*[^;()]*\))"), "Uses enhanced for loop"},
    };

    h.suspicion = {
        {heuristic_pattern(R"((^|\s)(/\*|//|#)[^\n]*https?://)", true), suspicion_kind::copy_paste, "URL reference in comments"},
        {heuristic_pattern(R"(leetcode|hackerrank|codewars)", true), suspicion_kind::copy_paste, "Coding platform reference"},
        {heuristic_pattern(R"(author:|created by:)", true), suspicion_kind::copy_paste, "Attribution comment"},
        {heuristic_pattern(R"(TODO:|FIXME:)", true), suspicion_kind::copy_paste, "Leftover TODO/FIXME markers"},
        {heuristic_pattern(R"((console\.log|print)\(.*test.*\))", true), suspicion_kind::copy_paste, "Debug logging left in code"},
        {heuristic_pattern(R"(/\*\*[\s\S]*\*/)", true), suspicion_kind::ai_assistance, "Extensive documentation comment blocks"},
        {heuristic_pattern(R"(This function (calculates|computes|returns))", true), suspicion_kind::ai_assistance, "Narrating function comments"},
        {heuristic_pattern(R"(Here's (a|an) (solution|implementation))", true), suspicion_kind::ai_assistance, "Solution presentation phrasing"},
        {heuristic_pattern(R"(We can (solve|approach) this)", true), suspicion_kind::ai_assistance, "Step-by-step reasoning phrasing"},
    };
    return h;
}

const heuristics &heuristics::defaults() {
    static const heuristics instance = build_defaults();
    return instance;
}

static heuristic_pattern compile(const string &pattern, bool ignore_case) {
    try {
        return heuristic_pattern(pattern, ignore_case);
    } catch (boost::regex_error &ex) {
        throw invalid_argument("Invalid regular expression " + pattern + ": " + ex.what());
    }
}

/**
 * @brief 读取以语言名为键的对象，比如 {"javascript": [...], "python": [...]}
 */
template <typename T, typename F>
static map<language, vector<T>> parse_language_table(const json &table, const char *section, F &&parse_entry) {
    if (!table.is_object())
        throw build_invalid_argument(table, section);
    map<language, vector<T>> result;
    for (auto it = table.begin(); it != table.end(); ++it) {
        if (!it.value().is_array())
            throw build_invalid_argument(table, it.key());
        vector<T> &rules = result[parse_language(it.key())];
        for (auto &entry : it.value())
            rules.push_back(parse_entry(entry));
    }
    return result;
}

heuristics parse_heuristics(const json &document) {
    heuristics h = heuristics::defaults();
    if (!document.is_object())
        throw invalid_argument("Heuristics document must be a JSON object");

    if (exists(document, "complexity")) {
        h.complexity = parse_language_table<heuristic_pattern>(document.at("complexity"), "complexity", [](const json &entry) {
            if (!entry.is_string())
                throw build_invalid_argument(entry, "complexity");
            return compile(entry.get<string>(), false);
        });
    }

    if (exists(document, "practices")) {
        h.practices = parse_language_table<practice_rule>(document.at("practices"), "practices", [](const json &entry) {
            return practice_rule{compile(get_value<string>(entry, "pattern"), false),
                                 get_value<string>(entry, "note")};
        });
    }

    if (exists(document, "suspicion")) {
        const json &rules = document.at("suspicion");
        if (!rules.is_array())
            throw build_invalid_argument(document, "suspicion");
        h.suspicion.clear();
        for (auto &entry : rules) {
            string signal = get_value<string>(entry, "signal");
            if (signal != "copy_paste" && signal != "ai_assistance")
                throw build_invalid_argument(entry, "signal");
            h.suspicion.push_back({compile(get_value<string>(entry, "pattern"), true),
                                   json(signal).get<suspicion_kind>(),
                                   get_value<string>(entry, "note")});
        }
    }

    if (exists(document, "commentRatio"))
        h.comment_ratio_threshold = get_value<double>(document, "commentRatio");
    return h;
}

heuristics load_heuristics(const filesystem::path &path) {
    json document = json::parse(read_file_content(path), nullptr, false);
    if (document.is_discarded())
        throw invalid_argument("Heuristics file " + path.string() + " is not valid JSON");
    return parse_heuristics(document);
}

}  // namespace assessor
