#include "analysis/quality.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <stdexcept>
#include <iterator>
#include <vector>

namespace assessor {
using namespace std;

static complexity_level level_of(int score) {
    if (score > 10) return complexity_level::high;
    if (score > 5) return complexity_level::medium;
    return complexity_level::low;
}

static readability_level readability_of(const string &source) {
    vector<string> lines;
    boost::split(lines, source, boost::is_any_of("\n"));

    size_t total = 0, count = 0;
    for (auto &line : lines) {
        if (boost::algorithm::trim_copy(line).empty()) continue;
        total += line.size();
        ++count;
    }
    if (count == 0) return readability_level::good;

    double average = (double)total / count;
    if (average > 120) return readability_level::poor;
    if (average < 40) return readability_level::excellent;
    return readability_level::good;
}

// 匹配过于复杂时 Boost.Regex 抛出 std::runtime_error，该规则按未匹配处理
static int count_matches(const string &source, const heuristic_pattern &pattern) {
    try {
        boost::sregex_iterator begin(source.begin(), source.end(), pattern.expr), end;
        return (int)std::distance(begin, end);
    } catch (std::runtime_error &ex) {
        LOG(WARNING) << "Complexity pattern " << pattern.source << " skipped: " << ex.what();
        return 0;
    }
}

static bool has_match(const string &source, const heuristic_pattern &pattern) {
    try {
        return boost::regex_search(source, pattern.expr);
    } catch (std::runtime_error &ex) {
        LOG(WARNING) << "Practice pattern " << pattern.source << " skipped: " << ex.what();
        return false;
    }
}

quality_signals analyze_code_quality(const string &source, language lang, const heuristics &table) {
    quality_signals quality;

    auto complexity = table.complexity.find(lang);
    if (complexity != table.complexity.end()) {
        for (auto &pattern : complexity->second)
            quality.complexity_score += count_matches(source, pattern);
    }
    quality.complexity = level_of(quality.complexity_score);
    quality.readability = readability_of(source);

    auto practices = table.practices.find(lang);
    if (practices != table.practices.end()) {
        for (auto &rule : practices->second)
            if (has_match(source, rule.pattern))
                quality.noted_practices.insert(rule.note);
    }
    return quality;
}

}  // namespace assessor
