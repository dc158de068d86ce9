#pragma once

#include <filesystem>
#include <map>
#include <boost/regex.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "model/submission.hpp"

namespace assessor {

/**
 * @brief 编译好的正则表达式，同时保留原始文本以便输出和调试
 * 使用 Perl 语法，"." 不匹配换行
 */
struct heuristic_pattern {
    std::string source;
    boost::regex expr;

    /**
     * @throw boost::regex_error 若正则表达式不合法
     */
    explicit heuristic_pattern(const std::string &source, bool ignore_case = false);
};

/**
 * @brief 良好实践检查：代码匹配 pattern 时记录 note
 */
struct practice_rule {
    heuristic_pattern pattern;
    std::string note;
};

enum class suspicion_kind { copy_paste, ai_assistance };

NLOHMANN_JSON_SERIALIZE_ENUM(suspicion_kind, {
    {suspicion_kind::copy_paste, "copy_paste"},
    {suspicion_kind::ai_assistance, "ai_assistance"},
})

/**
 * @brief 可疑行为检查：代码匹配 pattern 时设置 signal 对应的标记并记录 note
 * 匹配不区分大小写
 */
struct suspicion_rule {
    heuristic_pattern pattern;
    suspicion_kind signal;
    std::string note;
};

/**
 * @brief 静态分析使用的规则表
 * 规则是数据而不是代码，可以通过 JSON 文件整体替换某一部分：
 * @code{.json}
 * {
 *     "complexity": { "javascript": ["for\\s*\\(", "while\\s*\\("] },
 *     "practices": { "javascript": [ {"pattern": "=>", "note": "Uses arrow functions"} ] },
 *     "suspicion": [ {"pattern": "leetcode", "signal": "copy_paste", "note": "Coding platform reference"} ]
 * }
 * @endcode
 */
struct heuristics {
    /**
     * @brief 每种语言的复杂度指标，每次匹配复杂度分数加一
     */
    std::map<language, std::vector<heuristic_pattern>> complexity;

    std::map<language, std::vector<practice_rule>> practices;

    std::vector<suspicion_rule> suspicion;

    /**
     * @brief 注释行比例超过该值时记录 "Unusually high comment ratio"
     */
    double comment_ratio_threshold = 0.3;

    /**
     * @brief 内置的默认规则表
     */
    static const heuristics &defaults();
};

/**
 * @brief 从 JSON 文件加载规则表，文件中没有的部分使用默认规则
 * @throw std::invalid_argument 若文件格式错误或者正则表达式不合法
 * @throw internal_error 若文件无法读取
 */
heuristics load_heuristics(const std::filesystem::path &path);

/**
 * @brief 从 JSON 文档加载规则表，文档中没有的部分使用默认规则
 */
heuristics parse_heuristics(const nlohmann::json &document);

}  // namespace assessor
