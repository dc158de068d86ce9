#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace assessor {

/**
 * @brief 选手代码使用的编程语言
 */
enum class language {
    javascript,
    python,
    java
};

NLOHMANN_JSON_SERIALIZE_ENUM(language, {
    {language::javascript, "javascript"},
    {language::python, "python"},
    {language::java, "java"},
})

std::string to_string(language lang);

/**
 * @brief 根据名称查找语言
 * @throw std::invalid_argument 若语言名称不能识别
 */
language parse_language(const std::string &name);

/**
 * @brief 一个测试点，加载后不再修改
 */
struct test_case {
    /**
     * @brief 按顺序传给入口函数的参数
     * 对于状态类题目，input[0] 为调用序列的文本，比如
     * "new LRUCache(2); lRUCache.put(1, 1); lRUCache.get(1);"
     */
    std::vector<nlohmann::json> input;

    /**
     * @brief 期望输出
     */
    nlohmann::json expected_output;

    std::string description;

    /**
     * @brief 是否对选手隐藏
     * 只影响结果的展示，不影响评测逻辑
     */
    bool hidden = false;
};

/**
 * @brief 一次代码提交，由一次评测请求独占，评测过程中不会修改
 */
struct code_submission {
    std::string source_text;

    language lang = language::javascript;

    /**
     * @brief 入口函数名，对于状态类题目为类名
     */
    std::string entry_point_name;

    std::vector<test_case> test_cases;

    /**
     * @brief 每个测试点的时钟时间限制，单位为毫秒
     * 未指定时使用 DEFAULT_TIME_LIMIT_MS
     */
    std::optional<int> time_limit_ms;

    /**
     * @brief 子进程的地址空间限制，单位为 MB，未指定时不限制
     */
    std::optional<int> memory_limit_mb;
};

void to_json(nlohmann::json &j, const test_case &tc);
void from_json(const nlohmann::json &j, test_case &tc);

void to_json(nlohmann::json &j, const code_submission &submit);

/**
 * @brief 解析提交文档
 * @code{.json}
 * {"code": "function add(a, b) { return a + b; }", "language": "javascript",
 *  "functionName": "add", "testCases": [{"input": [2, 3], "expectedOutput": 5}],
 *  "timeLimit": 5000}
 * @endcode
 * @throw std::invalid_argument 若缺少必要字段或者字段类型不正确
 */
void from_json(const nlohmann::json &j, code_submission &submit);

}  // namespace assessor
