#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "model/submission.hpp"

namespace assessor {

/**
 * @brief 一次驱动程序运行的结果，由 process_runner 产生，立即交给比较器使用
 */
struct execution_outcome {
    /**
     * @brief 驱动程序是否正常运行并给出了返回值
     */
    bool succeeded = false;

    /**
     * @brief 入口函数的返回值
     * 仅在 succeeded 时有值，JavaScript 返回 undefined 时记为 null
     */
    std::optional<nlohmann::json> value;

    std::optional<std::string> error_message;

    /**
     * @brief 运行时间，单位为毫秒
     * 优先使用驱动程序自己测量的时间（不包括解释器启动时间）
     */
    double elapsed_ms = 0;

    /**
     * @brief 成功时为 ACCEPTED，失败时为失败的原因
     */
    status result = status::SYSTEM_ERROR;

    static execution_outcome success(nlohmann::json value, double elapsed_ms);
    static execution_outcome failure(status result, const std::string &message, double elapsed_ms = 0);

    /**
     * @brief 尚未支持执行的语言的确定性结果
     */
    static execution_outcome not_implemented(language lang);
};

/**
 * @brief 一个测试点的评测结论
 */
struct test_case_verdict {
    test_case testcase;
    execution_outcome outcome;
    bool passed = false;
    std::optional<nlohmann::json> actual_value;
    status result = status::SYSTEM_ERROR;
};

enum class complexity_level { low, medium, high };
enum class readability_level { poor, good, excellent };

NLOHMANN_JSON_SERIALIZE_ENUM(complexity_level, {
    {complexity_level::low, "low"},
    {complexity_level::medium, "medium"},
    {complexity_level::high, "high"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(readability_level, {
    {readability_level::poor, "poor"},
    {readability_level::good, "good"},
    {readability_level::excellent, "excellent"},
})

struct quality_signals {
    complexity_level complexity = complexity_level::low;
    int complexity_score = 0;
    readability_level readability = readability_level::good;
    std::set<std::string> noted_practices;
};

struct suspicion_signals {
    bool possible_copy_paste = false;
    bool possible_ai_assistance = false;
    std::set<std::string> noted_patterns;
};

/**
 * @brief 一次提交的最终评测报告
 * 构造完成后不再修改，是返回给调用方的值
 */
struct submission_report {
    std::vector<test_case_verdict> verdicts;
    std::size_t total_count = 0;
    std::size_t passed_count = 0;
    std::size_t failed_count = 0;
    double total_elapsed_ms = 0;
    quality_signals quality;
    suspicion_signals suspicion;

    bool all_passed() const;

    /**
     * @brief 汇总所有测试点结论，计算通过数量
     */
    static submission_report summarize(std::vector<test_case_verdict> verdicts, double total_elapsed_ms,
                                       quality_signals quality, suspicion_signals suspicion);
};

void to_json(nlohmann::json &j, const execution_outcome &outcome);
void to_json(nlohmann::json &j, const test_case_verdict &verdict);
void to_json(nlohmann::json &j, const quality_signals &quality);
void to_json(nlohmann::json &j, const suspicion_signals &suspicion);
void to_json(nlohmann::json &j, const submission_report &report);

}  // namespace assessor
