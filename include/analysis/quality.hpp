#pragma once

#include <string>
#include "analysis/heuristics.hpp"
#include "model/report.hpp"

namespace assessor {

/**
 * @brief 静态评估代码质量，不影响测试点是否通过
 * 
 * 复杂度：统计所有复杂度指标的匹配次数，大于 10 为 high，大于 5 为 medium。
 * 可读性：非空行的平均长度大于 120 为 poor，小于 40 为 excellent。
 * 
 * @param source 选手代码
 * @param lang 选手代码的语言，决定使用哪一组规则
 * @param table 规则表
 */
quality_signals analyze_code_quality(const std::string &source, language lang,
                                     const heuristics &table = heuristics::defaults());

}  // namespace assessor
