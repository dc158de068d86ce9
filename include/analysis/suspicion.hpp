#pragma once

#include <string>
#include "analysis/heuristics.hpp"
#include "model/report.hpp"

namespace assessor {

/**
 * @brief 检查代码中可能是复制粘贴或者 AI 生成的迹象
 * 结果只作为参考，不影响测试点是否通过。每条命中的规则记录一条说明，
 * 注释行（Python 为 #，其他语言为 // 与 /*）占总行数的比例过高时额外记录一条说明。
 */
suspicion_signals detect_suspicious_activity(const std::string &source, language lang,
                                             const heuristics &table = heuristics::defaults());

}  // namespace assessor
