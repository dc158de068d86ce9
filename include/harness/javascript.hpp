#pragma once

#include "harness/generator.hpp"

namespace assessor {

/**
 * @brief Node.js 驱动程序生成器
 * 参数以 JSON 字面量嵌入，结果通过 JSON.stringify 输出
 */
struct javascript_harness : public harness_generator {
    language lang() const override;

protected:
    std::string build_function_call(const std::string &candidate_source, const std::string &entry_point_name, const std::string &args_json) const override;
    std::string build_replay(const std::string &candidate_source, const replay_plan &plan) const override;
};

}  // namespace assessor
