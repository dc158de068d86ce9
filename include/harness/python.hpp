#pragma once

#include "harness/generator.hpp"

namespace assessor {

/**
 * @brief Python 3 驱动程序生成器
 * 参数以字符串形式嵌入并通过 json.loads 解码，结果通过 json.dumps 输出
 */
struct python_harness : public harness_generator {
    language lang() const override;

protected:
    std::string build_function_call(const std::string &candidate_source, const std::string &entry_point_name, const std::string &args_json) const override;
    std::string build_replay(const std::string &candidate_source, const replay_plan &plan) const override;
};

/**
 * @brief 将文本转换为 Python 的双引号字符串字面量
 */
std::string to_python_string_literal(const std::string &text);

}  // namespace assessor
