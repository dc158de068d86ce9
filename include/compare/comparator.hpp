#pragma once

#include <nlohmann/json.hpp>

namespace assessor {

/**
 * @brief 判断选手程序的返回值与期望输出是否相等
 * 按顺序应用以下规则，第一个匹配的规则决定结果：
 * 1. 两者都是基本类型且完全相等
 * 2. expected 为字符串、actual 为数组：尝试将 expected 解析为 JSON 后递归比较，
 *    解析失败则比较 actual 的紧凑序列化结果与原始字符串
 * 3. actual 为字符串、expected 为数组：与规则 2 对称
 * 4. 两者都是数组：长度相同且逐个元素递归相等
 * 5. 两者都是数字：差的绝对值小于 NUMERIC_TOLERANCE
 * 6. 两者都是字符串：去掉首尾空白并忽略大小写后相等
 * 7. 否则比较两者的规范序列化结果，序列化失败视为不相等
 * 
 * 出题人经常把数组形式的答案写成字符串，比较器需要弥合这种表示上的差异，
 * 但不能宽松到让错误答案通过。
 * @note 该函数不会抛出异常
 */
bool outputs_equal(const nlohmann::json &actual, const nlohmann::json &expected) noexcept;

}  // namespace assessor
