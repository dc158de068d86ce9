#pragma once

#include <map>
#include <memory>
#include <string>
#include "harness/stateful.hpp"
#include "model/submission.hpp"

namespace assessor {

/**
 * @brief 测试驱动程序生成器
 * 驱动程序包含原样的选手代码，调用入口函数或者回放状态类调用序列，
 * 并向标准输出打印唯一一行结果记录：
 * @code{.json}
 * {"success": true, "output": 5, "executionTime": 0.012}
 * {"success": false, "error": "x is not defined", "executionTime": 0}
 * @endcode
 * 时间由驱动程序自己围绕调用测量，不包括解释器的启动时间。
 * 驱动程序是单文件、单进程、单行输出的，因此 process_runner 不需要知道语言细节。
 * 
 * 每种语言实现一个子类，新增语言只需要实现这个接口并注册到 harness_registry。
 */
struct harness_generator {
    virtual ~harness_generator();

    virtual language lang() const = 0;

    /**
     * @brief 为一个测试点生成驱动程序
     * @param candidate_source 选手代码，原样嵌入驱动程序
     * @param entry_point_name 入口函数名，对状态类题目为类名
     * @param testcase 测试点
     * @return 驱动程序源代码
     * @throw harness_error 若入口名不合法，或者状态类题目的调用序列无法解析
     */
    std::string build(const std::string &candidate_source, const std::string &entry_point_name, const test_case &testcase) const;

protected:
    /**
     * @brief 生成直接调用入口函数的驱动程序
     * @param args_json 参数数组的 JSON 文本
     */
    virtual std::string build_function_call(const std::string &candidate_source, const std::string &entry_point_name, const std::string &args_json) const = 0;

    /**
     * @brief 生成回放调用序列的驱动程序
     */
    virtual std::string build_replay(const std::string &candidate_source, const replay_plan &plan) const = 0;
};

/**
 * @brief 按语言索引的驱动程序生成器表
 */
struct harness_registry {
    void register_generator(std::unique_ptr<harness_generator> &&generator);

    /**
     * @return 语言对应的生成器，没有注册时返回 nullptr
     */
    const harness_generator *find(language lang) const;

    /**
     * @brief 包含 JavaScript 和 Python 生成器的默认生成器表
     */
    static harness_registry with_defaults();

private:
    std::map<language, std::unique_ptr<harness_generator>> generators;
};

/**
 * @brief 入口名必须是普通标识符，避免通过入口名改写驱动程序
 */
bool is_valid_identifier(const std::string &name);

}  // namespace assessor
