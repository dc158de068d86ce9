#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

/**
 * 状态类题目（比如 LRU 缓存）的调用序列解析
 * 测试点的输入不是函数参数，而是一段调用序列文本，比如：
 *     new LRUCache(2); lRUCache.put(1, 1); lRUCache.get(1);
 * 这里只支持固定的方法名 put（修改）和 get（查询），参数只支持整数。
 * 要支持任意方法名需要一个真正的调用序列语法分析器，而不是正则匹配。
 */
namespace assessor {

enum class call_kind {
    /**
     * @brief 修改对象状态的调用，返回值不记录
     */
    mutation,

    /**
     * @brief 查询调用，返回值按顺序加入结果序列
     */
    query
};

struct replay_call {
    /**
     * @brief 调用在原始文本中的字符偏移，用于恢复调用顺序
     */
    std::size_t offset;
    call_kind kind;
    std::string method;
    std::vector<long long> args;
};

/**
 * @brief 查询结果序列最终以什么形式输出
 */
enum class output_shape {
    /**
     * @brief 以 ", " 连接为字符串，期望输出为字符串（且不是 JSON 数组文本）时使用
     */
    joined,

    /**
     * @brief 原样输出为数组
     */
    sequence,

    /**
     * @brief 只有一个查询调用且期望输出为单个值时，输出该值
     */
    single
};

struct replay_plan {
    std::string class_name;
    std::vector<long long> constructor_args;

    /**
     * @brief 按 offset 升序排列的调用
     */
    std::vector<replay_call> calls;

    output_shape shape = output_shape::sequence;
};

/**
 * @brief 方法名到调用类型的对应表
 */
struct replay_method_rule {
    std::string method;
    call_kind kind;
};

const std::vector<replay_method_rule> &default_replay_rules();

/**
 * @brief 从调用序列文本中解析出回放计划
 * 1. 查找 new <class_name>(...) 构造调用并解析构造参数
 * 2. 对每个方法分别扫描所有调用，记录每个调用的字符偏移
 * 3. 按偏移排序所有调用，恢复文本中的调用顺序
 * @param text 调用序列文本
 * @param class_name 要实例化的类名，即入口函数名
 * @param expected 期望输出，用于决定查询结果的输出形式
 * @throw harness_error 若找不到构造调用，或构造参数不是整数
 */
replay_plan parse_call_sequence(const std::string &text, const std::string &class_name, const nlohmann::json &expected);

/**
 * @brief 判断是否应当按照状态类题目生成驱动程序
 * 入口名符合状态类命名习惯（LRUCache、Singleton、包含 Cache 或 Design），
 * 或者代码中声明了类而入口名不是默认的 solution
 */
bool is_stateful_problem(const std::string &entry_point_name, const std::string &source);

}  // namespace assessor
