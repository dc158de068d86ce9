#pragma once

#include <string>

namespace assessor {

/**
 * @brief 表示一次执行或者一个测试点的评测结果
 */
enum class status {
    /**
     * @brief 测试点通过
     * 对于 execution_outcome，表示驱动程序正常运行并给出了返回值，
     * 返回值是否正确需要交给比较器判断。
     */
    ACCEPTED = 0,

    /**
     * @brief 选手程序正常运行，但返回值与期望输出不一致
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 选手程序出现运行时错误
     * 包括被驱动程序捕获的异常、非零返回值以及因为信号崩溃。
     */
    RUNTIME_ERROR = 2,

    /**
     * @brief 选手程序运行时间超出限制，进程组已被强制终止
     */
    TIME_LIMIT_EXCEEDED = 3,

    /**
     * @brief 选手程序输出内容过多，进程组已被强制终止
     */
    OUTPUT_LIMIT_EXCEEDED = 4,

    /**
     * @brief 进程正常退出，但是标准输出的最后一行无法解析为结果记录
     */
    MALFORMED_OUTPUT = 5,

    /**
     * @brief 无法为该测试点生成驱动程序
     * 比如状态类题目的调用序列中找不到构造调用。
     */
    HARNESS_ERROR = 6,

    /**
     * @brief 内部错误
     * 比如解释器无法启动、临时文件无法写入。
     */
    SYSTEM_ERROR = 7,

    /**
     * @brief 该语言尚未支持执行
     */
    NOT_IMPLEMENTED = 8,

    /**
     * @brief 评测被调用方取消
     */
    CANCELLED = 9
};

const char *get_display_message(status);

/**
 * @brief 状态的机器可读名称，比如 TIME_LIMIT_EXCEEDED
 */
const char *get_status_name(status);

}  // namespace assessor
