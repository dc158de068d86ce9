#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <string>
#include <stdexcept>

namespace assessor {

struct assessor_exception : std::exception {
    assessor_exception();
    explicit assessor_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const assessor_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 比如写入临时文件失败，与选手代码无关
 */
struct internal_error : public assessor_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示无法创建本次评测的隔离工作目录
 * 这是 evaluate 唯一的致命错误，不会产生部分评测报告
 */
struct workspace_error : public assessor_exception {
    workspace_error();
    explicit workspace_error(const std::string &message);
};

/**
 * @brief 表示无法启动解释器进程
 * 通常是解释器不存在或者没有执行权限，message 为操作系统给出的错误信息
 */
struct spawn_error : public assessor_exception {
    spawn_error();
    explicit spawn_error(const std::string &message);
};

/**
 * @brief 表示无法为当前测试点生成测试驱动程序
 * 比如入口函数名不合法，或者状态类题目找不到构造调用
 */
struct harness_error : public assessor_exception {
    harness_error();
    explicit harness_error(const std::string &message);
};

}  // namespace assessor
