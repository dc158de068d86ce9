#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace assessor {

/**
 * @brief 启动子进程所需的信息
 */
struct process_request {
    /**
     * @brief 外部命令的路径 (argv[0]) 和参数
     */
    std::vector<std::string> argv;

    /**
     * @brief 子进程的工作路径，为空时继承父进程
     */
    std::filesystem::path workdir;

    /**
     * @brief 子进程地址空间上限，单位为字节
     */
    std::optional<std::size_t> address_space_limit;

    /**
     * @brief stdout 与 stderr 合计最多捕获多少字节，超出后 output_exceeded 为真
     */
    std::size_t output_limit = 1 << 20;
};

/**
 * @brief 子进程结束后的信息
 */
struct process_result {
    /**
     * @brief 子进程的返回值，如果因为信号崩溃而没有返回码，则为 -1
     */
    int exitcode = -1;

    /**
     * @brief 终止子进程的信号，没有则为 -1
     */
    int signal = -1;

    /**
     * @brief 输出是否超过了 output_limit
     */
    bool output_exceeded = false;

    std::string stdout_data;
    std::string stderr_data;

    /**
     * @brief 子进程从启动到结束的时钟时间
     */
    std::chrono::milliseconds wall_time{0};
};

/**
 * @brief 已启动的子进程
 * 子进程对象析构时如果子进程仍在运行，必须将其杀死并回收
 */
struct child_process {
    virtual ~child_process();

    /**
     * @brief 等待子进程结束，最多等待 timeout 时间
     * 等待期间需要持续读取子进程的输出，避免子进程因为管道写满而阻塞
     * @return 子进程是否已经结束（或者输出超过上限）
     */
    virtual bool wait_for(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief 强制终止子进程及其创建的所有进程
     * 选手程序是不可信的，可能忽略普通信号，因此必须使用不可捕获的方式终止
     */
    virtual void kill() = 0;

    /**
     * @brief 回收子进程并返回运行信息
     * 必须在 wait_for 返回 true 或者 kill 之后调用
     */
    virtual process_result collect() = 0;
};

/**
 * @brief 进程启动器
 * process_runner 通过这个接口启动解释器，测试时可以替换为不真正启动进程的实现
 */
struct process_launcher {
    virtual ~process_launcher();

    /**
     * @brief 启动子进程
     * @throw spawn_error 若子进程无法启动，message 为操作系统的错误信息
     */
    virtual std::unique_ptr<child_process> spawn(const process_request &request) = 0;
};

/**
 * @brief 基于 fork/exec 的进程启动器
 * 子进程：
 * 1. 放入独立的进程组，以便通过 kill(-pgid, SIGKILL) 杀死整个进程树
 * 2. stdin 绑定到 /dev/null，stdout 和 stderr 通过管道交给父进程
 * 3. 禁止 core dump，按需通过 RLIMIT_AS 限制地址空间
 * 4. execvp 失败时通过 CLOEXEC 管道把 errno 告知父进程
 */
struct posix_process_launcher : public process_launcher {
    std::unique_ptr<child_process> spawn(const process_request &request) override;
};

}  // namespace assessor
