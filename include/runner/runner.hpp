#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include "common/cancellation.hpp"
#include "model/report.hpp"
#include "model/submission.hpp"
#include "runner/process.hpp"

namespace assessor {

/**
 * @brief 语言对应的解释器
 */
struct interpreter {
    /**
     * @brief 解释器命令，可以带参数，驱动程序路径作为最后一个参数传入
     */
    std::string command;

    /**
     * @brief 驱动程序文件的扩展名，比如 ".js"
     */
    std::string extension;

    /**
     * @brief 限制解释器堆大小的命令行参数格式，{} 替换为 MB 数
     * 为空时通过 RLIMIT_AS 限制地址空间。V8 启动时会预留大量虚拟地址空间，
     * 不能使用 RLIMIT_AS，因此 node 使用 "--max-old-space-size={}"
     */
    std::string memory_flag;
};

/**
 * @brief 运行驱动程序并把运行结果转换为 execution_outcome
 * 
 * 每次运行都会在 scratch_dir 中写入一个随机命名的驱动程序文件，
 * 进程结束后（无论是正常结束、超时、被取消还是无法启动）立即删除。
 * run 不会抛出异常，所有错误都表示为失败的 execution_outcome。
 */
struct process_runner {
    /**
     * @param launcher 进程启动器，生命周期必须长于 process_runner
     * @param scratch_dir 存放驱动程序的文件夹，必须已经存在
     */
    process_runner(process_launcher &launcher, std::filesystem::path scratch_dir);

    /**
     * @brief 设置语言使用的解释器，默认使用 NODE_COMMAND 和 PYTHON_COMMAND
     */
    void set_interpreter(language lang, interpreter interp);

    /**
     * @brief 运行驱动程序
     * @param harness_source 驱动程序源代码
     * @param lang 驱动程序的语言
     * @param timeout 时钟时间上限，超时后杀死整个进程组
     * @param token 取消标记，被取消时同样杀死整个进程组
     * @param memory_limit_mb 地址空间上限，单位为 MB
     */
    execution_outcome run(const std::string &harness_source, language lang, std::chrono::milliseconds timeout,
                          const cancellation_token &token, std::optional<int> memory_limit_mb = std::nullopt) const;

private:
    process_launcher &launcher;
    std::filesystem::path scratch_dir;
    std::map<language, interpreter> interpreters;
};

/**
 * @brief 解析驱动程序的标准输出
 * 只解析最后一个非空行，之前的行（比如选手代码中的调试输出）被忽略
 * @param elapsed_ms 驱动程序没有给出 executionTime 时使用的运行时间
 */
execution_outcome parse_harness_output(const std::string &stdout_data, double elapsed_ms);

}  // namespace assessor
