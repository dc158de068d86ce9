#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace assessor {

/**
 * @brief 数值比较的容差
 * 比较器认为两个数之差的绝对值小于该值时相等，用于容忍序列化往返造成的浮点误差
 */
constexpr double NUMERIC_TOLERANCE = 1e-9;

/**
 * @brief 未指定 timeLimit 时每个测试点的时间限制（毫秒）
 */
extern int DEFAULT_TIME_LIMIT_MS;

/**
 * @brief 捕获的 stdout 与 stderr 的总字节数上限，超出后进程组会被终止
 */
extern std::size_t OUTPUT_LIMIT_BYTES;

/**
 * @brief 等待子进程时检查超时和取消标记的间隔
 */
extern std::chrono::milliseconds POLL_INTERVAL;

/**
 * @brief JavaScript 解释器命令，可以带参数
 */
extern std::string NODE_COMMAND;

/**
 * @brief Python 解释器命令，可以带参数
 */
extern std::string PYTHON_COMMAND;

/**
 * @brief 存放临时驱动程序的根目录
 * 
 * SCRATCH_DIR
 * ├── 9f1c...  // 每次 evaluate 随机生成的 uuid 文件夹
 * │   ├── 3b7e....js  // 每个测试点的驱动程序，进程结束后立即删除
 * │   └── ...
 * └── ...
 */
extern std::filesystem::path SCRATCH_DIR;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测结束后不会删除临时文件夹和驱动程序，
 * 以便手动检查生成的驱动程序是否符合预期。
 */
extern bool DEBUG;

}  // namespace assessor
