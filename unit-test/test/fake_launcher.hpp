#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "runner/process.hpp"

namespace assessor::test {

/**
 * @brief 不启动进程的子进程，直接返回预先设定的运行结果
 * hangs 为真时模拟死循环，直到被 kill
 */
struct scripted_child : public child_process {
    scripted_child(process_result result, bool hangs, bool &killed)
        : result(std::move(result)), hangs(hangs), killed(killed) {}

    bool wait_for(std::chrono::milliseconds timeout) override {
        if (hangs && !killed) {
            std::this_thread::sleep_for(timeout);
            return false;
        }
        return true;
    }

    void kill() override {
        killed = true;
    }

    process_result collect() override {
        if (killed) {
            process_result r;
            r.signal = 9;
            return r;
        }
        return result;
    }

private:
    process_result result;
    bool hangs;
    bool &killed;
};

/**
 * @brief 记录每次启动请求的进程启动器
 * 启动时读取驱动程序文件的内容，交给 responder 计算运行结果
 */
struct fake_launcher : public process_launcher {
    std::function<process_result(const std::string &harness_source)> responder;
    bool hangs = false;

    std::vector<process_request> requests;
    std::vector<std::string> harness_sources;
    bool killed = false;

    std::unique_ptr<child_process> spawn(const process_request &request) override {
        requests.push_back(request);
        harness_sources.push_back(read_file_content(request.argv.back()));
        process_result result = responder ? responder(harness_sources.back()) : process_result();
        return std::make_unique<scripted_child>(std::move(result), hangs, killed);
    }

    std::string last_harness_file() const {
        return requests.empty() ? std::string() : requests.back().argv.back();
    }
};

/**
 * @brief 构造一个正常退出的运行结果
 */
inline process_result exited(int exitcode, const std::string &stdout_data, const std::string &stderr_data = "") {
    process_result result;
    result.exitcode = exitcode;
    result.stdout_data = stdout_data;
    result.stderr_data = stderr_data;
    result.wall_time = std::chrono::milliseconds(3);
    return result;
}

}  // namespace assessor::test
