#pragma once

#include <filesystem>
#include <map>
#include "analysis/heuristics.hpp"
#include "config.hpp"
#include "common/cancellation.hpp"
#include "harness/generator.hpp"
#include "model/report.hpp"
#include "model/submission.hpp"
#include "runner/process.hpp"
#include "runner/runner.hpp"

namespace assessor {

/**
 * @brief 评测一次提交
 * 
 * 按输入顺序逐个评测测试点：生成驱动程序、运行驱动程序、比较返回值。
 * 任何一个测试点的失败（驱动程序生成失败、运行时错误、超时、输出格式错误）
 * 都只记录为该测试点的失败结论，不影响其余测试点的评测。
 * 所有测试点评测完成后对选手代码做一次静态分析。
 * 
 * evaluator 本身不保存评测状态，可以在多个线程中同时调用 evaluate。
 */
struct evaluator {
    /**
     * @param registry 驱动程序生成器表，生命周期必须长于 evaluator
     * @param launcher 进程启动器，生命周期必须长于 evaluator
     * @param table 静态分析规则表
     * @param scratch_root 存放临时文件夹的根目录
     */
    evaluator(const harness_registry &registry, process_launcher &launcher,
              heuristics table = heuristics::defaults(), std::filesystem::path scratch_root = SCRATCH_DIR);

    /**
     * @brief 覆盖语言使用的解释器
     */
    void set_interpreter(language lang, interpreter interp);

    /**
     * @brief 评测一次提交
     * @param submit 选手提交
     * @param token 取消标记，被取消后当前和剩余的测试点均记为 CANCELLED
     * @return 评测报告，测试点结论的顺序与输入顺序一致
     * @throw workspace_error 若无法创建本次评测的临时文件夹
     */
    submission_report evaluate(const code_submission &submit, const cancellation_token &token) const;

private:
    const harness_registry &registry;
    process_launcher &launcher;
    heuristics table;
    std::filesystem::path scratch_root;
    std::map<language, interpreter> interpreters;

    execution_outcome execute(const process_runner &runner, const harness_generator &generator,
                              const code_submission &submit, const test_case &testcase,
                              const cancellation_token &token) const;
};

/**
 * @brief 根据运行结果得出测试点结论
 * 运行失败的测试点一定不通过；运行成功时由比较器判断返回值是否与期望输出一致
 */
test_case_verdict judge_outcome(const test_case &testcase, execution_outcome outcome);

}  // namespace assessor
