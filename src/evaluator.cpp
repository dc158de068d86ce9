#include "evaluator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "analysis/quality.hpp"
#include "analysis/suspicion.hpp"
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "compare/comparator.hpp"
#include "config.hpp"

namespace assessor {
using namespace std;

evaluator::evaluator(const harness_registry &registry, process_launcher &launcher, heuristics table, filesystem::path scratch_root)
    : registry(registry), launcher(launcher), table(move(table)), scratch_root(move(scratch_root)) {}

void evaluator::set_interpreter(language lang, interpreter interp) {
    interpreters[lang] = move(interp);
}

submission_report evaluator::evaluate(const code_submission &submit, const cancellation_token &token) const {
    elapsed_time timer;
    LOG(INFO) << "Evaluating " << to_string(submit.lang) << " submission " << submit.entry_point_name
              << " with " << submit.test_cases.size() << " test cases";

    filesystem::path workspace = scratch_root / random_uuid();
    error_code ec;
    filesystem::create_directories(workspace, ec);
    if (ec) throw workspace_error(fmt::format("Unable to create scratch directory {}: {}", workspace, ec.message()));
    defer {
        if (DEBUG) return;
        error_code remove_ec;
        filesystem::remove_all(workspace, remove_ec);
        if (remove_ec) LOG(WARNING) << "Unable to remove scratch directory " << workspace << ": " << remove_ec.message();
    };

    process_runner runner(launcher, workspace);
    for (auto &[lang, interp] : interpreters)
        runner.set_interpreter(lang, interp);

    const harness_generator *generator = registry.find(submit.lang);
    vector<test_case_verdict> verdicts;
    for (size_t i = 0; i < submit.test_cases.size(); ++i) {
        const test_case &testcase = submit.test_cases[i];

        execution_outcome outcome;
        if (token.cancelled())
            outcome = execution_outcome::failure(status::CANCELLED, "cancelled");
        else if (!generator)
            outcome = execution_outcome::not_implemented(submit.lang);
        else
            outcome = execute(runner, *generator, submit, testcase, token);

        verdicts.push_back(judge_outcome(testcase, move(outcome)));
        const test_case_verdict &verdict = verdicts.back();
        LOG(INFO) << "Test case #" << i + 1 << " of " << submit.entry_point_name << ": " << get_display_message(verdict.result)
                  << " (" << verdict.outcome.elapsed_ms << "ms)";
    }

    quality_signals quality = analyze_code_quality(submit.source_text, submit.lang, table);
    suspicion_signals suspicion = detect_suspicious_activity(submit.source_text, submit.lang, table);

    submission_report report = submission_report::summarize(move(verdicts), timer.milliseconds(), move(quality), move(suspicion));
    LOG(INFO) << "Evaluated " << submit.entry_point_name << ": " << report.passed_count << "/" << report.total_count
              << " passed in " << report.total_elapsed_ms << "ms";
    return report;
}

execution_outcome evaluator::execute(const process_runner &runner, const harness_generator &generator,
                                     const code_submission &submit, const test_case &testcase,
                                     const cancellation_token &token) const {
    string harness_source;
    try {
        harness_source = generator.build(submit.source_text, submit.entry_point_name, testcase);
    } catch (harness_error &ex) {
        LOG(WARNING) << "Unable to build harness for " << submit.entry_point_name << ": " << ex.what();
        return execution_outcome::failure(status::HARNESS_ERROR, ex.what());
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unexpected error while building harness for " << submit.entry_point_name << ": " << ex.what();
        return execution_outcome::failure(status::SYSTEM_ERROR, ex.what());
    }

    chrono::milliseconds timeout(submit.time_limit_ms.value_or(DEFAULT_TIME_LIMIT_MS));
    try {
        return runner.run(harness_source, submit.lang, timeout, token, submit.memory_limit_mb);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unexpected error while running " << submit.entry_point_name << ": " << ex.what();
        return execution_outcome::failure(status::SYSTEM_ERROR, ex.what());
    }
}

test_case_verdict judge_outcome(const test_case &testcase, execution_outcome outcome) {
    test_case_verdict verdict;
    verdict.testcase = testcase;
    if (outcome.succeeded) {
        nlohmann::json actual = outcome.value.value_or(nlohmann::json());
        verdict.passed = outputs_equal(actual, testcase.expected_output);
        verdict.result = verdict.passed ? status::ACCEPTED : status::WRONG_ANSWER;
        verdict.actual_value = move(actual);
    } else {
        verdict.passed = false;
        verdict.result = outcome.result;
    }
    verdict.outcome = move(outcome);
    return verdict;
}

}  // namespace assessor
