#include "model/report.hpp"
#include <algorithm>
#include <cctype>

namespace assessor {
using namespace std;
using namespace nlohmann;

execution_outcome execution_outcome::success(json value, double elapsed_ms) {
    execution_outcome outcome;
    outcome.succeeded = true;
    outcome.value = move(value);
    outcome.elapsed_ms = elapsed_ms;
    outcome.result = status::ACCEPTED;
    return outcome;
}

execution_outcome execution_outcome::failure(status result, const string &message, double elapsed_ms) {
    execution_outcome outcome;
    outcome.succeeded = false;
    outcome.error_message = message;
    outcome.elapsed_ms = elapsed_ms;
    outcome.result = result;
    return outcome;
}

execution_outcome execution_outcome::not_implemented(language lang) {
    string name = to_string(lang);
    if (!name.empty()) name[0] = toupper(name[0]);
    return failure(status::NOT_IMPLEMENTED, name + " execution not yet implemented");
}

bool submission_report::all_passed() const {
    return passed_count == total_count;
}

submission_report submission_report::summarize(vector<test_case_verdict> verdicts, double total_elapsed_ms,
                                               quality_signals quality, suspicion_signals suspicion) {
    submission_report report;
    report.total_count = verdicts.size();
    report.passed_count = count_if(verdicts.begin(), verdicts.end(),
                                   [](const test_case_verdict &v) { return v.passed; });
    report.failed_count = report.total_count - report.passed_count;
    report.verdicts = move(verdicts);
    report.total_elapsed_ms = total_elapsed_ms;
    report.quality = move(quality);
    report.suspicion = move(suspicion);
    return report;
}

void to_json(json &j, const execution_outcome &outcome) {
    j = json{{"success", outcome.succeeded},
             {"executionTime", outcome.elapsed_ms}};
    if (outcome.value) j["output"] = *outcome.value;
    if (outcome.error_message) j["error"] = *outcome.error_message;
}

void to_json(json &j, const test_case_verdict &verdict) {
    j = json{{"testCase", verdict.testcase},
             {"result", verdict.outcome},
             {"passed", verdict.passed},
             {"status", get_status_name(verdict.result)}};
    if (verdict.actual_value) j["actualOutput"] = *verdict.actual_value;
}

void to_json(json &j, const quality_signals &quality) {
    j = json{{"complexity", quality.complexity},
             {"complexityScore", quality.complexity_score},
             {"readability", quality.readability},
             {"bestPractices", quality.noted_practices}};
}

void to_json(json &j, const suspicion_signals &suspicion) {
    j = json{{"possibleCopyPaste", suspicion.possible_copy_paste},
             {"aiAssistanceDetected", suspicion.possible_ai_assistance},
             {"unusualPatterns", suspicion.noted_patterns}};
}

void to_json(json &j, const submission_report &report) {
    j = json{{"allTestsPassed", report.all_passed()},
             {"totalTests", report.total_count},
             {"passedTests", report.passed_count},
             {"failedTests", report.failed_count},
             {"testResults", report.verdicts},
             {"overallExecutionTime", report.total_elapsed_ms},
             {"codeQuality", report.quality},
             {"suspiciousActivity", report.suspicion}};
}

}  // namespace assessor
