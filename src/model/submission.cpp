#include "model/submission.hpp"
#include <stdexcept>
#include "common/json_utils.hpp"

namespace assessor {
using namespace std;
using namespace nlohmann;

string to_string(language lang) {
    switch (lang) {
        case language::javascript: return "javascript";
        case language::python: return "python";
        case language::java: return "java";
    }
    return "unknown";
}

language parse_language(const string &name) {
    if (name == "javascript" || name == "js") return language::javascript;
    if (name == "python" || name == "py") return language::python;
    if (name == "java") return language::java;
    throw invalid_argument("Unsupported language: " + name);
}

void to_json(json &j, const test_case &tc) {
    j = json{{"input", tc.input},
             {"expectedOutput", tc.expected_output},
             {"hidden", tc.hidden}};
    if (!tc.description.empty())
        j["description"] = tc.description;
}

void from_json(const json &j, test_case &tc) {
    const json &input = access(j, "input");
    if (!input.is_array())
        throw build_invalid_argument(j, "input");
    tc.input = input.get<vector<json>>();
    // expectedOutput 可以是 null，因此只要求键存在
    if (!j.is_object() || !j.count("expectedOutput"))
        throw build_invalid_argument(j, "expectedOutput");
    tc.expected_output = j.at("expectedOutput");
    tc.description = get_value_def<string>(j, "", "description");
    tc.hidden = get_value_def<bool>(j, false, "hidden");
}

void to_json(json &j, const code_submission &submit) {
    j = json{{"code", submit.source_text},
             {"language", submit.lang},
             {"functionName", submit.entry_point_name},
             {"testCases", submit.test_cases}};
    if (submit.time_limit_ms) j["timeLimit"] = *submit.time_limit_ms;
    if (submit.memory_limit_mb) j["memoryLimit"] = *submit.memory_limit_mb;
}

void from_json(const json &j, code_submission &submit) {
    submit.source_text = get_value<string>(j, "code");
    submit.lang = parse_language(get_value<string>(j, "language"));
    submit.entry_point_name = get_value<string>(j, "functionName");

    const json &cases = access(j, "testCases");
    if (!cases.is_array())
        throw build_invalid_argument(j, "testCases");
    submit.test_cases.clear();
    for (auto &item : cases)
        submit.test_cases.push_back(item.get<test_case>());

    if (exists(j, "timeLimit")) {
        int limit = get_value<int>(j, "timeLimit");
        if (limit <= 0) throw build_invalid_argument(j, "timeLimit");
        submit.time_limit_ms = limit;
    }
    if (exists(j, "memoryLimit")) {
        int limit = get_value<int>(j, "memoryLimit");
        if (limit > 0) submit.memory_limit_mb = limit;
    }
}

}  // namespace assessor
