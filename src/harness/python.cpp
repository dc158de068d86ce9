#include "harness/python.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/range/adaptor/transformed.hpp>

namespace assessor {
using namespace std;

// 驱动程序的代码都放在函数里，并使用 _assessor_ 前缀，避免和选手代码的全局名称冲突
static const char *prologue = R"(


def _assessor_main():
    import json as _assessor_json
    import time as _assessor_time
)";

// allow_nan=False 使得 NaN、Infinity 这类不是合法 JSON 的返回值也能被报告为错误
static const char *epilogue = R"(    try:
        _assessor_line = _assessor_json.dumps(_assessor_record, allow_nan=False)
    except (TypeError, ValueError) as e:
        _assessor_line = _assessor_json.dumps({"success": False, "error": "Result is not serializable: " + str(e), "executionTime": 0})
    print(_assessor_line, flush=True)


_assessor_main()
)";

static const char *failure_branch = R"(    except Exception as e:
        _assessor_record = {"success": False, "error": str(e), "executionTime": 0}
)";

// 与 JavaScript 的 Array.prototype.join 对单个元素的写法一致
static const char *join_item_helper = R"(
    def _assessor_join_item(v):
        if v is None:
            return ""
        if isinstance(v, bool):
            return "true" if v else "false"
        if isinstance(v, float) and v.is_integer():
            return str(int(v))
        return str(v)
)";

static string join_args(const vector<long long> &args) {
    using boost::adaptors::transformed;
    return boost::algorithm::join(args | transformed([](long long v) { return std::to_string(v); }), ", ");
}

string to_python_string_literal(const string &text) {
    string literal = "\"";
    for (char c : text) {
        switch (c) {
            case '\\': literal += "\\\\"; break;
            case '"': literal += "\\\""; break;
            case '\n': literal += "\\n"; break;
            case '\r': literal += "\\r"; break;
            case '\t': literal += "\\t"; break;
            default: literal += c; break;
        }
    }
    literal += "\"";
    return literal;
}

language python_harness::lang() const {
    return language::python;
}

string python_harness::build_function_call(const string &candidate_source, const string &entry_point_name, const string &args_json) const {
    string code = candidate_source;
    code += prologue;
    code += fmt::format(R"(    try:
        _assessor_args = _assessor_json.loads({})
        _assessor_start = _assessor_time.perf_counter()
        _assessor_output = {}(*_assessor_args)
        _assessor_elapsed = (_assessor_time.perf_counter() - _assessor_start) * 1000
        _assessor_record = {{"success": True, "output": _assessor_output, "executionTime": _assessor_elapsed}}
)",
                        to_python_string_literal(args_json), entry_point_name);
    code += failure_branch;
    code += epilogue;
    return code;
}

string python_harness::build_replay(const string &candidate_source, const replay_plan &plan) const {
    string calls;
    for (auto &call : plan.calls) {
        string invocation = fmt::format("_assessor_instance.{}({})", call.method, join_args(call.args));
        if (call.kind == call_kind::query)
            calls += fmt::format("        _assessor_results.append({})\n", invocation);
        else
            calls += fmt::format("        {}\n", invocation);
    }

    string output;
    switch (plan.shape) {
        case output_shape::joined: output = "\", \".join(_assessor_join_item(v) for v in _assessor_results)"; break;
        case output_shape::single: output = "_assessor_results[0]"; break;
        case output_shape::sequence: output = "_assessor_results"; break;
    }

    string code = candidate_source;
    code += prologue;
    if (plan.shape == output_shape::joined)
        code += join_item_helper;
    code += fmt::format(R"(    try:
        _assessor_start = _assessor_time.perf_counter()
        _assessor_instance = {}({})
        _assessor_results = []
{}        _assessor_elapsed = (_assessor_time.perf_counter() - _assessor_start) * 1000
        _assessor_record = {{"success": True, "output": {}, "executionTime": _assessor_elapsed}}
)",
                        plan.class_name, join_args(plan.constructor_args), calls, output);
    code += failure_branch;
    code += epilogue;
    return code;
}

}  // namespace assessor
