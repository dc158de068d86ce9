#include "harness/javascript.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/range/adaptor/transformed.hpp>

namespace assessor {
using namespace std;

// 驱动程序的公共尾部：把 __record 序列化为一行输出
// 返回值无法序列化（比如 BigInt、循环引用）时也要保证输出一行记录
static const char *emit_record = R"(
  let __line;
  try {
    __line = JSON.stringify(__record);
  } catch (error) {
    __line = JSON.stringify({ success: false, error: "Result is not serializable: " + __errorMessage(error), executionTime: 0 });
  }
  process.stdout.write(__line + "\n");
})();
)";

static const char *prologue = R"(

;(() => {
  const __errorMessage = (error) => (error && error.message !== undefined ? String(error.message) : String(error));
  let __record;
)";

static string join_args(const vector<long long> &args) {
    using boost::adaptors::transformed;
    return boost::algorithm::join(args | transformed([](long long v) { return std::to_string(v); }), ", ");
}

language javascript_harness::lang() const {
    return language::javascript;
}

string javascript_harness::build_function_call(const string &candidate_source, const string &entry_point_name, const string &args_json) const {
    string code = candidate_source;
    code += prologue;
    code += fmt::format(R"(  try {{
    const __args = {};
    const __start = process.hrtime.bigint();
    const __output = {}(...__args);
    const __elapsed = Number(process.hrtime.bigint() - __start) / 1e6;
    __record = {{ success: true, output: __output, executionTime: __elapsed }};
  }} catch (error) {{
    __record = {{ success: false, error: __errorMessage(error), executionTime: 0 }};
  }}
)",
                        args_json, entry_point_name);
    code += emit_record;
    return code;
}

string javascript_harness::build_replay(const string &candidate_source, const replay_plan &plan) const {
    string calls;
    for (auto &call : plan.calls) {
        string invocation = fmt::format("__instance.{}({})", call.method, join_args(call.args));
        if (call.kind == call_kind::query)
            calls += fmt::format("    __results.push({});\n", invocation);
        else
            calls += fmt::format("    {};\n", invocation);
    }

    string output;
    switch (plan.shape) {
        case output_shape::joined: output = "__results.join(\", \")"; break;
        case output_shape::single: output = "__results[0]"; break;
        case output_shape::sequence: output = "__results"; break;
    }

    string code = candidate_source;
    code += prologue;
    code += fmt::format(R"(  try {{
    const __start = process.hrtime.bigint();
    const __instance = new {}({});
    const __results = [];
{}    const __elapsed = Number(process.hrtime.bigint() - __start) / 1e6;
    __record = {{ success: true, output: {}, executionTime: __elapsed }};
  }} catch (error) {{
    __record = {{ success: false, error: __errorMessage(error), executionTime: 0 }};
  }}
)",
                        plan.class_name, join_args(plan.constructor_args), calls, output);
    code += emit_record;
    return code;
}

}  // namespace assessor
