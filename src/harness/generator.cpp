#include "harness/generator.hpp"
#include <boost/regex.hpp>
#include "common/exceptions.hpp"
#include "harness/javascript.hpp"
#include "harness/python.hpp"

namespace assessor {
using namespace std;

harness_generator::~harness_generator() {}

string harness_generator::build(const string &candidate_source, const string &entry_point_name, const test_case &testcase) const {
    if (!is_valid_identifier(entry_point_name))
        throw harness_error("Invalid entry point name: " + entry_point_name);

    if (is_stateful_problem(entry_point_name, candidate_source)) {
        string sequence;
        if (!testcase.input.empty() && testcase.input[0].is_string())
            sequence = testcase.input[0].get<string>();
        replay_plan plan = parse_call_sequence(sequence, entry_point_name, testcase.expected_output);
        return build_replay(candidate_source, plan);
    }

    // ensure_ascii 使得参数文本可以安全地嵌入任何语言的源文件
    string args_json = nlohmann::json(testcase.input).dump(-1, ' ', true, nlohmann::json::error_handler_t::replace);
    return build_function_call(candidate_source, entry_point_name, args_json);
}

void harness_registry::register_generator(unique_ptr<harness_generator> &&generator) {
    language lang = generator->lang();
    generators[lang] = move(generator);
}

const harness_generator *harness_registry::find(language lang) const {
    auto it = generators.find(lang);
    return it == generators.end() ? nullptr : it->second.get();
}

harness_registry harness_registry::with_defaults() {
    harness_registry registry;
    registry.register_generator(make_unique<javascript_harness>());
    registry.register_generator(make_unique<python_harness>());
    return registry;
}

bool is_valid_identifier(const string &name) {
    static const boost::regex identifier(R"([A-Za-z_$][A-Za-z0-9_$]*)");
    return boost::regex_match(name, identifier);
}

}  // namespace assessor
