#include "compare/comparator.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <cmath>
#include <exception>
#include "config.hpp"

namespace assessor {
using namespace std;
using json = nlohmann::json;

static bool is_primitive_value(const json &value) {
    return value.is_null() || value.is_boolean() || value.is_number() || value.is_string();
}

static bool same_primitive(const json &actual, const json &expected) {
    if (!is_primitive_value(actual) || !is_primitive_value(expected)) return false;
    return actual == expected;
}

static string compact(const json &value) {
    return value.dump();
}

/**
 * @brief 比较序列和以字符串表示的序列
 * @param sequence 数组
 * @param text 可能是序列化后的数组的字符串
 */
static bool compare_sequence_with_text(const json &sequence, const string &text, bool sequence_is_actual) {
    json parsed = json::parse(text, nullptr, /* allow_exceptions */ false);
    if (parsed.is_discarded())
        return compact(sequence) == text;
    return sequence_is_actual ? outputs_equal(sequence, parsed) : outputs_equal(parsed, sequence);
}

static bool compare_impl(const json &actual, const json &expected) {
    if (same_primitive(actual, expected))
        return true;

    if (expected.is_string() && actual.is_array())
        return compare_sequence_with_text(actual, expected.get_ref<const string &>(), true);

    if (actual.is_string() && expected.is_array())
        return compare_sequence_with_text(expected, actual.get_ref<const string &>(), false);

    if (actual.is_array() && expected.is_array()) {
        if (actual.size() != expected.size())
            return false;
        for (size_t i = 0; i < actual.size(); ++i)
            if (!outputs_equal(actual[i], expected[i]))
                return false;
        return true;
    }

    if (actual.is_number() && expected.is_number())
        return fabs(actual.get<double>() - expected.get<double>()) < NUMERIC_TOLERANCE;

    if (actual.is_string() && expected.is_string()) {
        string a = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(actual.get<string>()));
        string b = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(expected.get<string>()));
        return a == b;
    }

    // 对象的键在 nlohmann::json 中是有序的，因此 dump 的结果就是规范形式
    return compact(actual) == compact(expected);
}

bool outputs_equal(const json &actual, const json &expected) noexcept {
    try {
        return compare_impl(actual, expected);
    } catch (exception &ex) {
        // 比如字符串中包含非法 UTF-8 时 dump 会失败
        VLOG(1) << "Comparison treated as mismatch: " << ex.what();
        return false;
    }
}

}  // namespace assessor
