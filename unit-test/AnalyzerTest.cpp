#include <stdexcept>
#include "analysis/heuristics.hpp"
#include "analysis/quality.hpp"
#include "analysis/suspicion.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace std;
using namespace assessor;
using nlohmann::json;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(AnalyzerTest, SimpleJavaScriptIsLowComplexity) {
    string source = "const add = (a, b) => a + b;\n";
    quality_signals quality = analyze_code_quality(source, language::javascript);
    EXPECT_EQ(quality.complexity, complexity_level::low);
    EXPECT_EQ(quality.complexity_score, 0);
    EXPECT_EQ(quality.readability, readability_level::excellent);
    EXPECT_THAT(quality.noted_practices, ElementsAre("Uses arrow functions", "Uses modern variable declarations"));
}

TEST(AnalyzerTest, ComplexityLevels) {
    string medium;
    for (int i = 0; i < 6; ++i) medium += "if (x) { y(); }\n";
    EXPECT_EQ(analyze_code_quality(medium, language::javascript).complexity_score, 6);
    EXPECT_EQ(analyze_code_quality(medium, language::javascript).complexity, complexity_level::medium);

    string high = medium;
    for (int i = 0; i < 5; ++i) high += "for (;;) {}\n";
    EXPECT_EQ(analyze_code_quality(high, language::javascript).complexity_score, 11);
    EXPECT_EQ(analyze_code_quality(high, language::javascript).complexity, complexity_level::high);

    string five;
    for (int i = 0; i < 5; ++i) five += "while (x) {}\n";
    EXPECT_EQ(analyze_code_quality(five, language::java).complexity, complexity_level::low);
}

TEST(AnalyzerTest, PythonComplexity) {
    string source =
        "def solve(nums):\n"
        "    for n in nums:\n"
        "        if n > 0:\n"
        "            pass\n"
        "        elif n < 0:\n"
        "            pass\n"
        "    while False:\n"
        "        pass\n"
        "    return sorted(nums, key=lambda v: -v)\n";
    quality_signals quality = analyze_code_quality(source, language::python);
    EXPECT_EQ(quality.complexity_score, 6);
    EXPECT_EQ(quality.complexity, complexity_level::medium);
}

TEST(AnalyzerTest, Readability) {
    EXPECT_EQ(analyze_code_quality("", language::javascript).readability, readability_level::good);
    EXPECT_EQ(analyze_code_quality("\n  \n", language::javascript).readability, readability_level::good);
    EXPECT_EQ(analyze_code_quality(string(121, 'x'), language::javascript).readability, readability_level::poor);
    EXPECT_EQ(analyze_code_quality(string(80, 'x') + "\n\n" + string(80, 'x'), language::javascript).readability, readability_level::good);
    EXPECT_EQ(analyze_code_quality("x\n", language::python).readability, readability_level::excellent);
}

TEST(AnalyzerTest, PythonAndJavaPractices) {
    string python =
        "def greet(name: str) -> str:\n"
        "    squares = [n * n for n in range(3)]\n"
        "    return f\"hi {name}\"\n";
    EXPECT_THAT(analyze_code_quality(python, language::python).noted_practices,
                ElementsAre("Uses comprehensions", "Uses f-strings", "Uses type hints"));

    string java =
        "List<Integer> values = new ArrayList<>();\n"
        "for (int v : values) { sum += v; }\n";
    EXPECT_THAT(analyze_code_quality(java, language::java).noted_practices,
                ElementsAre("Uses enhanced for loop", "Uses generics"));

    EXPECT_THAT(analyze_code_quality("def f(a):\n    return a\n", language::python).noted_practices, IsEmpty());
}

TEST(AnalyzerTest, CleanCodeIsNotSuspicious) {
    suspicion_signals suspicion = detect_suspicious_activity("function add(a, b) {\n  return a + b;\n}\n", language::javascript);
    EXPECT_FALSE(suspicion.possible_copy_paste);
    EXPECT_FALSE(suspicion.possible_ai_assistance);
    EXPECT_THAT(suspicion.noted_patterns, IsEmpty());

    EXPECT_THAT(detect_suspicious_activity("", language::python).noted_patterns, IsEmpty());
}

TEST(AnalyzerTest, CopyPasteIndicators) {
    string source =
        "// Solution from LeetCode\n"
        "function twoSum(nums, target) {\n"
        "  const seen = new Map();\n"
        "  // TODO: handle duplicates\n"
        "  for (let i = 0; i < nums.length; i++) {\n"
        "    console.log('test', i);\n"
        "    if (seen.has(target - nums[i])) return [seen.get(target - nums[i]), i];\n"
        "    seen.set(nums[i], i);\n"
        "  }\n"
        "}\n";
    suspicion_signals suspicion = detect_suspicious_activity(source, language::javascript);
    EXPECT_TRUE(suspicion.possible_copy_paste);
    EXPECT_FALSE(suspicion.possible_ai_assistance);
    EXPECT_THAT(suspicion.noted_patterns, Contains("Coding platform reference"));
    EXPECT_THAT(suspicion.noted_patterns, Contains("Leftover TODO/FIXME markers"));
    EXPECT_THAT(suspicion.noted_patterns, Contains("Debug logging left in code"));
    EXPECT_EQ(suspicion.noted_patterns.count("Unusually high comment ratio"), 0u);
}

TEST(AnalyzerTest, UrlInComment) {
    EXPECT_TRUE(detect_suspicious_activity("/* https://example.com/problem */\nx = 1\n", language::javascript).possible_copy_paste);
    EXPECT_TRUE(detect_suspicious_activity("# see http://example.com\nx = 1\n", language::python).possible_copy_paste);
    EXPECT_FALSE(detect_suspicious_activity("fetch('https://example.com')\n", language::javascript).possible_copy_paste);
}

TEST(AnalyzerTest, AiIndicators) {
    string source =
        "/**\n"
        " * This function computes the sum.\n"
        " */\n"
        "function add(a, b) { return a + b; }\n";
    suspicion_signals suspicion = detect_suspicious_activity(source, language::javascript);
    EXPECT_TRUE(suspicion.possible_ai_assistance);
    EXPECT_THAT(suspicion.noted_patterns, Contains("Extensive documentation comment blocks"));
    EXPECT_THAT(suspicion.noted_patterns, Contains("Narrating function comments"));

    EXPECT_TRUE(detect_suspicious_activity("# Here's a solution using two pointers\n", language::python).possible_ai_assistance);
    EXPECT_TRUE(detect_suspicious_activity("// we can solve this greedily\n", language::javascript).possible_ai_assistance);
}

TEST(AnalyzerTest, LargeSourcesAreScanned) {
    string doc = "/** doc\n";
    for (int i = 0; i < 20000; ++i) doc += " * line\n";
    doc += string(200000, 'a') + "\n*/\nfunction f() {}\n";

    suspicion_signals suspicion;
    ASSERT_NO_THROW(suspicion = detect_suspicious_activity(doc, language::javascript));
    EXPECT_TRUE(suspicion.possible_ai_assistance);
    EXPECT_THAT(suspicion.noted_patterns, Contains("Extensive documentation comment blocks"));

    quality_signals quality;
    ASSERT_NO_THROW(quality = analyze_code_quality(doc, language::javascript));
    EXPECT_EQ(quality.complexity_score, 1);

    string logging = "print(" + string(200000, 'x') + " test\n";
    ASSERT_NO_THROW(suspicion = detect_suspicious_activity(logging, language::python));
    EXPECT_FALSE(suspicion.possible_copy_paste);
}

TEST(AnalyzerTest, CommentRatio) {
    string js = "// one\n// two\nlet x = 1;\nlet y = 2;\n";
    EXPECT_THAT(detect_suspicious_activity(js, language::javascript).noted_patterns, Contains("Unusually high comment ratio"));

    // Python 的注释以 # 开头
    string py = "# one\n# two\nx = 1\ny = 2\n";
    EXPECT_THAT(detect_suspicious_activity(py, language::python).noted_patterns, Contains("Unusually high comment ratio"));
    EXPECT_THAT(detect_suspicious_activity(py, language::javascript).noted_patterns, IsEmpty());
}

TEST(AnalyzerTest, HeuristicsFromJson) {
    json document = {
        {"complexity", {{"javascript", {"\\brecurse\\("}}}},
        {"suspicion", {{{"pattern", "stackoverflow"}, {"signal", "copy_paste"}, {"note", "Forum reference"}}}},
        {"commentRatio", 0.9}};
    heuristics table = parse_heuristics(document);

    string source = "// StackOverflow answer\nrecurse(1); recurse(2); if (x) {}\n";
    quality_signals quality = analyze_code_quality(source, language::javascript, table);
    EXPECT_EQ(quality.complexity_score, 2);
    // 没有给出的部分使用默认规则
    EXPECT_FALSE(table.practices.empty());

    suspicion_signals suspicion = detect_suspicious_activity(source, language::javascript, table);
    EXPECT_TRUE(suspicion.possible_copy_paste);
    EXPECT_THAT(suspicion.noted_patterns, ElementsAre("Forum reference"));
    EXPECT_DOUBLE_EQ(table.comment_ratio_threshold, 0.9);
}

TEST(AnalyzerTest, HeuristicsFileErrors) {
    EXPECT_THROW(parse_heuristics(json::array()), invalid_argument);
    EXPECT_THROW(parse_heuristics({{"complexity", {{"javascript", {"("}}}}}), invalid_argument);
    EXPECT_THROW(parse_heuristics({{"complexity", {{"cobol", {"x"}}}}}), invalid_argument);
    EXPECT_THROW(parse_heuristics({{"suspicion", {{{"pattern", "x"}, {"signal", "other"}, {"note", "n"}}}}}), invalid_argument);

    filesystem::path file = SCRATCH_DIR / (random_uuid() + ".json");
    write_file_content(file, "{ not json");
    EXPECT_THROW(load_heuristics(file), invalid_argument);
    filesystem::remove(file);
}
