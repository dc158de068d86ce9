#include <filesystem>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "runner/runner.hpp"
#include "test/assertions.hpp"
#include "test/fake_launcher.hpp"

using namespace std;
using namespace assessor;
using nlohmann::json;
using ::testing::_;
using ::testing::Throw;

struct mock_launcher : public process_launcher {
    MOCK_METHOD(unique_ptr<child_process>, spawn, (const process_request &request), (override));
};

class ProcessRunnerTest : public ::testing::Test {
protected:
    filesystem::path scratch;
    test::fake_launcher launcher;
    cancellation_token token;

    void SetUp() override {
        scratch = SCRATCH_DIR / random_uuid();
        filesystem::create_directories(scratch);
    }

    void TearDown() override {
        filesystem::remove_all(scratch);
    }

    execution_outcome run(const string &source = "print(1)", chrono::milliseconds timeout = chrono::milliseconds(1000)) {
        process_runner runner(launcher, scratch);
        return runner.run(source, language::python, timeout, token);
    }

    bool scratch_is_empty() const {
        return filesystem::is_empty(scratch);
    }
};

TEST_F(ProcessRunnerTest, SuccessfulRecord) {
    launcher.responder = [](const string &) {
        return test::exited(0, "{\"success\": true, \"output\": [1, 2], \"executionTime\": 0.25}\n");
    };
    execution_outcome outcome = run("source text");

    EXPECT_TRUE(outcome.succeeded);
    EXPECT_STATUS(outcome.result, status::ACCEPTED);
    ASSERT_TRUE(outcome.value);
    EXPECT_JSON_EQ(*outcome.value, json::array({1, 2}));
    EXPECT_DOUBLE_EQ(outcome.elapsed_ms, 0.25);

    ASSERT_EQ(launcher.harness_sources.size(), 1u);
    EXPECT_EQ(launcher.harness_sources[0], "source text");
    EXPECT_EQ(filesystem::path(launcher.last_harness_file()).extension(), ".py");
    EXPECT_EQ(filesystem::path(launcher.last_harness_file()).parent_path(), scratch);
    EXPECT_EQ(launcher.requests[0].argv.front(), PYTHON_COMMAND);
    EXPECT_TRUE(scratch_is_empty());
}

TEST_F(ProcessRunnerTest, NoiseBeforeLastLineIgnored) {
    launcher.responder = [](const string &) {
        return test::exited(0, "debugging...\n{\"x\": 1}\n{\"success\": true, \"output\": \"ok\", \"executionTime\": 1}\n\n");
    };
    execution_outcome outcome = run();
    EXPECT_TRUE(outcome.succeeded);
    EXPECT_JSON_EQ(*outcome.value, json("ok"));
}

TEST_F(ProcessRunnerTest, MissingOutputIsNull) {
    launcher.responder = [](const string &) { return test::exited(0, "{\"success\": true}\n"); };
    execution_outcome outcome = run();
    EXPECT_TRUE(outcome.succeeded);
    ASSERT_TRUE(outcome.value);
    EXPECT_TRUE(outcome.value->is_null());
    EXPECT_DOUBLE_EQ(outcome.elapsed_ms, 3);  // 使用进程的运行时间
}

TEST_F(ProcessRunnerTest, CandidateException) {
    launcher.responder = [](const string &) {
        return test::exited(0, "{\"success\": false, \"error\": \"x is not defined\", \"executionTime\": 0}\n");
    };
    execution_outcome outcome = run();
    EXPECT_FALSE(outcome.succeeded);
    EXPECT_STATUS(outcome.result, status::RUNTIME_ERROR);
    EXPECT_EQ(outcome.error_message, "x is not defined");
    EXPECT_FALSE(outcome.value);
}

TEST_F(ProcessRunnerTest, MalformedOutput) {
    launcher.responder = [](const string &) { return test::exited(0, "hello\nworld\n"); };
    execution_outcome outcome = run();
    EXPECT_FALSE(outcome.succeeded);
    EXPECT_STATUS(outcome.result, status::MALFORMED_OUTPUT);
    EXPECT_EQ(outcome.error_message, "malformed output: hello\nworld\n");

    launcher.responder = [](const string &) { return test::exited(0, "{\"output\": 1}"); };
    EXPECT_STATUS(run().result, status::MALFORMED_OUTPUT);
}

TEST_F(ProcessRunnerTest, NonZeroExitUsesStderr) {
    launcher.responder = [](const string &) { return test::exited(1, "", "SyntaxError: invalid syntax\n"); };
    execution_outcome outcome = run();
    EXPECT_STATUS(outcome.result, status::RUNTIME_ERROR);
    EXPECT_EQ(outcome.error_message, "SyntaxError: invalid syntax");
}

TEST_F(ProcessRunnerTest, NonZeroExitWithoutStderr) {
    launcher.responder = [](const string &) {
        return test::exited(3, "{\"success\": true, \"output\": 1, \"executionTime\": 0}\n");
    };
    EXPECT_EQ(run().error_message, "Process exited with code 3");

    launcher.responder = [](const string &) {
        process_result result;
        result.signal = 11;
        return result;
    };
    EXPECT_EQ(run().error_message, "Process killed by signal 11");
}

TEST_F(ProcessRunnerTest, EmptyStdoutIsRuntimeError) {
    launcher.responder = [](const string &) { return test::exited(0, "  \n"); };
    execution_outcome outcome = run();
    EXPECT_STATUS(outcome.result, status::RUNTIME_ERROR);
    EXPECT_EQ(outcome.error_message, "Process exited with code 0");
}

TEST_F(ProcessRunnerTest, OutputLimitExceeded) {
    launcher.responder = [](const string &) {
        process_result result = test::exited(0, string(100, 'x'));
        result.output_exceeded = true;
        return result;
    };
    execution_outcome outcome = run();
    EXPECT_STATUS(outcome.result, status::OUTPUT_LIMIT_EXCEEDED);
    EXPECT_EQ(outcome.error_message, "output limit exceeded");
}

TEST_F(ProcessRunnerTest, TimeoutKillsProcess) {
    launcher.hangs = true;
    execution_outcome outcome = run("while True: pass", chrono::milliseconds(50));

    EXPECT_TRUE(launcher.killed);
    EXPECT_FALSE(outcome.succeeded);
    EXPECT_STATUS(outcome.result, status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(outcome.error_message, "timed out");
    EXPECT_GE(outcome.elapsed_ms, 50);
    EXPECT_TRUE(scratch_is_empty());
}

TEST_F(ProcessRunnerTest, CancellationKillsProcess) {
    launcher.hangs = true;
    token.cancel();
    execution_outcome outcome = run("while True: pass", chrono::milliseconds(10000));

    EXPECT_TRUE(launcher.killed);
    EXPECT_STATUS(outcome.result, status::CANCELLED);
    EXPECT_EQ(outcome.error_message, "cancelled");
    EXPECT_TRUE(scratch_is_empty());
}

TEST_F(ProcessRunnerTest, SpawnErrorIsSystemError) {
    mock_launcher failing;
    EXPECT_CALL(failing, spawn(_)).WillOnce(Throw(spawn_error("python3: No such file or directory")));

    process_runner runner(failing, scratch);
    execution_outcome outcome = runner.run("print(1)", language::python, chrono::milliseconds(1000), token);
    EXPECT_FALSE(outcome.succeeded);
    EXPECT_STATUS(outcome.result, status::SYSTEM_ERROR);
    EXPECT_EQ(outcome.error_message, "python3: No such file or directory");
    EXPECT_TRUE(scratch_is_empty());
}

TEST_F(ProcessRunnerTest, UnconfiguredInterpreterNotImplemented) {
    process_runner runner(launcher, scratch);
    runner.set_interpreter(language::python, {"", ".py", ""});
    execution_outcome outcome = runner.run("print(1)", language::python, chrono::milliseconds(1000), token);
    EXPECT_STATUS(outcome.result, status::NOT_IMPLEMENTED);
    EXPECT_EQ(outcome.error_message, "Python execution not yet implemented");

    outcome = runner.run("class Main {}", language::java, chrono::milliseconds(1000), token);
    EXPECT_STATUS(outcome.result, status::NOT_IMPLEMENTED);
    EXPECT_TRUE(launcher.requests.empty());
}

TEST_F(ProcessRunnerTest, MemoryLimit) {
    launcher.responder = [](const string &) { return test::exited(0, "{\"success\": true, \"output\": 1}"); };
    process_runner runner(launcher, scratch);

    runner.run("print(1)", language::python, chrono::milliseconds(1000), token, 64);
    ASSERT_TRUE(launcher.requests.back().address_space_limit);
    EXPECT_EQ(*launcher.requests.back().address_space_limit, 64u * 1024 * 1024);

    runner.run("1", language::javascript, chrono::milliseconds(1000), token, 64);
    EXPECT_FALSE(launcher.requests.back().address_space_limit);
    EXPECT_THAT(launcher.requests.back().argv, ::testing::Contains("--max-old-space-size=64"));
    EXPECT_EQ(filesystem::path(launcher.last_harness_file()).extension(), ".js");
}

TEST_F(ProcessRunnerTest, InterpreterWithArguments) {
    launcher.responder = [](const string &) { return test::exited(0, "{\"success\": true, \"output\": 1}"); };
    process_runner runner(launcher, scratch);
    runner.set_interpreter(language::javascript, {"node --stack-size=65500", ".js", ""});
    runner.run("1", language::javascript, chrono::milliseconds(1000), token);

    const vector<string> &argv = launcher.requests.back().argv;
    ASSERT_EQ(argv.size(), 3u);
    EXPECT_EQ(argv[0], "node");
    EXPECT_EQ(argv[1], "--stack-size=65500");
    EXPECT_EQ(argv[2], launcher.last_harness_file());
}
