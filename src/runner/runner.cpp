#include "runner/runner.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace assessor {
using namespace std;
using namespace nlohmann;

process_runner::process_runner(process_launcher &launcher, filesystem::path scratch_dir)
    : launcher(launcher), scratch_dir(move(scratch_dir)) {
    interpreters[language::javascript] = {NODE_COMMAND, ".js", "--max-old-space-size={}"};
    interpreters[language::python] = {PYTHON_COMMAND, ".py", ""};
}

void process_runner::set_interpreter(language lang, interpreter interp) {
    interpreters[lang] = move(interp);
}

static double to_ms(chrono::steady_clock::duration duration) {
    return chrono::duration<double, milli>(duration).count();
}

execution_outcome process_runner::run(const string &harness_source, language lang, chrono::milliseconds timeout,
                                      const cancellation_token &token, optional<int> memory_limit_mb) const {
    auto it = interpreters.find(lang);
    if (it == interpreters.end() || split_command(it->second.command).empty())
        return execution_outcome::not_implemented(lang);
    const interpreter &interp = it->second;

    filesystem::path harness_file = scratch_dir / (random_uuid() + interp.extension);
    defer {
        if (DEBUG) return;
        error_code ec;
        filesystem::remove(harness_file, ec);
        if (ec) LOG(WARNING) << "Unable to remove harness file " << harness_file << ": " << ec.message();
    };

    try {
        write_file_content(harness_file, harness_source);
    } catch (internal_error &ex) {
        LOG(WARNING) << "Unable to write harness file " << harness_file << ": " << ex;
        return execution_outcome::failure(status::SYSTEM_ERROR, ex.what());
    }

    process_request request;
    request.argv = split_command(interp.command);
    if (memory_limit_mb && *memory_limit_mb > 0) {
        if (interp.memory_flag.empty())
            request.address_space_limit = (size_t)*memory_limit_mb * 1024 * 1024;
        else
            request.argv.push_back(fmt::format(fmt::runtime(interp.memory_flag), *memory_limit_mb));
    }
    request.argv.push_back(harness_file.string());
    request.workdir = scratch_dir;
    request.output_limit = OUTPUT_LIMIT_BYTES;

    elapsed_time timer;
    unique_ptr<child_process> child;
    try {
        child = launcher.spawn(request);
    } catch (spawn_error &ex) {
        LOG(WARNING) << "Unable to start " << request.argv[0] << ": " << ex.what();
        return execution_outcome::failure(status::SYSTEM_ERROR, ex.what());
    }

    auto deadline = chrono::steady_clock::now() + timeout;
    while (true) {
        if (token.cancelled()) {
            LOG(WARNING) << "Evaluation cancelled, killing " << harness_file;
            child->kill();
            child->collect();
            return execution_outcome::failure(status::CANCELLED, "cancelled", timer.milliseconds());
        }

        auto now = chrono::steady_clock::now();
        if (now >= deadline) {
            LOG(WARNING) << "Harness " << harness_file << " timed out after " << timeout.count() << "ms, killing process group";
            child->kill();
            child->collect();
            return execution_outcome::failure(status::TIME_LIMIT_EXCEEDED, "timed out", timer.milliseconds());
        }

        auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - now) + chrono::milliseconds(1);
        if (child->wait_for(min(POLL_INTERVAL, remaining)))
            break;
    }

    process_result result = child->collect();
    double wall_ms = to_ms(result.wall_time);

    if (result.output_exceeded) {
        LOG(WARNING) << "Harness " << harness_file << " exceeded the output limit of " << request.output_limit << " bytes";
        return execution_outcome::failure(status::OUTPUT_LIMIT_EXCEEDED, "output limit exceeded", wall_ms);
    }

    if (result.exitcode == 0 && !boost::algorithm::trim_copy(result.stdout_data).empty())
        return parse_harness_output(result.stdout_data, wall_ms);

    string message = boost::algorithm::trim_copy(result.stderr_data);
    if (message.empty()) {
        if (result.signal >= 0)
            message = fmt::format("Process killed by signal {}", result.signal);
        else
            message = fmt::format("Process exited with code {}", result.exitcode);
    }
    return execution_outcome::failure(status::RUNTIME_ERROR, message, wall_ms);
}

execution_outcome parse_harness_output(const string &stdout_data, double elapsed_ms) {
    vector<string> lines;
    boost::split(lines, stdout_data, boost::is_any_of("\n"));
    auto last = find_if(lines.rbegin(), lines.rend(), [](const string &line) {
        return !boost::algorithm::trim_copy(line).empty();
    });

    json record;
    if (last != lines.rend())
        record = json::parse(*last, nullptr, false);
    if (record.is_discarded() || !record.is_object() || !record.count("success") || !record["success"].is_boolean())
        return execution_outcome::failure(status::MALFORMED_OUTPUT, "malformed output: " + stdout_data, elapsed_ms);

    double ms = get_value_def<double>(record, elapsed_ms, "executionTime");
    if (record["success"].get<bool>()) {
        return execution_outcome::success(access_optional(record, "output"), ms);
    } else {
        const json &error = access_optional(record, "error");
        string message = error.is_string() ? error.get<string>() : error.is_null() ? "Unknown error" : error.dump();
        return execution_outcome::failure(status::RUNTIME_ERROR, message, ms);
    }
}

}  // namespace assessor
