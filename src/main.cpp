#include <glog/logging.h>
#include <signal.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <algorithm>
#include <atomic>
#include <iostream>
#include <iterator>
#include <mutex>
#include <optional>
#include <thread>
#include "analysis/heuristics.hpp"
#include "common/concurrent_queue.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "evaluator.hpp"
using namespace std;

static assessor::cancellation_token cancellation;

void terminationHandler(int /* signum */) {
    // 正在运行的子进程会在下一次轮询时被杀死，剩余的测试点记为 CANCELLED
    cancellation.cancel();
}

/**
 * @brief 按输入顺序输出评测报告
 * 工作线程完成评测的顺序是不确定的，先完成的报告需要等待前面的报告输出后才能输出
 */
struct ordered_printer {
    explicit ordered_printer(size_t count) : lines(count) {}

    void put(size_t index, string line) {
        lock_guard<mutex> guard(mut);
        lines[index] = move(line);
        while (next < lines.size() && lines[next]) {
            cout << *lines[next] << endl;
            lines[next].reset();
            ++next;
        }
    }

private:
    mutex mut;
    vector<optional<string>> lines;
    size_t next = 0;
};

static string error_document(const string &source, const string &message, int indent) {
    nlohmann::json j = {{"submission", source}, {"error", message}};
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    signal(SIGINT, terminationHandler);
    signal(SIGTERM, terminationHandler);

    namespace po = boost::program_options;
    po::options_description desc("code-assessor options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("scratch-dir", po::value<string>(), "set the directory to store generated harness programs, default to $TMPDIR/code-assessor. You can either pass it from environ SCRATCHDIR")
        ("node", po::value<string>(), "set the JavaScript interpreter command, default to node. You can either pass it from environ NODE")
        ("python", po::value<string>(), "set the Python interpreter command, default to python3. You can either pass it from environ PYTHON")
        ("time-limit", po::value<int>(), "set the default time limit in milliseconds for each test case, default to 5000. You can either pass it from environ TIMELIMIT")
        ("output-limit", po::value<size_t>(), "set the maximum bytes of captured output for each test case, default to 1048576(1MB). You can either pass it from environ OUTPUTLIMIT")
        ("heuristics", po::value<string>(), "load static analysis rules from given JSON file. You can either pass it from environ HEURISTICS")
        ("workers", po::value<unsigned>()->default_value(1), "set the number of submissions evaluated concurrently")
        ("pretty", "indent the report documents")
        ("debug", "turn on the debug mode to keep scratch directories and harness programs for inspection. You can either pass it from environ DEBUG")
        ("submission", po::value<vector<string>>(), "submission documents to evaluate, - for stdin")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("submission", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "code-assessor: Evaluate candidate submissions against their test cases" << endl
             << "Usage: " << argv[0] << " [options] <submission.json>..." << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "code-assessor 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug")) {
        assessor::DEBUG = true;
    } else if (getenv("DEBUG")) {
        assessor::DEBUG = true;
    }

    if (vm.count("scratch-dir")) {
        assessor::SCRATCH_DIR = filesystem::path(vm.at("scratch-dir").as<string>());
    } else if (getenv("SCRATCHDIR")) {
        assessor::SCRATCH_DIR = filesystem::path(getenv("SCRATCHDIR"));
    } else {
        assessor::SCRATCH_DIR = filesystem::path(assessor::get_env("TMPDIR", "/tmp")) / "code-assessor";
    }
    error_code ec;
    filesystem::create_directories(assessor::SCRATCH_DIR, ec);
    CHECK(filesystem::is_directory(assessor::SCRATCH_DIR))
        << "Scratch directory " << assessor::SCRATCH_DIR << " does not exist and cannot be created: " << ec.message();

    if (vm.count("node")) {
        assessor::NODE_COMMAND = vm.at("node").as<string>();
    } else if (getenv("NODE")) {
        assessor::NODE_COMMAND = getenv("NODE");
    }

    if (vm.count("python")) {
        assessor::PYTHON_COMMAND = vm.at("python").as<string>();
    } else if (getenv("PYTHON")) {
        assessor::PYTHON_COMMAND = getenv("PYTHON");
    }

    try {
        if (vm.count("time-limit")) {
            assessor::DEFAULT_TIME_LIMIT_MS = vm["time-limit"].as<int>();
        } else if (getenv("TIMELIMIT")) {
            assessor::DEFAULT_TIME_LIMIT_MS = boost::lexical_cast<int>(getenv("TIMELIMIT"));
        }

        if (vm.count("output-limit")) {
            assessor::OUTPUT_LIMIT_BYTES = vm["output-limit"].as<size_t>();
        } else if (getenv("OUTPUTLIMIT")) {
            assessor::OUTPUT_LIMIT_BYTES = boost::lexical_cast<size_t>(getenv("OUTPUTLIMIT"));
        }
    } catch (boost::bad_lexical_cast& e) {
        cerr << "Invalid numeric value in environment: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    if (assessor::DEFAULT_TIME_LIMIT_MS <= 0) {
        cerr << "Time limit must be positive" << endl;
        return EXIT_FAILURE;
    }

    unsigned workers = vm["workers"].as<unsigned>();
    if (workers == 0) {
        cerr << "At least one worker is required" << endl;
        return EXIT_FAILURE;
    }

    assessor::heuristics table = assessor::heuristics::defaults();
    string heuristics_file;
    if (vm.count("heuristics")) {
        heuristics_file = vm.at("heuristics").as<string>();
    } else if (getenv("HEURISTICS")) {
        heuristics_file = getenv("HEURISTICS");
    }
    if (!heuristics_file.empty()) {
        try {
            table = assessor::load_heuristics(heuristics_file);
        } catch (std::exception& e) {
            cerr << "Unable to load heuristics file " << heuristics_file << ": " << e.what() << endl;
            return EXIT_FAILURE;
        }
    }

    if (!vm.count("submission")) {
        cerr << "No submission document given" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }
    vector<string> sources = vm.at("submission").as<vector<string>>();
    int indent = vm.count("pretty") ? 4 : -1;

    atomic<bool> failed{false};
    ordered_printer printer(sources.size());

    // 先在主线程中加载所有提交，格式错误的提交直接输出错误信息
    vector<optional<assessor::code_submission>> submissions(sources.size());
    assessor::concurrent_queue<size_t> queue;
    for (size_t i = 0; i < sources.size(); ++i) {
        try {
            string content;
            if (sources[i] == "-")
                content.assign(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
            else
                content = assessor::read_file_content(sources[i]);
            submissions[i] = nlohmann::json::parse(content).get<assessor::code_submission>();
            queue.push(i);
        } catch (std::exception& e) {
            LOG(ERROR) << "Submission " << sources[i] << " is malformed: " << e.what();
            printer.put(i, error_document(sources[i], e.what(), indent));
            failed = true;
        }
    }
    queue.close();

    assessor::harness_registry registry = assessor::harness_registry::with_defaults();
    assessor::posix_process_launcher launcher;
    assessor::evaluator judge(registry, launcher, move(table));

    vector<thread> worker_threads;
    for (unsigned w = 0; w < min<size_t>(workers, sources.size()); ++w) {
        worker_threads.emplace_back([&] {
            while (auto index = queue.pop()) {
                try {
                    assessor::submission_report report = judge.evaluate(*submissions[*index], cancellation);
                    nlohmann::json j = report;
                    printer.put(*index, j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace));
                } catch (assessor::workspace_error& e) {
                    LOG(ERROR) << "Unable to evaluate " << sources[*index] << ": " << e.what();
                    printer.put(*index, error_document(sources[*index], e.what(), indent));
                    failed = true;
                } catch (std::exception& e) {
                    LOG(ERROR) << "Unexpected error while evaluating " << sources[*index] << ": " << e.what();
                    printer.put(*index, error_document(sources[*index], e.what(), indent));
                    failed = true;
                }
            }
        });
    }

    for (auto& th : worker_threads)
        th.join();

    return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}
