#include "config.hpp"

namespace assessor {
using namespace std;

int DEFAULT_TIME_LIMIT_MS = 5000;
size_t OUTPUT_LIMIT_BYTES = 1 << 20;  // 1M
chrono::milliseconds POLL_INTERVAL(10);
string NODE_COMMAND = "node";
string PYTHON_COMMAND = "python3";
filesystem::path SCRATCH_DIR = "/tmp/code-assessor";
bool DEBUG = false;

}  // namespace assessor
