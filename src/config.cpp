#include "config.hpp"

namespace runner {
using namespace std;

int DEFAULT_TIMEOUT_MS = 30000;              // 30s
int DEFAULT_SUBMISSION_TIMEOUT_MS = 120000;  // 2min
int TEARDOWN_GRACE_MS = 2000;                // 2s
int DEFAULT_MAX_CONCURRENT = 1;

set<string> ALLOWED_EXTENSIONS = {".py", ".txt", ".json", ".csv", ".md", ".yaml", ".yml"};
size_t MAX_PROJECT_FILES = 64;
size_t MAX_FILE_SIZE = 1 << 20;  // 1M

filesystem::path WORK_DIR = filesystem::temp_directory_path() / "exercise-runner";
string SANDBOX_URL;
string SANDBOX_API_KEY;
string SANDBOX_TEMPLATE = "python";
string SANDBOX_WORKDIR = "/home/user";
string VERDICT_MARKER = "@@RUNNER-VERDICT";
bool DEBUG = false;

}  // namespace runner
