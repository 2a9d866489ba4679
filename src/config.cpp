#include "config.hpp"

namespace verifier {
using namespace std;

filesystem::path SANDBOX_DIR = filesystem::temp_directory_path() / "verifier";
bool USE_CGROUP = false;
bool REQUIRE_ISOLATION = true;
bool KEEP_SANDBOX = false;

int DEPENDENCY_VETTING_SLA_MS = 1000;
int STATIC_ANALYSIS_SLA_MS = 1500;
int TEST_EXECUTION_SLA_MS = 2000;
int CONTRACT_VALIDATION_SLA_MS = 1000;
int FINALIZATION_SLA_MS = 500;

int MAX_CONCURRENT_SANDBOXES = 2;

bool DEBUG = false;

}  // namespace verifier
