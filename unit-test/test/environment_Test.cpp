#include "test/environment.hpp"
#include <unistd.h>
#include <glog/logging.h>
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace sandbox {
using namespace std;
namespace fs = std::filesystem;

static fs::path work_dir;

void setup_test_environment() {
    work_dir = fs::temp_directory_path() / ("code-sandbox-test-" + std::to_string(getpid()));
    fs::create_directories(work_dir);
    LOG(INFO) << "test work directory: " << work_dir;
}

void teardown_test_environment() {
    remove_directory(work_dir);
}

const fs::path &test_work_dir() {
    return work_dir;
}

sandbox_config test_config() {
    sandbox_config config;
    config.mode = container_mode::NEVER;
    config.work_dir = work_dir;
    config.timeout_seconds = 2;
    config.compile_timeout_seconds = 30;
    return config;
}

size_t count_entries(const fs::path &dir) {
    size_t count = 0;
    for (auto it = fs::directory_iterator(dir); it != fs::directory_iterator(); ++it)
        ++count;
    return count;
}

}  // namespace sandbox
