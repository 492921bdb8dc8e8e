#include "test/environment.hpp"
#include <unistd.h>
#include <fstream>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "sandbox/sandbox.hpp"

namespace hindsight::test {
using namespace std;
namespace fs = std::filesystem;

fs::path make_test_directory(const string &name) {
    fs::path dir = fs::temp_directory_path() / ("hindsight-" + name + "-" + random_id());
    fs::create_directories(dir);
    return dir;
}

void write_test_file(const fs::path &path, const string &content) {
    fs::create_directories(path.parent_path());
    write_file_content(path, content);
}

void write_test_script(const fs::path &path, const string &content) {
    write_test_file(path, content);
    fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec);
}

const rule_catalog &test_catalog() {
    static rule_catalog catalog = rule_catalog::load(HINDSIGHT_TEST_CATALOG);
    return catalog;
}

toolchain_config test_config() {
    toolchain_config config;
    config.catalog_path = HINDSIGHT_TEST_CATALOG;
    config.runguard_path = HINDSIGHT_TEST_RUNGUARD;
    config.work_root = fs::temp_directory_path() / "hindsight-test-runs";
    return config;
}

bool sandbox_available() {
    toolchain_config config = test_config();
    sandbox_config sandbox;
    sandbox.runguard = config.runguard_path;
    sandbox.work_root = config.work_root;
    sandbox.user = config.sandbox_user;
    sandbox.group = config.sandbox_group;
    try {
        sandbox_context::probe(sandbox);
        return true;
    } catch (hindsight_exception &) {
        return false;
    }
}

}  // namespace hindsight::test
