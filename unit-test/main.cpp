#include <glog/logging.h>
#include <filesystem>
#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

/**
 * @brief 所有测试共用的环境
 * 沙箱临时目录放到系统临时目录下，测试不要求 root 权限。
 */
class GlobalEnv : public ::testing::Environment {
public:
    void SetUp() override {
        verifier::SANDBOX_DIR = std::filesystem::temp_directory_path() / "verifier-unit-test";
        verifier::USE_CGROUP = false;
        verifier::REQUIRE_ISOLATION = false;
        std::filesystem::create_directories(verifier::SANDBOX_DIR);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(verifier::SANDBOX_DIR, ec);
    }
};

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;
    FLAGS_minloglevel = google::GLOG_WARNING;

    AddGlobalTestEnvironment(new GlobalEnv);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
