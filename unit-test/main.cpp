#include <glog/logging.h>
#include <filesystem>
#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
public:
    void SetUp() override {
        // 测试使用独立的临时目录，不影响正在运行的评测服务
        assessor::SCRATCH_DIR = std::filesystem::temp_directory_path() / "code-assessor-test";
        std::filesystem::create_directories(assessor::SCRATCH_DIR);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(assessor::SCRATCH_DIR, ec);
    }
};

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    AddGlobalTestEnvironment(new GlobalEnv);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
