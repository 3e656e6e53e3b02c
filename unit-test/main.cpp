#include <glog/logging.h>
#include <filesystem>
#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    runner::WORK_DIR = std::filesystem::temp_directory_path() / "exercise-runner-test";
    std::filesystem::create_directories(runner::WORK_DIR);
  }
  virtual void TearDown() {
    std::error_code ec;
    std::filesystem::remove_all(runner::WORK_DIR, ec);
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
