#include <glog/logging.h>
#include <filesystem>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/environment.hpp"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    ojudge::test::setup_test_environment();
  }
  virtual void TearDown() {
    std::error_code ec;
    std::filesystem::remove_all(ojudge::test::test_scratch_dir(), ec);
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
