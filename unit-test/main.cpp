#include <glog/logging.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    // 测试期间只输出警告以上的日志
    FLAGS_logtostderr = true;
    FLAGS_minloglevel = google::GLOG_WARNING;
  }
  virtual void TearDown() {
    google::ShutdownGoogleLogging();
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
