#include <gtest/gtest.h>
#include <codegrade/logger.h>

#include "utils.h"

int log_verbosity;

class MyEnvironment : public ::testing::Environment {
 public:
  void SetUp() override {
    InitLogger(log_verbosity);
  }
  void TearDown() override {
    fs::remove_all(kTestScratchRoot);
  }
};

testing::Environment* const my_env = testing::AddGlobalTestEnvironment(new MyEnvironment);

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  log_verbosity = 0;
  if (argc > 1) {
    if (std::string("-v") == argv[1]) log_verbosity = 1;
    if (std::string("-vv") == argv[1]) log_verbosity = 2;
  }
  return RUN_ALL_TESTS();
}
