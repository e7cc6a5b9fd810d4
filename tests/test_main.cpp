#include <gtest/gtest.h>

#include <filesystem>
#include <iostream>

#include "common/utilities_test.hpp"

namespace {

// Removes this process's databases left behind by tests that aborted before TearDown
class TempDatabaseEnvironment : public ::testing::Environment {
 public:
  void TearDown() override {
    using clientiq_tests::TestUtilities;
    std::error_code ec;
    const std::string prefix = TestUtilities::temp_db_prefix();
    std::filesystem::directory_iterator it(TestUtilities::temp_db_directory(), ec);
    for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
      if (it->path().filename().string().rfind(prefix, 0) == 0) {
        std::filesystem::remove(it->path(), ec);
      }
    }
  }
};

}  // namespace

int main(int argc, char **argv) {
  std::cout << "Running ClientIQ Test Suite..." << std::endl;

  ::testing::InitGoogleTest(&argc, argv);
  ::testing::AddGlobalTestEnvironment(new TempDatabaseEnvironment);

  return RUN_ALL_TESTS();
}
