#include <gtest/gtest.h>

#include "dsscpp/dsscpp.hpp"

namespace {

class DssEnv : public ::testing::Environment {
 public:
  void SetUp() override {
    auto r = dsscpp::Context::Prime();
    ASSERT_TRUE(r) << "Prime context unavailable: " << r.Message();
    prime_ = new dsscpp::Context(r.MoveValue());
  }
  void TearDown() override {
    delete prime_;
    prime_ = nullptr;
  }

 private:
  dsscpp::Context* prime_ = nullptr;
};

}  // namespace

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  ::testing::AddGlobalTestEnvironment(new DssEnv());
  return RUN_ALL_TESTS();
}
