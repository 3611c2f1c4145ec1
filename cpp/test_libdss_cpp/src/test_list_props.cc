#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "dsscpp/dsscpp.hpp"
#include "test_common.hpp"

namespace {

using dsscpp::Context;
using dsscpp::IDss;

bool Contains(const std::vector<std::string>& v, const std::string& s) {
  for (size_t i = 0; i < v.size(); ++i) {
    if (v[i] == s) return true;
  }
  return false;
}

/**
 * @brief Case050: Property names of a Storage element.
 *
 * Steps:
 * - Define a bare circuit and a Storage element in one command block.
 * - Activate the element and read AllPropertyNames().
 * Expected:
 * - A non-empty list holding the storage rating properties; every entry
 *   is non-empty.
 */
TEST(ListProps, Case050_StorageProperties) {
  auto r = Context::Create();
  ASSERT_TRUE(r) << r.Message();
  Context ctx = r.MoveValue();
  IDss dss(ctx);

  auto st = dss.CommandBlock(
      "new circuit.test\n"
      "new storage.we_need_this_for_the_properties\n");
  ASSERT_TRUE(st) << st.Message();

  dsscpp::ICircuit circuit = dss.ActiveCircuit();
  auto idx =
      circuit.SetActiveElement("storage.we_need_this_for_the_properties");
  ASSERT_TRUE(idx) << idx.Message();
  ASSERT_GE(idx.Value(), 0);

  auto names = circuit.ActiveCktElement().AllPropertyNames();
  ASSERT_TRUE(names) << names.Message();
  ASSERT_FALSE(names->empty());
  for (size_t i = 0; i < names->size(); ++i) {
    EXPECT_FALSE(names.Value()[i].empty()) << "index " << i;
  }
  EXPECT_TRUE(Contains(names.Value(), "kWrated"));
  EXPECT_TRUE(Contains(names.Value(), "kWhrated"));
}

/**
 * @brief Case051: Activating a missing Storage element reports no index.
 *
 * Steps:
 * - Create an empty circuit, then activate "storage.absent".
 * Expected:
 * - The call succeeds and SetActiveElement reports a negative index.
 */
TEST(ListProps, Case051_MissingStorage) {
  auto r = Context::Create();
  ASSERT_TRUE(r) << r.Message();
  Context ctx = r.MoveValue();
  IDss dss(ctx);
  ASSERT_TRUE(dss.Command("new circuit.test"));
  auto idx = dss.ActiveCircuit().SetActiveElement("storage.absent");
  ASSERT_TRUE(idx) << idx.Message();
  EXPECT_LT(idx.Value(), 0);
}

}  // namespace
