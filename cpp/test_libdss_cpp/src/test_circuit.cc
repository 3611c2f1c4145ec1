#include <gtest/gtest.h>

#include <complex>
#include <string>
#include <vector>

#include "dsscpp/dsscpp.hpp"
#include "test_common.hpp"

namespace {

using dsscpp::Context;
using dsscpp::IDss;

class Ieee13Test : public ::testing::Test {
 protected:
  void SetUp() override {
    auto r = Context::Create();
    ASSERT_TRUE(r) << r.Message();
    ctx_ = r.MoveValue();
    IDss dss(ctx_);
    auto st = dsscpp_test::LoadIeee13(dss);
    ASSERT_TRUE(st) << st.Message();
    auto solved = dss.ActiveCircuit().Solution().Solve();
    ASSERT_TRUE(solved) << solved.Message();
  }

  dsscpp::ICircuit Circuit() { return IDss(ctx_).ActiveCircuit(); }

  Context ctx_;
};

/**
 * @brief Case040: Snapshot solve converges on the IEEE 13 node feeder.
 */
TEST_F(Ieee13Test, Case040_SolveConverges) {
  dsscpp::ISolution sol = Circuit().Solution();
  auto conv = sol.Converged();
  ASSERT_TRUE(conv) << conv.Message();
  EXPECT_TRUE(conv.Value());
  auto it = sol.Iterations();
  ASSERT_TRUE(it) << it.Message();
  EXPECT_GT(it.Value(), 0);

  auto name = Circuit().Name();
  ASSERT_TRUE(name) << name.Message();
  EXPECT_EQ(name.Value(), "ieee13nodeckt");
}

/**
 * @brief Case041: Node-indexed arrays agree in length.
 *
 * Expected:
 * - AllNodeNames, AllBusVmagPu and AllBusVolts each hold NumNodes
 *   entries; bus names match NumBuses; per-unit magnitudes stay within
 *   a plausible band.
 */
TEST_F(Ieee13Test, Case041_NodeArraysConsistent) {
  dsscpp::ICircuit circuit = Circuit();
  auto nodes = circuit.NumNodes();
  ASSERT_TRUE(nodes) << nodes.Message();
  const size_t n = static_cast<size_t>(nodes.Value());
  ASSERT_GT(n, 0u);

  auto node_names = circuit.AllNodeNames();
  ASSERT_TRUE(node_names) << node_names.Message();
  EXPECT_EQ(node_names->size(), n);

  auto vmag = circuit.AllBusVmag();
  ASSERT_TRUE(vmag) << vmag.Message();
  EXPECT_EQ(vmag->size(), n);

  auto pu = circuit.AllBusVmagPu();
  ASSERT_TRUE(pu) << pu.Message();
  ASSERT_EQ(pu->size(), n);
  for (size_t i = 0; i < n; ++i) {
    EXPECT_GT(pu.Value()[i], 0.9) << node_names.Value()[i];
    EXPECT_LT(pu.Value()[i], 1.1) << node_names.Value()[i];
  }

  auto volts = circuit.AllBusVolts();
  ASSERT_TRUE(volts) << volts.Message();
  ASSERT_EQ(volts->size(), n);
  for (size_t i = 0; i < n; ++i) {
    EXPECT_NEAR(std::abs(volts.Value()[i]), vmag.Value()[i],
                1e-6 * vmag.Value()[i]);
  }

  auto buses = circuit.AllBusNames();
  ASSERT_TRUE(buses) << buses.Message();
  EXPECT_EQ(static_cast<int32_t>(buses->size()), circuit.NumBuses().Value());

  auto elems = circuit.AllElementNames();
  ASSERT_TRUE(elems) << elems.Message();
  EXPECT_EQ(static_cast<int32_t>(elems->size()),
            circuit.NumCktElements().Value());
}

/**
 * @brief Case042: Losses are small and positive relative to the feeder.
 */
TEST_F(Ieee13Test, Case042_LossesAndPower) {
  dsscpp::ICircuit circuit = Circuit();
  auto losses = circuit.Losses();
  ASSERT_TRUE(losses) << losses.Message();
  EXPECT_GT(losses->real(), 0.0);

  auto power = circuit.TotalPower();
  ASSERT_TRUE(power) << power.Message();
  // Source power is reported as a negative injection, in kW.
  EXPECT_LT(power->real(), 0.0);
  EXPECT_LT(losses->real() / 1000.0, -power->real());
}

/**
 * @brief Case043: Terminal quantities of a three phase line.
 *
 * Steps:
 * - Activate Line.650632 and read its terminal data.
 * Expected:
 * - 3 phases, 2 terminals, 6 complex voltages, currents and powers,
 *   6 node order entries; property names include "length".
 */
TEST_F(Ieee13Test, Case043_ActiveElementLine) {
  dsscpp::ICircuit circuit = Circuit();
  auto idx = circuit.SetActiveElement("Line.650632");
  ASSERT_TRUE(idx) << idx.Message();
  ASSERT_GE(idx.Value(), 0);

  dsscpp::ICktElement elem = circuit.ActiveCktElement();
  EXPECT_EQ(elem.Name().Value(), "Line.650632");
  EXPECT_EQ(elem.NumPhases().Value(), 3);
  EXPECT_EQ(elem.NumTerminals().Value(), 2);

  auto buses = elem.BusNames();
  ASSERT_TRUE(buses) << buses.Message();
  ASSERT_EQ(buses->size(), 2u);
  EXPECT_EQ(buses.Value()[1], "632.1.2.3");

  auto v = elem.Voltages();
  ASSERT_TRUE(v) << v.Message();
  EXPECT_EQ(v->size(), 6u);
  auto i = elem.Currents();
  ASSERT_TRUE(i) << i.Message();
  EXPECT_EQ(i->size(), 6u);
  auto p = elem.Powers();
  ASSERT_TRUE(p) << p.Message();
  EXPECT_EQ(p->size(), 6u);

  auto order = elem.NodeOrder();
  ASSERT_TRUE(order) << order.Message();
  ASSERT_EQ(order->size(), 6u);
  EXPECT_EQ(order.Value()[0], 1);
  EXPECT_EQ(order.Value()[5], 3);

  auto props = elem.AllPropertyNames();
  ASSERT_TRUE(props) << props.Message();
  bool has_length = false;
  for (size_t k = 0; k < props->size(); ++k) {
    if (props.Value()[k] == "length") has_length = true;
  }
  EXPECT_TRUE(has_length);
}

/**
 * @brief Case044: Bus voltages in polar and rectangular form.
 */
TEST_F(Ieee13Test, Case044_ActiveBus) {
  dsscpp::ICircuit circuit = Circuit();
  ASSERT_GE(circuit.SetActiveBus("671").Value(), 0);
  dsscpp::IBus bus = circuit.ActiveBus();

  EXPECT_EQ(bus.Name().Value(), "671");
  EXPECT_EQ(bus.NumNodes().Value(), 3);
  EXPECT_NEAR(bus.KVBase().Value(), 4.16 / 1.7320508075688772, 1e-3);

  auto nodes = bus.Nodes();
  ASSERT_TRUE(nodes) << nodes.Message();
  EXPECT_EQ(nodes->size(), 3u);

  auto v = bus.Voltages();
  ASSERT_TRUE(v) << v.Message();
  EXPECT_EQ(v->size(), 3u);

  auto polar = bus.PuVmagAngle();
  ASSERT_TRUE(polar) << polar.Message();
  ASSERT_EQ(polar->size(), 6u);
  for (size_t k = 0; k < polar->size(); k += 2) {
    EXPECT_GT(polar.Value()[k], 0.9);
  }
}

/**
 * @brief Case045: Unknown element and bus names report a negative index.
 */
TEST_F(Ieee13Test, Case045_MissingNames) {
  dsscpp::ICircuit circuit = Circuit();
  auto e = circuit.SetActiveElement("Line.does_not_exist");
  ASSERT_TRUE(e) << e.Message();
  EXPECT_LT(e.Value(), 0);
  auto b = circuit.SetActiveBus("no_such_bus");
  ASSERT_TRUE(b) << b.Message();
  EXPECT_LT(b.Value(), 0);
}

/**
 * @brief Case046: Energy meter registers line up with their names.
 *
 * Steps:
 * - Reset meters, solve, sample; read the single feeder meter.
 * Expected:
 * - One meter named "feeder"; register names, values and totals share
 *   a length; Next() past the last meter returns 0; selecting the meter
 *   by name reads the name back.
 */
TEST_F(Ieee13Test, Case046_Meters) {
  dsscpp::ICircuit circuit = Circuit();
  dsscpp::IMeters meters = circuit.Meters();
  ASSERT_TRUE(meters.ResetAll());
  ASSERT_TRUE(circuit.Solution().Solve());
  ASSERT_TRUE(meters.SampleAll());

  EXPECT_EQ(meters.Count().Value(), 1);
  EXPECT_EQ(meters.First().Value(), 1);
  EXPECT_EQ(meters.Name().Value(), "feeder");

  auto names = meters.RegisterNames();
  ASSERT_TRUE(names) << names.Message();
  ASSERT_FALSE(names->empty());
  EXPECT_EQ(names.Value()[0], "kWh");
  auto values = meters.RegisterValues();
  ASSERT_TRUE(values) << values.Message();
  EXPECT_EQ(values->size(), names->size());
  auto totals = meters.Totals();
  ASSERT_TRUE(totals) << totals.Message();
  EXPECT_EQ(totals->size(), names->size());

  EXPECT_EQ(meters.Next().Value(), 0);
  ASSERT_TRUE(meters.SetName("Feeder"));
  auto name = meters.Name();
  ASSERT_TRUE(name) << name.Message();
  EXPECT_EQ(name.Value(), "feeder");
}

/**
 * @brief Case047: Iterating loads visits every load once.
 */
TEST_F(Ieee13Test, Case047_LoadIteration) {
  dsscpp::ILoads loads = Circuit().Loads();
  auto count = loads.Count();
  ASSERT_TRUE(count) << count.Message();
  EXPECT_EQ(count.Value(), 15);

  auto all = loads.AllNames();
  ASSERT_TRUE(all) << all.Message();
  ASSERT_EQ(static_cast<int32_t>(all->size()), count.Value());

  std::vector<std::string> visited;
  double total_kw = 0.0;
  for (int32_t i = loads.First().Value(); i > 0; i = loads.Next().Value()) {
    visited.push_back(loads.Name().Value());
    total_kw += loads.KW().Value();
  }
  EXPECT_EQ(visited, all.Value());
  EXPECT_NEAR(total_kw, 3466.0, 1e-6);
}

}  // namespace
