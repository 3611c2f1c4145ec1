#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "dsscpp/dsscpp.hpp"
#include "test_common.hpp"

namespace {

using dsscpp::Context;
using dsscpp::ControlModes;
using dsscpp::IDss;
using dsscpp::SolveModes;

class RoundTripTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto r = Context::Create();
    ASSERT_TRUE(r) << r.Message();
    ctx_ = r.MoveValue();
    IDss dss(ctx_);
    auto st = dsscpp_test::LoadIeee13(dss);
    ASSERT_TRUE(st) << st.Message();
  }

  Context ctx_;
};

/**
 * @brief Case030: Solution scalars read back what was written.
 *
 * Steps:
 * - Write load multiplier, tolerance, max iterations, hour and number.
 * Expected:
 * - Each getter returns the written value.
 */
TEST_F(RoundTripTest, Case030_SolutionScalars) {
  dsscpp::ISolution sol = IDss(ctx_).ActiveCircuit().Solution();

  ASSERT_TRUE(sol.SetLoadMult(0.75));
  EXPECT_DOUBLE_EQ(sol.LoadMult().Value(), 0.75);

  ASSERT_TRUE(sol.SetTolerance(1e-5));
  EXPECT_DOUBLE_EQ(sol.Tolerance().Value(), 1e-5);

  ASSERT_TRUE(sol.SetMaxIterations(33));
  EXPECT_EQ(sol.MaxIterations().Value(), 33);

  ASSERT_TRUE(sol.SetDblHour(6.5));
  EXPECT_DOUBLE_EQ(sol.DblHour().Value(), 6.5);

  ASSERT_TRUE(sol.SetNumber(24));
  EXPECT_EQ(sol.Number().Value(), 24);
}

/**
 * @brief Case031: Solve and control modes round-trip as enums.
 *
 * Steps:
 * - Switch to daily mode with a 15 minute step, then back to snapshot.
 * - Toggle the control mode between time and static.
 * Expected:
 * - Mode(), StepSize() and ControlMode() report the written values.
 */
TEST_F(RoundTripTest, Case031_Modes) {
  dsscpp::ISolution sol = IDss(ctx_).ActiveCircuit().Solution();

  ASSERT_TRUE(sol.SetMode(SolveModes::kDaily));
  auto m = sol.Mode();
  ASSERT_TRUE(m) << m.Message();
  EXPECT_EQ(m.Value(), SolveModes::kDaily);

  ASSERT_TRUE(sol.SetStepsizeMin(15.0));
  EXPECT_DOUBLE_EQ(sol.StepSize().Value(), 900.0);

  ASSERT_TRUE(sol.SetMode(SolveModes::kSnapShot));
  EXPECT_EQ(sol.Mode().Value(), SolveModes::kSnapShot);

  ASSERT_TRUE(sol.SetControlMode(ControlModes::kTime));
  EXPECT_EQ(sol.ControlMode().Value(), ControlModes::kTime);
  ASSERT_TRUE(sol.SetControlMode(ControlModes::kStatic));
  EXPECT_EQ(sol.ControlMode().Value(), ControlModes::kStatic);
}

/**
 * @brief Case032: Load properties and ZIPV coefficients.
 *
 * Steps:
 * - Activate load "671"; write kW, kvar, model and a 7 element ZIPV.
 * Expected:
 * - All values read back; ZIPV keeps its order.
 */
TEST_F(RoundTripTest, Case032_LoadProperties) {
  dsscpp::ILoads loads = IDss(ctx_).ActiveCircuit().Loads();
  ASSERT_TRUE(loads.SetName("671"));
  auto name = loads.Name();
  ASSERT_TRUE(name) << name.Message();
  EXPECT_EQ(name.Value(), "671");

  ASSERT_TRUE(loads.SetKW(1000.0));
  EXPECT_DOUBLE_EQ(loads.KW().Value(), 1000.0);
  ASSERT_TRUE(loads.SetKvar(400.0));
  EXPECT_DOUBLE_EQ(loads.Kvar().Value(), 400.0);
  ASSERT_TRUE(loads.SetModel(2));
  EXPECT_EQ(loads.Model().Value(), 2);

  const double coeffs[dsscpp::ILoads::kZIPVSize] = {0.2, 0.3, 0.5, 0.1,
                                                    0.1, 0.8, 0.7};
  std::vector<double> zipv(coeffs, coeffs + dsscpp::ILoads::kZIPVSize);
  auto st = loads.SetZIPV(zipv);
  ASSERT_TRUE(st) << st.Message();
  auto back = loads.ZIPV();
  ASSERT_TRUE(back) << back.Message();
  ASSERT_EQ(back->size(), dsscpp::ILoads::kZIPVSize);
  for (size_t i = 0; i < zipv.size(); ++i) {
    EXPECT_DOUBLE_EQ(back.Value()[i], zipv[i]) << "index " << i;
  }
}

/**
 * @brief Case033: Bus coordinates become defined once written.
 */
TEST_F(RoundTripTest, Case033_BusCoordinates) {
  dsscpp::ICircuit circuit = IDss(ctx_).ActiveCircuit();
  auto idx = circuit.SetActiveBus("692");
  ASSERT_TRUE(idx) << idx.Message();
  ASSERT_GE(idx.Value(), 0);

  dsscpp::IBus bus = circuit.ActiveBus();
  ASSERT_TRUE(bus.SetX(125.5));
  ASSERT_TRUE(bus.SetY(-40.25));
  EXPECT_DOUBLE_EQ(bus.X().Value(), 125.5);
  EXPECT_DOUBLE_EQ(bus.Y().Value(), -40.25);
  auto defined = bus.Coorddefined();
  ASSERT_TRUE(defined) << defined.Message();
  EXPECT_TRUE(defined.Value());
}

/**
 * @brief Case034: Element enable flag toggles.
 */
TEST_F(RoundTripTest, Case034_ElementEnabled) {
  dsscpp::ICircuit circuit = IDss(ctx_).ActiveCircuit();
  ASSERT_GE(circuit.SetActiveElement("Load.634a").Value(), 0);
  dsscpp::ICktElement elem = circuit.ActiveCktElement();

  EXPECT_TRUE(elem.Enabled().Value());
  ASSERT_TRUE(elem.SetEnabled(false));
  EXPECT_FALSE(elem.Enabled().Value());
  ASSERT_TRUE(elem.SetEnabled(true));
  EXPECT_TRUE(elem.Enabled().Value());
}

/**
 * @brief Case035: Engine settings and data path.
 *
 * Steps:
 * - Toggle early abort and extended errors; point the data path at the
 *   test data directory.
 * Expected:
 * - Getters follow the setters and the wrapper's recorded options track
 *   the change.
 */
TEST_F(RoundTripTest, Case035_EngineSettings) {
  IDss dss(ctx_);

  ASSERT_TRUE(dss.SetEarlyAbort(false));
  EXPECT_FALSE(dss.EarlyAbort().Value());
  EXPECT_FALSE(ctx_.Options().early_abort);
  ASSERT_TRUE(dss.SetEarlyAbort(true));
  EXPECT_TRUE(dss.EarlyAbort().Value());

  ASSERT_TRUE(dss.SetExtendedErrors(false));
  EXPECT_FALSE(dss.ExtendedErrors().Value());
  ASSERT_TRUE(dss.SetExtendedErrors(true));
  EXPECT_TRUE(dss.ExtendedErrors().Value());

  EXPECT_FALSE(dss.AllowForms().Value());

  const std::string dir(DSSCPP_TEST_DATA_DIR);
  auto st = dss.SetDataPath(dir);
  ASSERT_TRUE(st) << st.Message();
  auto path = dss.DataPath();
  ASSERT_TRUE(path) << path.Message();
  EXPECT_NE(path->find(dir), std::string::npos) << path.Value();
}

/**
 * @brief Case036: Command result text and the class list.
 */
TEST_F(RoundTripTest, Case036_TextResultAndClasses) {
  IDss dss(ctx_);
  ASSERT_TRUE(dss.Command("? Load.671.kW"));
  auto text = dss.TextResult();
  ASSERT_TRUE(text) << text.Message();
  EXPECT_DOUBLE_EQ(std::stod(text.Value()), 1155.0);

  auto classes = dss.Classes();
  ASSERT_TRUE(classes) << classes.Message();
  bool has_load = false;
  for (size_t i = 0; i < classes->size(); ++i) {
    if (classes.Value()[i] == "Load") has_load = true;
  }
  EXPECT_TRUE(has_load);
  EXPECT_GE(dss.NumCircuits().Value(), 1);
}

/**
 * @brief Case037: Command lists and blocks run in order.
 */
TEST_F(RoundTripTest, Case037_CommandsAndBlocks) {
  IDss dss(ctx_);
  std::vector<std::string> cmds;
  cmds.push_back("Load.671.kW=900");
  cmds.push_back("Load.671.kvar=300");
  ASSERT_TRUE(dss.Commands(cmds));
  ASSERT_TRUE(dss.Commands(std::vector<std::string>()));

  dsscpp::ILoads loads = dss.ActiveCircuit().Loads();
  ASSERT_TRUE(loads.SetName("671"));
  EXPECT_DOUBLE_EQ(loads.KW().Value(), 900.0);
  EXPECT_DOUBLE_EQ(loads.Kvar().Value(), 300.0);

  auto st = dss.CommandBlock("Load.671.kW=800\nLoad.671.kvar=200\n");
  ASSERT_TRUE(st) << st.Message();
  ASSERT_TRUE(loads.SetName("671"));
  EXPECT_DOUBLE_EQ(loads.KW().Value(), 800.0);
  EXPECT_DOUBLE_EQ(loads.Kvar().Value(), 200.0);
}

/**
 * @brief Case038: Remaining scalar settings read back what was written.
 *
 * Steps:
 * - Write frequency, step size (seconds) and the power factor of
 *   Load.671; toggle the forms and change-dir flags both ways.
 * Expected:
 * - Each getter returns the written value.
 */
TEST_F(RoundTripTest, Case038_MoreScalars) {
  IDss dss(ctx_);
  dsscpp::ISolution sol = dss.ActiveCircuit().Solution();

  ASSERT_TRUE(sol.SetFrequency(50.0));
  EXPECT_DOUBLE_EQ(sol.Frequency().Value(), 50.0);

  ASSERT_TRUE(sol.SetStepSize(1800.0));
  EXPECT_DOUBLE_EQ(sol.StepSize().Value(), 1800.0);

  dsscpp::ILoads loads = dss.ActiveCircuit().Loads();
  ASSERT_TRUE(loads.SetName("671"));
  ASSERT_TRUE(loads.SetPF(0.9));
  EXPECT_NEAR(loads.PF().Value(), 0.9, 1e-9);

  ASSERT_TRUE(dss.SetAllowForms(true));
  EXPECT_TRUE(dss.AllowForms().Value());
  ASSERT_TRUE(dss.SetAllowForms(false));
  EXPECT_FALSE(dss.AllowForms().Value());

  ASSERT_TRUE(dss.SetAllowChangeDir(false));
  EXPECT_FALSE(dss.AllowChangeDir().Value());
  ASSERT_TRUE(dss.SetAllowChangeDir(true));
  EXPECT_TRUE(dss.AllowChangeDir().Value());
}

/**
 * @brief Case039: Out-of-range mode values are rejected locally.
 *
 * Steps:
 * - Pass solve and control mode values the engine does not define.
 * Expected:
 * - kInvalidArgument without an engine number; the current modes stay.
 */
TEST_F(RoundTripTest, Case039_ModeOutOfRange) {
  dsscpp::ISolution sol = IDss(ctx_).ActiveCircuit().Solution();
  auto mode = sol.Mode();
  ASSERT_TRUE(mode) << mode.Message();
  auto control = sol.ControlMode();
  ASSERT_TRUE(control) << control.Message();

  auto st = sol.SetMode(static_cast<SolveModes>(99));
  ASSERT_FALSE(st);
  EXPECT_EQ(st.Code(), dsscpp::ErrorCode::kInvalidArgument);
  EXPECT_EQ(st.EngineCode(), 0);

  st = sol.SetControlMode(static_cast<ControlModes>(7));
  ASSERT_FALSE(st);
  EXPECT_EQ(st.Code(), dsscpp::ErrorCode::kInvalidArgument);

  EXPECT_EQ(sol.Mode().Value(), mode.Value());
  EXPECT_EQ(sol.ControlMode().Value(), control.Value());
}

}  // namespace
