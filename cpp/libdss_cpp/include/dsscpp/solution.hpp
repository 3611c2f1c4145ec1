/**
 * @file solution.hpp
 * @brief Solution interface of the active circuit.
 */
#pragma once

#include <stdint.h>

#include "dsscpp/context.hpp"
#include "dsscpp/result.hpp"

namespace dsscpp {

/** @brief Engine solution modes. */
enum class SolveModes : int32_t {
  kSnapShot = 0,
  kDaily = 1,
  kYearly = 2,
  kMonte1 = 3,
  kLD1 = 4,
  kPeakDay = 5,
  kDutyCycle = 6,
  kDirect = 7,
  kMonteFault = 8,
  kFaultStudy = 9,
  kMonte2 = 10,
  kMonte3 = 11,
  kLD2 = 12,
  kAutoAdd = 13,
  kDynamic = 14,
  kHarmonic = 15,
  kTime = 16,
  kHarmonicT = 17
};

/** @brief Engine control modes. */
enum class ControlModes : int32_t {
  kOff = -1,
  kStatic = 0,
  kEvent = 1,
  kTime = 2,
  kMultirate = 3
};

class ISolution {
 public:
  explicit ISolution(Context& ctx) : ctx_(&ctx) {}

  /** @brief Solve the circuit in the current mode. */
  Result<void> Solve();

  Result<SolveModes> Mode() const;
  Result<void> SetMode(SolveModes mode);
  Result<ControlModes> ControlMode() const;
  Result<void> SetControlMode(ControlModes mode);

  /** @brief Current simulation time in hours. */
  Result<double> DblHour() const;
  Result<void> SetDblHour(double hour);
  Result<double> LoadMult() const;
  Result<void> SetLoadMult(double mult);

  /** @brief Time step in seconds. */
  Result<double> StepSize() const;
  Result<void> SetStepSize(double seconds);
  /** @brief Set the time step in minutes. */
  Result<void> SetStepsizeMin(double minutes);

  /** @brief Number of solutions per Solve() in time-series modes. */
  Result<int32_t> Number() const;
  Result<void> SetNumber(int32_t number);
  Result<int32_t> MaxIterations() const;
  Result<void> SetMaxIterations(int32_t iterations);
  Result<double> Tolerance() const;
  Result<void> SetTolerance(double tolerance);
  Result<double> Frequency() const;
  Result<void> SetFrequency(double hz);

  Result<bool> Converged() const;
  Result<int32_t> Iterations() const;

 private:
  Context* ctx_;
};

}  // namespace dsscpp
