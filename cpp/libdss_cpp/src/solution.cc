#include "dsscpp/solution.hpp"

#include <dss_capi_ctx.h>
#include <inttypes.h>
#include <stdio.h>

#include <string>

#include "context_impl.hpp"

namespace dsscpp {

using internal::Checked;
using internal::CheckedBool;
using internal::NotInitialized;

namespace {

// Enum values cast from integers are checked before reaching the engine.
Result<void> OutOfRange(const char* what, int32_t value) {
  return Result<void>::Error(ErrorCode::kInvalidArgument, [what, value] {
    char buf[64];
    snprintf(buf, sizeof(buf), "Invalid %s %" PRId32, what, value);
    return std::string(buf);
  });
}

}  // namespace

Result<void> ISolution::Solve() {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  ctx_Solution_Solve(c->handle);
  return c->CheckError();
}

Result<SolveModes> ISolution::Mode() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<SolveModes>();
  const int32_t v = ctx_Solution_Get_Mode(c->handle);
  return Checked(c, static_cast<SolveModes>(v));
}

Result<void> ISolution::SetMode(SolveModes mode) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  const int32_t v = static_cast<int32_t>(mode);
  if (v < static_cast<int32_t>(SolveModes::kSnapShot) ||
      v > static_cast<int32_t>(SolveModes::kHarmonicT)) {
    return OutOfRange("solve mode", v);
  }
  ctx_Solution_Set_Mode(c->handle, v);
  return c->CheckError();
}

Result<ControlModes> ISolution::ControlMode() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<ControlModes>();
  const int32_t v = ctx_Solution_Get_ControlMode(c->handle);
  return Checked(c, static_cast<ControlModes>(v));
}

Result<void> ISolution::SetControlMode(ControlModes mode) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  const int32_t v = static_cast<int32_t>(mode);
  if (v < static_cast<int32_t>(ControlModes::kOff) ||
      v > static_cast<int32_t>(ControlModes::kMultirate)) {
    return OutOfRange("control mode", v);
  }
  ctx_Solution_Set_ControlMode(c->handle, v);
  return c->CheckError();
}

Result<double> ISolution::DblHour() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<double>();
  const double v = ctx_Solution_Get_dblHour(c->handle);
  return Checked(c, v);
}

Result<void> ISolution::SetDblHour(double hour) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  ctx_Solution_Set_dblHour(c->handle, hour);
  return c->CheckError();
}

Result<double> ISolution::LoadMult() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<double>();
  const double v = ctx_Solution_Get_LoadMult(c->handle);
  return Checked(c, v);
}

Result<void> ISolution::SetLoadMult(double mult) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  ctx_Solution_Set_LoadMult(c->handle, mult);
  return c->CheckError();
}

Result<double> ISolution::StepSize() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<double>();
  const double v = ctx_Solution_Get_StepSize(c->handle);
  return Checked(c, v);
}

Result<void> ISolution::SetStepSize(double seconds) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  ctx_Solution_Set_StepSize(c->handle, seconds);
  return c->CheckError();
}

Result<void> ISolution::SetStepsizeMin(double minutes) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  ctx_Solution_Set_StepsizeMin(c->handle, minutes);
  return c->CheckError();
}

Result<int32_t> ISolution::Number() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<int32_t>();
  const int32_t v = ctx_Solution_Get_Number(c->handle);
  return Checked(c, v);
}

Result<void> ISolution::SetNumber(int32_t number) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  ctx_Solution_Set_Number(c->handle, number);
  return c->CheckError();
}

Result<int32_t> ISolution::MaxIterations() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<int32_t>();
  const int32_t v = ctx_Solution_Get_MaxIterations(c->handle);
  return Checked(c, v);
}

Result<void> ISolution::SetMaxIterations(int32_t iterations) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  ctx_Solution_Set_MaxIterations(c->handle, iterations);
  return c->CheckError();
}

Result<double> ISolution::Tolerance() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<double>();
  const double v = ctx_Solution_Get_Tolerance(c->handle);
  return Checked(c, v);
}

Result<void> ISolution::SetTolerance(double tolerance) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  ctx_Solution_Set_Tolerance(c->handle, tolerance);
  return c->CheckError();
}

Result<double> ISolution::Frequency() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<double>();
  const double v = ctx_Solution_Get_Frequency(c->handle);
  return Checked(c, v);
}

Result<void> ISolution::SetFrequency(double hz) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  ctx_Solution_Set_Frequency(c->handle, hz);
  return c->CheckError();
}

Result<bool> ISolution::Converged() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<bool>();
  const uint16_t v = ctx_Solution_Get_Converged(c->handle);
  return CheckedBool(c, v);
}

Result<int32_t> ISolution::Iterations() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<int32_t>();
  const int32_t v = ctx_Solution_Get_Iterations(c->handle);
  return Checked(c, v);
}

}  // namespace dsscpp
