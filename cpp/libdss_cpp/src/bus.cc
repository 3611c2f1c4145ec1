#include "dsscpp/bus.hpp"

#include <dss_capi_ctx.h>

#include <string>
#include <vector>

#include "context_impl.hpp"

namespace dsscpp {

using internal::Checked;
using internal::CheckedBool;
using internal::CheckedString;
using internal::NotInitialized;

Result<std::string> IBus::Name() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<std::string>();
  const char* s = ctx_Bus_Get_Name(c->handle);
  return CheckedString(c, s);
}

Result<int32_t> IBus::NumNodes() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<int32_t>();
  const int32_t v = ctx_Bus_Get_NumNodes(c->handle);
  return Checked(c, v);
}

Result<double> IBus::KVBase() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<double>();
  const double v = ctx_Bus_Get_kVBase(c->handle);
  return Checked(c, v);
}

Result<std::vector<int32_t>> IBus::Nodes() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<std::vector<int32_t>>();
  ctx_Bus_Get_Nodes_GR(c->handle);
  return c->Int32ArrayGR();
}

Result<std::vector<std::complex<double>>> IBus::Voltages() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<std::vector<std::complex<double>>>();
  ctx_Bus_Get_Voltages_GR(c->handle);
  return c->ComplexArrayGR();
}

Result<std::vector<double>> IBus::PuVmagAngle() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<std::vector<double>>();
  ctx_Bus_Get_puVmagAngle_GR(c->handle);
  Result<std::vector<double>> r = c->Float64ArrayGR();
  if (!r) return r;
  Result<void> st = internal::CheckPairCount(r->size());
  if (!st) return Result<std::vector<double>>::ErrorFrom(st);
  return r;
}

Result<double> IBus::X() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<double>();
  const double v = ctx_Bus_Get_x(c->handle);
  return Checked(c, v);
}

Result<void> IBus::SetX(double x) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  ctx_Bus_Set_x(c->handle, x);
  return c->CheckError();
}

Result<double> IBus::Y() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<double>();
  const double v = ctx_Bus_Get_y(c->handle);
  return Checked(c, v);
}

Result<void> IBus::SetY(double y) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  ctx_Bus_Set_y(c->handle, y);
  return c->CheckError();
}

Result<bool> IBus::Coorddefined() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<bool>();
  const uint16_t v = ctx_Bus_Get_Coorddefined(c->handle);
  return CheckedBool(c, v);
}

}  // namespace dsscpp
