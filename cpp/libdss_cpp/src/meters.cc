#include "dsscpp/meters.hpp"

#include <dss_capi_ctx.h>

#include <string>
#include <vector>

#include "context_impl.hpp"

namespace dsscpp {

using internal::Checked;
using internal::CheckedString;
using internal::NotInitialized;

Result<int32_t> IMeters::First() {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<int32_t>();
  const int32_t v = ctx_Meters_First(c->handle);
  return Checked(c, v);
}

Result<int32_t> IMeters::Next() {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<int32_t>();
  const int32_t v = ctx_Meters_Next(c->handle);
  return Checked(c, v);
}

Result<int32_t> IMeters::Count() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<int32_t>();
  const int32_t v = ctx_Meters_Get_Count(c->handle);
  return Checked(c, v);
}

Result<std::string> IMeters::Name() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<std::string>();
  const char* s = ctx_Meters_Get_Name(c->handle);
  return CheckedString(c, s);
}

Result<void> IMeters::SetName(const std::string& name) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  Result<void> st = internal::ValidateText(name);
  if (!st) return st;
  ctx_Meters_Set_Name(c->handle, name.c_str());
  return c->CheckError();
}

Result<void> IMeters::ResetAll() {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  ctx_Meters_ResetAll(c->handle);
  return c->CheckError();
}

Result<void> IMeters::SampleAll() {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  ctx_Meters_SampleAll(c->handle);
  return c->CheckError();
}

Result<std::vector<std::string>> IMeters::RegisterNames() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<std::vector<std::string>>();
  internal::StringArrayBuffer buf;
  ctx_Meters_Get_RegisterNames(c->handle, buf.DataPtr(), buf.CountPtr());
  return buf.Checked(c);
}

Result<std::vector<double>> IMeters::RegisterValues() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<std::vector<double>>();
  ctx_Meters_Get_RegisterValues_GR(c->handle);
  return c->Float64ArrayGR();
}

Result<std::vector<double>> IMeters::Totals() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<std::vector<double>>();
  ctx_Meters_Get_Totals_GR(c->handle);
  return c->Float64ArrayGR();
}

}  // namespace dsscpp
