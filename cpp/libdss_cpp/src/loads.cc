#include "dsscpp/loads.hpp"

#include <dss_capi_ctx.h>
#include <stdio.h>

#include <string>
#include <vector>

#include "context_impl.hpp"

namespace dsscpp {

using internal::Checked;
using internal::CheckedString;
using internal::NotInitialized;

const size_t ILoads::kZIPVSize;

Result<int32_t> ILoads::First() {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<int32_t>();
  const int32_t v = ctx_Loads_First(c->handle);
  return Checked(c, v);
}

Result<int32_t> ILoads::Next() {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<int32_t>();
  const int32_t v = ctx_Loads_Next(c->handle);
  return Checked(c, v);
}

Result<int32_t> ILoads::Count() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<int32_t>();
  const int32_t v = ctx_Loads_Get_Count(c->handle);
  return Checked(c, v);
}

Result<std::vector<std::string>> ILoads::AllNames() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<std::vector<std::string>>();
  internal::StringArrayBuffer buf;
  ctx_Loads_Get_AllNames(c->handle, buf.DataPtr(), buf.CountPtr());
  return buf.Checked(c);
}

Result<std::string> ILoads::Name() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<std::string>();
  const char* s = ctx_Loads_Get_Name(c->handle);
  return CheckedString(c, s);
}

Result<void> ILoads::SetName(const std::string& name) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  Result<void> st = internal::ValidateText(name);
  if (!st) return st;
  ctx_Loads_Set_Name(c->handle, name.c_str());
  return c->CheckError();
}

Result<double> ILoads::KW() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<double>();
  const double v = ctx_Loads_Get_kW(c->handle);
  return Checked(c, v);
}

Result<void> ILoads::SetKW(double kw) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  ctx_Loads_Set_kW(c->handle, kw);
  return c->CheckError();
}

Result<double> ILoads::Kvar() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<double>();
  const double v = ctx_Loads_Get_kvar(c->handle);
  return Checked(c, v);
}

Result<void> ILoads::SetKvar(double kvar) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  ctx_Loads_Set_kvar(c->handle, kvar);
  return c->CheckError();
}

Result<double> ILoads::PF() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<double>();
  const double v = ctx_Loads_Get_PF(c->handle);
  return Checked(c, v);
}

Result<void> ILoads::SetPF(double pf) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  ctx_Loads_Set_PF(c->handle, pf);
  return c->CheckError();
}

Result<int32_t> ILoads::Model() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<int32_t>();
  const int32_t v = ctx_Loads_Get_Model(c->handle);
  return Checked(c, v);
}

Result<void> ILoads::SetModel(int32_t model) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  ctx_Loads_Set_Model(c->handle, model);
  return c->CheckError();
}

Result<std::vector<double>> ILoads::ZIPV() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<std::vector<double>>();
  ctx_Loads_Get_ZIPV_GR(c->handle);
  return c->Float64ArrayGR();
}

Result<void> ILoads::SetZIPV(const std::vector<double>& zipv) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  if (zipv.size() != kZIPVSize) {
    const size_t n = zipv.size();
    return Result<void>::Error(ErrorCode::kMarshalError, [n] {
      char buf[96];
      snprintf(buf, sizeof(buf), "ZIPV requires %zu values, got %zu",
               ILoads::kZIPVSize, n);
      return std::string(buf);
    });
  }
  ctx_Loads_Set_ZIPV(c->handle, &zipv[0], static_cast<int32_t>(zipv.size()));
  return c->CheckError();
}

}  // namespace dsscpp
