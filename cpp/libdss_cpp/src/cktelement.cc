#include "dsscpp/cktelement.hpp"

#include <dss_capi_ctx.h>

#include <string>
#include <vector>

#include "context_impl.hpp"

namespace dsscpp {

using internal::Checked;
using internal::CheckedBool;
using internal::CheckedString;
using internal::NotInitialized;

typedef std::vector<std::complex<double>> ComplexList;

Result<std::string> ICktElement::Name() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<std::string>();
  const char* s = ctx_CktElement_Get_Name(c->handle);
  return CheckedString(c, s);
}

Result<int32_t> ICktElement::NumPhases() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<int32_t>();
  const int32_t v = ctx_CktElement_Get_NumPhases(c->handle);
  return Checked(c, v);
}

Result<int32_t> ICktElement::NumTerminals() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<int32_t>();
  const int32_t v = ctx_CktElement_Get_NumTerminals(c->handle);
  return Checked(c, v);
}

Result<std::vector<std::string>> ICktElement::BusNames() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<std::vector<std::string>>();
  internal::StringArrayBuffer buf;
  ctx_CktElement_Get_BusNames(c->handle, buf.DataPtr(), buf.CountPtr());
  return buf.Checked(c);
}

Result<std::vector<std::string>> ICktElement::AllPropertyNames() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<std::vector<std::string>>();
  internal::StringArrayBuffer buf;
  ctx_CktElement_Get_AllPropertyNames(c->handle, buf.DataPtr(),
                                      buf.CountPtr());
  return buf.Checked(c);
}

Result<bool> ICktElement::Enabled() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<bool>();
  const uint16_t v = ctx_CktElement_Get_Enabled(c->handle);
  return CheckedBool(c, v);
}

Result<void> ICktElement::SetEnabled(bool enabled) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  ctx_CktElement_Set_Enabled(c->handle, enabled ? 1 : 0);
  return c->CheckError();
}

Result<ComplexList> ICktElement::Voltages() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<ComplexList>();
  ctx_CktElement_Get_Voltages_GR(c->handle);
  return c->ComplexArrayGR();
}

Result<ComplexList> ICktElement::Currents() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<ComplexList>();
  ctx_CktElement_Get_Currents_GR(c->handle);
  return c->ComplexArrayGR();
}

Result<ComplexList> ICktElement::Powers() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<ComplexList>();
  ctx_CktElement_Get_Powers_GR(c->handle);
  return c->ComplexArrayGR();
}

Result<std::vector<int32_t>> ICktElement::NodeOrder() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<std::vector<int32_t>>();
  ctx_CktElement_Get_NodeOrder_GR(c->handle);
  return c->Int32ArrayGR();
}

}  // namespace dsscpp
