#include "dsscpp/circuit.hpp"

#include <dss_capi_ctx.h>

#include <string>
#include <vector>

#include "context_impl.hpp"

namespace dsscpp {

using internal::Checked;
using internal::CheckedString;
using internal::NotInitialized;

typedef std::vector<std::string> StringList;
typedef std::vector<std::complex<double>> ComplexList;

Result<std::string> ICircuit::Name() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<std::string>();
  const char* s = ctx_Circuit_Get_Name(c->handle);
  return CheckedString(c, s);
}

Result<int32_t> ICircuit::NumBuses() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<int32_t>();
  const int32_t n = ctx_Circuit_Get_NumBuses(c->handle);
  return Checked(c, n);
}

Result<int32_t> ICircuit::NumNodes() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<int32_t>();
  const int32_t n = ctx_Circuit_Get_NumNodes(c->handle);
  return Checked(c, n);
}

Result<int32_t> ICircuit::NumCktElements() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<int32_t>();
  const int32_t n = ctx_Circuit_Get_NumCktElements(c->handle);
  return Checked(c, n);
}

Result<StringList> ICircuit::AllBusNames() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<StringList>();
  internal::StringArrayBuffer buf;
  ctx_Circuit_Get_AllBusNames(c->handle, buf.DataPtr(), buf.CountPtr());
  return buf.Checked(c);
}

Result<StringList> ICircuit::AllNodeNames() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<StringList>();
  internal::StringArrayBuffer buf;
  ctx_Circuit_Get_AllNodeNames(c->handle, buf.DataPtr(), buf.CountPtr());
  return buf.Checked(c);
}

Result<StringList> ICircuit::AllElementNames() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<StringList>();
  internal::StringArrayBuffer buf;
  ctx_Circuit_Get_AllElementNames(c->handle, buf.DataPtr(), buf.CountPtr());
  return buf.Checked(c);
}

Result<std::vector<double>> ICircuit::AllBusVmag() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<std::vector<double>>();
  ctx_Circuit_Get_AllBusVmag_GR(c->handle);
  return c->Float64ArrayGR();
}

Result<std::vector<double>> ICircuit::AllBusVmagPu() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<std::vector<double>>();
  ctx_Circuit_Get_AllBusVmagPu_GR(c->handle);
  return c->Float64ArrayGR();
}

Result<ComplexList> ICircuit::AllBusVolts() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<ComplexList>();
  ctx_Circuit_Get_AllBusVolts_GR(c->handle);
  return c->ComplexArrayGR();
}

Result<std::complex<double>> ICircuit::Losses() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<std::complex<double>>();
  ctx_Circuit_Get_Losses_GR(c->handle);
  return c->ComplexSimpleGR();
}

Result<std::complex<double>> ICircuit::TotalPower() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<std::complex<double>>();
  ctx_Circuit_Get_TotalPower_GR(c->handle);
  return c->ComplexSimpleGR();
}

Result<int32_t> ICircuit::SetActiveElement(const std::string& full_name) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<int32_t>();
  Result<void> st = internal::ValidateText(full_name);
  if (!st) return Result<int32_t>::ErrorFrom(st);
  const int32_t idx =
      ctx_Circuit_SetActiveElement(c->handle, full_name.c_str());
  return Checked(c, idx);
}

Result<int32_t> ICircuit::SetActiveBus(const std::string& name) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<int32_t>();
  Result<void> st = internal::ValidateText(name);
  if (!st) return Result<int32_t>::ErrorFrom(st);
  const int32_t idx = ctx_Circuit_SetActiveBus(c->handle, name.c_str());
  return Checked(c, idx);
}

}  // namespace dsscpp
