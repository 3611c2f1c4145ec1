#include "dsscpp/dss.hpp"

#include <dss_capi_ctx.h>

#include <string>
#include <utility>
#include <vector>

#include "context_impl.hpp"

namespace dsscpp {

using internal::Checked;
using internal::CheckedBool;
using internal::CheckedString;
using internal::NotInitialized;

Result<void> IDss::Command(const std::string& command) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  Result<void> st = internal::ValidateText(command);
  if (!st) return st;
  ctx_Text_Set_Command(c->handle, command.c_str());
  return c->CheckError();
}

Result<void> IDss::Commands(const std::vector<std::string>& commands) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  for (size_t i = 0; i < commands.size(); ++i) {
    Result<void> st = internal::ValidateText(commands[i]);
    if (!st) return st;
  }
  if (commands.empty()) return Result<void>::Ok();
  internal::StringArrayInput input(commands);
  ctx_Text_CommandArray(c->handle, input.Data(), input.Count());
  return c->CheckError();
}

Result<void> IDss::CommandBlock(const std::string& block) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  Result<void> st = internal::ValidateText(block);
  if (!st) return st;
  ctx_Text_CommandBlock(c->handle, block.c_str());
  return c->CheckError();
}

Result<std::string> IDss::TextResult() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<std::string>();
  const char* s = ctx_Text_Get_Result(c->handle);
  return CheckedString(c, s);
}

Result<std::string> IDss::Version() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<std::string>();
  const char* s = ctx_DSS_Get_Version(c->handle);
  return CheckedString(c, s);
}

Result<void> IDss::ClearAll() {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  ctx_DSS_ClearAll(c->handle);
  return c->CheckError();
}

Result<void> IDss::Reset() {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  ctx_DSS_Reset(c->handle);
  return c->CheckError();
}

Result<int32_t> IDss::NumCircuits() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<int32_t>();
  const int32_t n = ctx_DSS_Get_NumCircuits(c->handle);
  return Checked(c, n);
}

Result<std::vector<std::string>> IDss::Classes() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<std::vector<std::string>>();
  internal::StringArrayBuffer buf;
  ctx_DSS_Get_Classes(c->handle, buf.DataPtr(), buf.CountPtr());
  return buf.Checked(c);
}

Result<bool> IDss::AllowChangeDir() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<bool>();
  const uint16_t v = ctx_DSS_Get_AllowChangeDir(c->handle);
  return CheckedBool(c, v);
}

Result<void> IDss::SetAllowChangeDir(bool value) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  ctx_DSS_Set_AllowChangeDir(c->handle, value ? 1 : 0);
  Result<void> st = c->CheckError();
  if (st) c->options.allow_change_dir = value;
  return st;
}

Result<bool> IDss::AllowForms() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<bool>();
  const uint16_t v = ctx_DSS_Get_AllowForms(c->handle);
  return CheckedBool(c, v);
}

Result<void> IDss::SetAllowForms(bool value) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  ctx_DSS_Set_AllowForms(c->handle, value ? 1 : 0);
  Result<void> st = c->CheckError();
  if (st) c->options.allow_forms = value;
  return st;
}

Result<std::string> IDss::DataPath() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<std::string>();
  const char* s = ctx_DSS_Get_DataPath(c->handle);
  return CheckedString(c, s);
}

Result<void> IDss::SetDataPath(const std::string& path) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  Result<void> st = internal::ValidateText(path);
  if (!st) return st;
  ctx_DSS_Set_DataPath(c->handle, path.c_str());
  return c->CheckError();
}

Result<bool> IDss::ExtendedErrors() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<bool>();
  const uint16_t v = ctx_Error_Get_ExtendedErrors(c->handle);
  return CheckedBool(c, v);
}

Result<void> IDss::SetExtendedErrors(bool value) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  ctx_Error_Set_ExtendedErrors(c->handle, value ? 1 : 0);
  Result<void> st = c->CheckError();
  if (st) c->options.extended_errors = value;
  return st;
}

Result<bool> IDss::EarlyAbort() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<bool>();
  const uint16_t v = ctx_Error_Get_EarlyAbort(c->handle);
  return CheckedBool(c, v);
}

Result<void> IDss::SetEarlyAbort(bool value) {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<void>();
  ctx_Error_Set_EarlyAbort(c->handle, value ? 1 : 0);
  Result<void> st = c->CheckError();
  if (st) c->options.early_abort = value;
  return st;
}

Result<Context> IDss::NewContext() const {
  internal::ContextImpl* c = ctx_->Internal();
  if (!c) return NotInitialized<Context>();
  // Settings may have been changed through another wrapper of the same
  // instance, so take them from the engine.
  Result<ContextOptions> opts = c->ReadOptions();
  if (!opts) return Result<Context>::ErrorFrom(opts);
  return Context::Create(opts.Value());
}

}  // namespace dsscpp
