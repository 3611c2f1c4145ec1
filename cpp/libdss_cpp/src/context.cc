#include "dsscpp/context.hpp"

#include <dss_capi_ctx.h>
#include <inttypes.h>
#include <stdio.h>
#include <string.h>

#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "context_impl.hpp"

namespace dsscpp {

namespace {

using internal::ContextImpl;

std::once_flag g_prime_once;
bool g_prime_started = false;

// ctx_New/ctx_Get_Prime return const-qualified handles in some engine
// releases; every ctx_* entry point accepts a plain pointer.
void* ToHandle(const void* ctx) { return const_cast<void*>(ctx); }

// Binds the cached engine pointers of an already started instance.
void BindPointers(ContextImpl* impl) {
  char*** data_ppchar = nullptr;
  int32_t* count_ppchar = nullptr;
  ctx_DSS_GetGRPointers(impl->handle, &data_ppchar, &impl->data_pdouble,
                        &impl->data_pinteger, &impl->data_pbyte,
                        &count_ppchar, &impl->count_pdouble,
                        &impl->count_pinteger, &impl->count_pbyte);
  impl->error_number = ctx_Error_Get_NumberPtr(impl->handle);
}

Result<void> ApplyOptions(ContextImpl* impl) {
  const ContextOptions& o = impl->options;
  ctx_DSS_Set_AllowChangeDir(impl->handle, o.allow_change_dir ? 1 : 0);
  Result<void> st = impl->CheckError();
  if (!st) return st;
  ctx_DSS_Set_AllowForms(impl->handle, o.allow_forms ? 1 : 0);
  st = impl->CheckError();
  if (!st) return st;
  ctx_Error_Set_ExtendedErrors(impl->handle, o.extended_errors ? 1 : 0);
  st = impl->CheckError();
  if (!st) return st;
  ctx_Error_Set_EarlyAbort(impl->handle, o.early_abort ? 1 : 0);
  return impl->CheckError();
}

// Setup failures keep the engine number in the message.
Result<Context> SetupFailed(const Result<void>& st) {
  const int32_t number = st.EngineCode();
  const std::string message = st.Message();
  return Result<Context>::Error(
      ErrorCode::kInitializationFailed, [number, message] {
        char buf[64];
        snprintf(buf, sizeof(buf), "Context setup failed (#%" PRId32 "): ",
                 number);
        return std::string(buf) + message;
      });
}

}  // namespace

namespace internal {

Result<void> ContextImpl::CheckError() const {
  if (!error_number || *error_number == 0) {
    return Result<void>::Ok();
  }
  const int32_t number = *error_number;
  const char* desc = ctx_Error_Get_Description(handle);
  std::string message(desc ? desc : "");
  *error_number = 0;
  return Result<void>::EngineError(number, std::move(message));
}

Result<std::vector<double>> ContextImpl::Float64ArrayGR() const {
  Result<void> st = CheckError();
  if (!st) return Result<std::vector<double>>::ErrorFrom(st);
  return Result<std::vector<double>>::Ok(
      CopyArray(data_pdouble ? *data_pdouble : nullptr,
                count_pdouble ? count_pdouble[0] : 0));
}

Result<std::vector<int32_t>> ContextImpl::Int32ArrayGR() const {
  Result<void> st = CheckError();
  if (!st) return Result<std::vector<int32_t>>::ErrorFrom(st);
  return Result<std::vector<int32_t>>::Ok(
      CopyArray(data_pinteger ? *data_pinteger : nullptr,
                count_pinteger ? count_pinteger[0] : 0));
}

Result<std::vector<int8_t>> ContextImpl::Int8ArrayGR() const {
  Result<void> st = CheckError();
  if (!st) return Result<std::vector<int8_t>>::ErrorFrom(st);
  return Result<std::vector<int8_t>>::Ok(
      CopyArray(data_pbyte ? *data_pbyte : nullptr,
                count_pbyte ? count_pbyte[0] : 0));
}

Result<std::vector<std::complex<double>>> ContextImpl::ComplexArrayGR()
    const {
  Result<void> st = CheckError();
  if (!st) {
    return Result<std::vector<std::complex<double>>>::ErrorFrom(st);
  }
  return ComplexArray(data_pdouble ? *data_pdouble : nullptr,
                      count_pdouble ? count_pdouble[0] : 0);
}

Result<std::complex<double>> ContextImpl::ComplexSimpleGR() const {
  Result<void> st = CheckError();
  if (!st) return Result<std::complex<double>>::ErrorFrom(st);
  return ComplexScalar(data_pdouble ? *data_pdouble : nullptr,
                       count_pdouble ? count_pdouble[0] : 0);
}

Result<ContextOptions> ContextImpl::ReadOptions() const {
  ContextOptions o;
  o.allow_change_dir = ctx_DSS_Get_AllowChangeDir(handle) != 0;
  Result<void> st = CheckError();
  if (!st) return Result<ContextOptions>::ErrorFrom(st);
  o.allow_forms = ctx_DSS_Get_AllowForms(handle) != 0;
  st = CheckError();
  if (!st) return Result<ContextOptions>::ErrorFrom(st);
  o.extended_errors = ctx_Error_Get_ExtendedErrors(handle) != 0;
  st = CheckError();
  if (!st) return Result<ContextOptions>::ErrorFrom(st);
  o.early_abort = ctx_Error_Get_EarlyAbort(handle) != 0;
  st = CheckError();
  if (!st) return Result<ContextOptions>::ErrorFrom(st);
  return Result<ContextOptions>::Ok(o);
}

}  // namespace internal

Context::Context() : impl_(nullptr) {}

Context::Context(ContextImpl* impl) : impl_(impl) {}

Context::Context(Context&& other) noexcept : impl_(other.impl_) {
  other.impl_ = nullptr;
}

Context& Context::operator=(Context&& other) noexcept {
  if (this != &other) {
    Reset();
    impl_ = other.impl_;
    other.impl_ = nullptr;
  }
  return *this;
}

Context::~Context() { Reset(); }

void Context::Reset() {
  if (!impl_) return;

  // Detach first so a second Reset() can never dispose twice.
  ContextImpl* local_impl = impl_;
  impl_ = nullptr;

  if (local_impl->owned && local_impl->handle) {
    ctx_Dispose(local_impl->handle);
  }
  delete local_impl;
}

Result<Context> Context::Create(const ContextOptions& options) {
  void* h = ToHandle(ctx_New());
  if (!h) {
    return Result<Context>::Error(ErrorCode::kInitializationFailed, [] {
      return std::string("ctx_New failed");
    });
  }
  std::unique_ptr<ContextImpl> impl(new ContextImpl());
  impl->handle = h;
  impl->owned = true;
  impl->options = options;
  // From here on the Context owns the handle and disposes it on any exit.
  Context ctx(impl.release());

  if (ctx_DSS_Start(h, 0) == 0) {
    return Result<Context>::Error(ErrorCode::kInitializationFailed, [] {
      return std::string("ctx_DSS_Start failed");
    });
  }
  BindPointers(ctx.impl_);
  if (!ctx.impl_->error_number) {
    return Result<Context>::Error(ErrorCode::kInitializationFailed, [] {
      return std::string("ctx_Error_Get_NumberPtr returned null");
    });
  }
  Result<void> st = ctx.impl_->CheckError();
  if (st) st = ApplyOptions(ctx.impl_);
  if (!st) return SetupFailed(st);
  return Result<Context>::Ok(std::move(ctx));
}

Result<Context> Context::Prime() {
  void* h = ToHandle(ctx_Get_Prime());
  if (!h) {
    return Result<Context>::Error(ErrorCode::kInitializationFailed, [] {
      return std::string("ctx_Get_Prime returned null");
    });
  }
  std::call_once(g_prime_once,
                 [h] { g_prime_started = ctx_DSS_Start(h, 0) != 0; });
  if (!g_prime_started) {
    return Result<Context>::Error(ErrorCode::kInitializationFailed, [] {
      return std::string("ctx_DSS_Start failed for the prime context");
    });
  }
  std::unique_ptr<ContextImpl> impl(new ContextImpl());
  impl->handle = h;
  impl->owned = false;
  BindPointers(impl.get());
  if (!impl->error_number) {
    return Result<Context>::Error(ErrorCode::kInitializationFailed, [] {
      return std::string("ctx_Error_Get_NumberPtr returned null");
    });
  }
  // A record left by start-up, or by earlier raw use of the shared
  // instance, belongs to no call of this wrapper.
  Result<void> st = impl->CheckError();
  if (!st) return SetupFailed(st);
  // The prime instance may already be configured; mirror its settings.
  Result<ContextOptions> opts = impl->ReadOptions();
  if (!opts) return SetupFailed(Result<void>::ErrorFrom(opts));
  impl->options = opts.Value();
  return Result<Context>::Ok(Context(impl.release()));
}

Context::operator bool() const { return impl_ && impl_->handle; }

bool Context::IsPrime() const {
  return impl_ && impl_->handle == ToHandle(ctx_Get_Prime());
}

const ContextOptions& Context::Options() const {
  static const ContextOptions kDefaults;
  return impl_ ? impl_->options : kDefaults;
}

const void* Context::Handle() const { return impl_ ? impl_->handle : nullptr; }

void Context::Dump() const {
  if (!impl_ || !impl_->handle) {
    printf("[Context] empty\n");
    return;
  }
  printf("[Context] handle=%p owned=%s prime=%s\n", impl_->handle,
         impl_->owned ? "yes" : "no", IsPrime() ? "yes" : "no");
  const int32_t pending = impl_->error_number ? *impl_->error_number : 0;
  printf("  pending error=%" PRId32 "\n", pending);
  if (pending != 0) {
    // Leave the pending record for the caller's next check.
    return;
  }
  const char* version = ctx_DSS_Get_Version(impl_->handle);
  printf("  version=%s\n", version ? version : "(null)");
  Result<void> st = impl_->CheckError();
  if (!st) {
    printf("  version query failed: %s\n", st.Message().c_str());
  }
}

namespace internal {

Result<void> ValidateText(const std::string& text) {
  const size_t nul = text.find('\0');
  if (nul == std::string::npos) return Result<void>::Ok();
  return Result<void>::Error(ErrorCode::kMarshalError, [nul] {
    char buf[96];
    snprintf(buf, sizeof(buf), "Embedded NUL at offset %zu in text argument",
             nul);
    return std::string(buf);
  });
}

void StringArrayBuffer::Release() {
  if (data_) {
    DSS_Dispose_PPAnsiChar(&data_, count_[1]);
    data_ = nullptr;
  }
  count_[0] = count_[1] = 0;
}

Result<std::vector<std::string>> StringArrayBuffer::Checked(
    const internal::ContextImpl* impl) {
  Result<void> st = impl->CheckError();
  if (!st) {
    Release();
    return Result<std::vector<std::string>>::ErrorFrom(st);
  }
  std::vector<std::string> out;
  const int32_t n = count_[0];
  if (data_ && n > 0) {
    out.reserve(static_cast<size_t>(n));
    for (int32_t i = 0; i < n; ++i) {
      out.push_back(std::string(data_[i] ? data_[i] : ""));
    }
  }
  Release();
  return Result<std::vector<std::string>>::Ok(std::move(out));
}

StringArrayInput::StringArrayInput(const std::vector<std::string>& values) {
  ptrs_.reserve(values.size());
  for (size_t i = 0; i < values.size(); ++i) {
    ptrs_.push_back(values[i].c_str());
  }
}

}  // namespace internal
}  // namespace dsscpp
