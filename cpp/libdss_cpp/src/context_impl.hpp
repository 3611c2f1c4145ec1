// Internal context state and marshaling helpers shared by the binding
// sources. Not installed; only the dsscpp sources include DSS C-API headers.
#pragma once

#include <dss_capi_ctx.h>
#include <stdint.h>

#include <complex>
#include <string>
#include <utility>
#include <vector>

#include "dsscpp/context.hpp"
#include "dsscpp/result.hpp"
#include "marshal.hpp"

namespace dsscpp {
namespace internal {

struct ContextImpl {
  void* handle;
  bool owned;
  ContextOptions options;

  // Engine-owned pointers fetched once at construction.
  int32_t* error_number;
  double** data_pdouble;
  int32_t** data_pinteger;
  int8_t** data_pbyte;
  int32_t* count_pdouble;
  int32_t* count_pinteger;
  int32_t* count_pbyte;

  ContextImpl()
      : handle(nullptr),
        owned(false),
        error_number(nullptr),
        data_pdouble(nullptr),
        data_pinteger(nullptr),
        data_pbyte(nullptr),
        count_pdouble(nullptr),
        count_pinteger(nullptr),
        count_pbyte(nullptr) {}

  // Reads and clears the last-error record of this context.
  Result<void> CheckError() const;

  // Copies of the global-result (GR) buffers, checked for errors first.
  Result<std::vector<double>> Float64ArrayGR() const;
  Result<std::vector<int32_t>> Int32ArrayGR() const;
  Result<std::vector<int8_t>> Int8ArrayGR() const;
  Result<std::vector<std::complex<double>>> ComplexArrayGR() const;
  Result<std::complex<double>> ComplexSimpleGR() const;

  // Current engine settings of this instance, each read checked.
  Result<ContextOptions> ReadOptions() const;
};

template <typename T>
Result<T> NotInitialized() {
  return Result<T>::Error(ErrorCode::kNotInitialized, [] {
    return std::string("Context not initialized");
  });
}

template <typename T>
Result<T> Checked(const ContextImpl* impl, T value) {
  Result<void> st = impl->CheckError();
  if (!st) return Result<T>::ErrorFrom(st);
  return Result<T>::Ok(std::move(value));
}

inline Result<bool> CheckedBool(const ContextImpl* impl, uint16_t value) {
  return Checked<bool>(impl, value != 0);
}

inline Result<std::string> CheckedString(const ContextImpl* impl,
                                         const char* value) {
  Result<void> st = impl->CheckError();
  if (!st) return Result<std::string>::ErrorFrom(st);
  return Result<std::string>::Ok(std::string(value ? value : ""));
}

// Rejects strings the engine would silently truncate at an embedded NUL.
Result<void> ValidateText(const std::string& text);

/**
 * Owner of an engine-allocated string array (char** plus a 4-slot count).
 * The array is always released through DSS_Dispose_PPAnsiChar, including
 * when the call that filled it reported an error.
 */
class StringArrayBuffer {
 public:
  StringArrayBuffer() : data_(nullptr) {
    count_[0] = count_[1] = count_[2] = count_[3] = 0;
  }
  ~StringArrayBuffer() { Release(); }
  StringArrayBuffer(const StringArrayBuffer&) = delete;
  StringArrayBuffer& operator=(const StringArrayBuffer&) = delete;

  char*** DataPtr() { return &data_; }
  int32_t* CountPtr() { return count_; }

  // Checks the context error, then copies the strings out.
  Result<std::vector<std::string>> Checked(const ContextImpl* impl);

  void Release();

 private:
  char** data_;
  int32_t count_[4];
};

/** Keeps a vector of strings alive as a const char* array for one call. */
class StringArrayInput {
 public:
  explicit StringArrayInput(const std::vector<std::string>& values);

  const char** Data() { return ptrs_.empty() ? nullptr : &ptrs_[0]; }
  int32_t Count() const { return static_cast<int32_t>(ptrs_.size()); }

 private:
  std::vector<const char*> ptrs_;
};

}  // namespace internal
}  // namespace dsscpp
