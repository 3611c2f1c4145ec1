// Conversions from engine result buffers to owned C++ values. Nothing here
// calls the engine; the callers check the context error first.
#pragma once

#include <stddef.h>
#include <stdint.h>

#include <complex>
#include <vector>

#include "dsscpp/result.hpp"

namespace dsscpp {
namespace internal {

// Copies the first n elements; a null buffer or n <= 0 yields an empty
// vector.
template <typename T>
std::vector<T> CopyArray(const T* data, int32_t n) {
  if (!data || n <= 0) return std::vector<T>();
  return std::vector<T>(data, data + n);
}

/**
 * Pairs n doubles into complex values. A count of 0 or 1 is the engine's
 * empty array (one placeholder value); any other odd count is a
 * kMarshalError.
 */
Result<std::vector<std::complex<double>>> ComplexArray(const double* data,
                                                       int32_t n);

// A complex scalar needs exactly two doubles.
Result<std::complex<double>> ComplexScalar(const double* data, int32_t n);

// Arrays of (magnitude, angle) pairs must hold an even count.
Result<void> CheckPairCount(size_t n);

}  // namespace internal
}  // namespace dsscpp
