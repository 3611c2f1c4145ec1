#include "marshal.hpp"

#include <inttypes.h>
#include <stdio.h>

#include <string>
#include <utility>

namespace dsscpp {
namespace internal {

Result<std::vector<std::complex<double>>> ComplexArray(const double* data,
                                                       int32_t n) {
  typedef std::vector<std::complex<double>> Vec;
  if (n <= 1 || !data) return Result<Vec>::Ok(Vec());
  if (n % 2 != 0) {
    return Result<Vec>::Error(ErrorCode::kMarshalError, [n] {
      char buf[96];
      snprintf(buf, sizeof(buf),
               "Odd number of doubles (%" PRId32 ") for complex array", n);
      return std::string(buf);
    });
  }
  Vec out;
  out.reserve(static_cast<size_t>(n / 2));
  for (int32_t i = 0; i < n; i += 2) {
    out.push_back(std::complex<double>(data[i], data[i + 1]));
  }
  return Result<Vec>::Ok(std::move(out));
}

Result<std::complex<double>> ComplexScalar(const double* data, int32_t n) {
  if (n != 2 || !data) {
    return Result<std::complex<double>>::Error(ErrorCode::kMarshalError, [n] {
      char buf[96];
      snprintf(buf, sizeof(buf),
               "Expected 2 doubles for a complex value, got %" PRId32, n);
      return std::string(buf);
    });
  }
  return Result<std::complex<double>>::Ok(
      std::complex<double>(data[0], data[1]));
}

Result<void> CheckPairCount(size_t n) {
  if (n % 2 == 0) return Result<void>::Ok();
  return Result<void>::Error(ErrorCode::kMarshalError, [n] {
    char buf[96];
    snprintf(buf, sizeof(buf), "Odd number of values (%zu) for mag/angle", n);
    return std::string(buf);
  });
}

}  // namespace internal
}  // namespace dsscpp
