// Active bus interface.
#pragma once

#include <stdint.h>

#include <complex>
#include <string>
#include <vector>

#include "dsscpp/context.hpp"
#include "dsscpp/result.hpp"

namespace dsscpp {

class IBus {
 public:
  explicit IBus(Context& ctx) : ctx_(&ctx) {}

  Result<std::string> Name() const;
  Result<int32_t> NumNodes() const;
  Result<double> KVBase() const;
  Result<std::vector<int32_t>> Nodes() const;
  Result<std::vector<std::complex<double>>> Voltages() const;
  /** @brief Magnitude (pu) and angle (deg) pairs, one per node. */
  Result<std::vector<double>> PuVmagAngle() const;

  Result<double> X() const;
  Result<void> SetX(double x);
  Result<double> Y() const;
  Result<void> SetY(double y);
  Result<bool> Coorddefined() const;

 private:
  Context* ctx_;
};

}  // namespace dsscpp
