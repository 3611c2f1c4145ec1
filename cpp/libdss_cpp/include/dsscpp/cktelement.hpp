// Active circuit element interface.
#pragma once

#include <stdint.h>

#include <complex>
#include <string>
#include <vector>

#include "dsscpp/context.hpp"
#include "dsscpp/result.hpp"

namespace dsscpp {

class ICktElement {
 public:
  explicit ICktElement(Context& ctx) : ctx_(&ctx) {}

  Result<std::string> Name() const;
  Result<int32_t> NumPhases() const;
  Result<int32_t> NumTerminals() const;
  Result<std::vector<std::string>> BusNames() const;
  /** @brief Property names of the element's class, in index order. */
  Result<std::vector<std::string>> AllPropertyNames() const;

  Result<bool> Enabled() const;
  Result<void> SetEnabled(bool enabled);

  /** @brief Complex voltages at each conductor of each terminal. */
  Result<std::vector<std::complex<double>>> Voltages() const;
  Result<std::vector<std::complex<double>>> Currents() const;
  /** @brief Complex powers (kW, kvar) per conductor. */
  Result<std::vector<std::complex<double>>> Powers() const;
  Result<std::vector<int32_t>> NodeOrder() const;

 private:
  Context* ctx_;
};

}  // namespace dsscpp
