// Energy meter interface of the active circuit.
#pragma once

#include <stdint.h>

#include <string>
#include <vector>

#include "dsscpp/context.hpp"
#include "dsscpp/result.hpp"

namespace dsscpp {

class IMeters {
 public:
  explicit IMeters(Context& ctx) : ctx_(&ctx) {}

  /** @brief Activate the first meter; returns 0 if there is none. */
  Result<int32_t> First();
  /** @brief Activate the next meter; returns 0 past the last one. */
  Result<int32_t> Next();
  Result<int32_t> Count() const;
  Result<std::string> Name() const;
  Result<void> SetName(const std::string& name);

  Result<void> ResetAll();
  Result<void> SampleAll();

  /** @brief Register names; indices match RegisterValues() and Totals(). */
  Result<std::vector<std::string>> RegisterNames() const;
  Result<std::vector<double>> RegisterValues() const;
  /** @brief Register totals across all meters. */
  Result<std::vector<double>> Totals() const;

 private:
  Context* ctx_;
};

}  // namespace dsscpp
