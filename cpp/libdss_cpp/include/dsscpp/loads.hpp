// Load interface of the active circuit.
#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "dsscpp/context.hpp"
#include "dsscpp/result.hpp"

namespace dsscpp {

class ILoads {
 public:
  /** Number of coefficients of the ZIP-V load model. */
  static const size_t kZIPVSize = 7;

  explicit ILoads(Context& ctx) : ctx_(&ctx) {}

  Result<int32_t> First();
  Result<int32_t> Next();
  Result<int32_t> Count() const;
  Result<std::vector<std::string>> AllNames() const;

  /** @brief Name of the active load. */
  Result<std::string> Name() const;
  /** @brief Activate a load by name; fails if it does not exist. */
  Result<void> SetName(const std::string& name);

  Result<double> KW() const;
  Result<void> SetKW(double kw);
  Result<double> Kvar() const;
  Result<void> SetKvar(double kvar);
  Result<double> PF() const;
  Result<void> SetPF(double pf);
  Result<int32_t> Model() const;
  Result<void> SetModel(int32_t model);

  Result<std::vector<double>> ZIPV() const;
  /**
   * @brief Set the ZIP-V coefficients of the active load.
   * @param zipv Exactly kZIPVSize values; other lengths are rejected with
   *        kMarshalError before reaching the engine.
   */
  Result<void> SetZIPV(const std::vector<double>& zipv);

 private:
  Context* ctx_;
};

}  // namespace dsscpp
