// Active circuit interface.
#pragma once

#include <stdint.h>

#include <complex>
#include <string>
#include <vector>

#include "dsscpp/bus.hpp"
#include "dsscpp/cktelement.hpp"
#include "dsscpp/context.hpp"
#include "dsscpp/loads.hpp"
#include "dsscpp/meters.hpp"
#include "dsscpp/result.hpp"
#include "dsscpp/solution.hpp"

namespace dsscpp {

class ICircuit {
 public:
  explicit ICircuit(Context& ctx) : ctx_(&ctx) {}

  Result<std::string> Name() const;
  Result<int32_t> NumBuses() const;
  Result<int32_t> NumNodes() const;
  Result<int32_t> NumCktElements() const;

  Result<std::vector<std::string>> AllBusNames() const;
  /** @brief Node names as "bus.node", in the engine's node order. */
  Result<std::vector<std::string>> AllNodeNames() const;
  Result<std::vector<std::string>> AllElementNames() const;

  /** @brief Node voltage magnitudes (V), same order as AllNodeNames(). */
  Result<std::vector<double>> AllBusVmag() const;
  /** @brief Node voltage magnitudes (pu), same order as AllNodeNames(). */
  Result<std::vector<double>> AllBusVmagPu() const;
  /** @brief Complex node voltages (V), same order as AllNodeNames(). */
  Result<std::vector<std::complex<double>>> AllBusVolts() const;

  /** @brief Total losses (W, var). */
  Result<std::complex<double>> Losses() const;
  /** @brief Total power entering the circuit (kW, kvar). */
  Result<std::complex<double>> TotalPower() const;

  /**
   * @brief Activate an element by full name ("class.name").
   * @return Element index, or a negative value if not found.
   */
  Result<int32_t> SetActiveElement(const std::string& full_name);
  /**
   * @brief Activate a bus by name.
   * @return Bus index, or a negative value if not found.
   */
  Result<int32_t> SetActiveBus(const std::string& name);

  ISolution Solution() const { return ISolution(*ctx_); }
  IMeters Meters() const { return IMeters(*ctx_); }
  ILoads Loads() const { return ILoads(*ctx_); }
  ICktElement ActiveCktElement() const { return ICktElement(*ctx_); }
  IBus ActiveBus() const { return IBus(*ctx_); }

 private:
  Context* ctx_;
};

}  // namespace dsscpp
