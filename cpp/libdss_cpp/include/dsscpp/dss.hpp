/**
 * @file dss.hpp
 * @brief Root interface of a DSS engine context.
 *
 * IDss is a lightweight view over a Context. It exposes the engine's
 * script interface (text commands), session-wide settings and the active
 * circuit. Views hold a pointer to the context and must not outlive it.
 *
 * @code{.cpp}
 * dsscpp::IDss dss(ctx);
 * auto r = dss.Command("redirect IEEE13Nodeckt.dss");
 * if (!r) {
 *   fprintf(stderr, "(#%d) %s\n", r.EngineCode(), r.Message().c_str());
 * }
 * auto name = dss.ActiveCircuit().Name();
 * @endcode
 */
#pragma once

#include <stdint.h>

#include <string>
#include <vector>

#include "dsscpp/circuit.hpp"
#include "dsscpp/context.hpp"
#include "dsscpp/result.hpp"

namespace dsscpp {

class IDss {
 public:
  explicit IDss(Context& ctx) : ctx_(&ctx) {}

  /** @name Text interface */
  ///@{
  /**
   * @brief Run one engine command (or a newline separated script).
   * @return Result<void> engine error of the command, if any.
   */
  Result<void> Command(const std::string& command);

  /** @brief Run each command of the list in order. */
  Result<void> Commands(const std::vector<std::string>& commands);

  /** @brief Run a multi-line block of commands as a single call. */
  Result<void> CommandBlock(const std::string& block);

  /** @brief Text result of the last command (e.g. from "? object.prop"). */
  Result<std::string> TextResult() const;
  ///@}

  /** @name Session */
  ///@{
  Result<std::string> Version() const;
  Result<void> ClearAll();
  Result<void> Reset();
  Result<int32_t> NumCircuits() const;
  /** @brief Names of all registered element classes. */
  Result<std::vector<std::string>> Classes() const;
  ///@}

  /** @name Settings */
  ///@{
  Result<bool> AllowChangeDir() const;
  Result<void> SetAllowChangeDir(bool value);
  Result<bool> AllowForms() const;
  Result<void> SetAllowForms(bool value);
  Result<std::string> DataPath() const;
  Result<void> SetDataPath(const std::string& path);
  Result<bool> ExtendedErrors() const;
  Result<void> SetExtendedErrors(bool value);
  Result<bool> EarlyAbort() const;
  Result<void> SetEarlyAbort(bool value);
  ///@}

  /**
   * @brief Create a new, independent engine context.
   *
   * The new context is owned by the caller and starts with the options of
   * this one. It may be moved to another thread.
   */
  Result<Context> NewContext() const;

  ICircuit ActiveCircuit() const { return ICircuit(*ctx_); }

 private:
  Context* ctx_;
};

}  // namespace dsscpp
