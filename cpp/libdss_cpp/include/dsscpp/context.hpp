/**
 * @file context.hpp
 * @brief C++11 RAII interface for DSS C-API engine contexts.
 *
 * A Context owns one isolated instance of the DSS engine. Construction
 * allocates and starts the instance; destruction disposes it exactly once.
 * Every binding call issued against a Context reads and clears the
 * context's last-error state before returning, so an error is always
 * attributed to the call that raised it.
 *
 * Thread-safety
 * - A Context must be driven by one thread at a time. Do not share the
 *   same Context across threads without external sync.
 * - Distinct contexts share no state and may run fully in parallel, one
 *   per thread.
 *
 * Ownership model
 * - Create() returns an owned context. It is move-only; a moved-from
 *   Context is empty and its operations fail with kNotInitialized.
 * - Prime() wraps the engine's default instance, which the library creates
 *   when it is loaded. The wrapper never disposes it.
 *
 * Usage example
 * @code{.cpp}
 * auto r = dsscpp::Context::Create();
 * if (!r) { fprintf(stderr, "%s\n", r.Message().c_str()); return; }
 * dsscpp::Context ctx = r.MoveValue();
 * dsscpp::IDss dss(ctx);
 * auto cr = dss.Command("new circuit.demo");
 * if (!cr) { fprintf(stderr, "%s\n", cr.Message().c_str()); }
 * @endcode
 */
#pragma once

#include "dsscpp/error.hpp"
#include "dsscpp/result.hpp"

namespace dsscpp {

namespace internal {
struct ContextImpl;  // defined by the binding sources
}  // namespace internal

class IBus;
class ICircuit;
class ICktElement;
class IDss;
class ILoads;
class IMeters;
class ISolution;

/** @brief Engine settings applied to a context when it is created. */
struct ContextOptions {
  /** Allow the engine to change the process working directory. */
  bool allow_change_dir = true;
  /** Allow the engine to show UI forms (no effect on headless builds). */
  bool allow_forms = false;
  /** Report extended errors, e.g. for operations without an active object. */
  bool extended_errors = true;
  /** Abort a script on its first error. */
  bool early_abort = true;
};

class Context {
 public:
  Context();
  Context(Context&& other) noexcept;
  Context& operator=(Context&& other) noexcept;
  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;
  ~Context();

  /**
   * @brief Allocate and start a new engine instance.
   * @param options Settings applied before the context is returned.
   * @return Result<Context> owned context, or kInitializationFailed.
   */
  static Result<Context> Create(const ContextOptions& options = {});

  /**
   * @brief Wrap the engine's default (prime) instance.
   *
   * The prime instance is started at most once per process. The returned
   * wrapper does not own the instance.
   */
  static Result<Context> Prime();

  /** @brief True if this wrapper holds an engine instance. */
  explicit operator bool() const;

  /** @brief True for the engine's default instance. */
  bool IsPrime() const;

  /**
   * @brief Options this context was created with, or the prime instance's
   * settings at the time it was wrapped. Updated by the IDss setters.
   */
  const ContextOptions& Options() const;

  /**
   * @brief Dispose the engine instance (if owned) and empty this wrapper.
   * Safe to call multiple times.
   */
  void Reset();

  /** @name Diagnostics */
  ///@{
  /** @brief Raw engine handle, for diagnostics only. */
  const void* Handle() const;
  void Dump() const;
  ///@}

 private:
  friend class IBus;
  friend class ICircuit;
  friend class ICktElement;
  friend class IDss;
  friend class ILoads;
  friend class IMeters;
  friend class ISolution;

  explicit Context(internal::ContextImpl* impl);

  // Internal state; nullptr for an empty context.
  internal::ContextImpl* Internal() const { return impl_; }

  internal::ContextImpl* impl_;
};

}  // namespace dsscpp
