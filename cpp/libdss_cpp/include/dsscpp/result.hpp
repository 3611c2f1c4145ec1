/**
 * @file result.hpp
 * @brief Result<T> carrying a value or a binding/engine error.
 *
 * Result<T> conveys success or failure of a call into the DSS engine. On
 * success it holds a value; on failure it carries an ErrorCode, the
 * engine's own error number (for ErrorCode::kEngineError) and a message.
 * Binding-side errors build their message lazily via a factory; engine
 * errors store the engine's description verbatim.
 *
 * Usage example
 * @code{.cpp}
 * dsscpp::Result<int32_t> r = circuit.NumBuses();
 * if (!r) {
 *   fprintf(stderr, "(#%d) %s\n", r.EngineCode(), r.Message().c_str());
 * }
 * int32_t n = r.MoveValue();
 * @endcode
 */
#pragma once

#include <stdint.h>

#include <functional>
#include <string>
#include <type_traits>
#include <utility>

#include "dsscpp/error.hpp"

namespace dsscpp {

namespace detail {
/** Stores error code, engine number and the (possibly lazy) message. */
struct ErrorDetail {
  ErrorCode code = ErrorCode::kSuccess;
  int32_t engine_code = 0;
  mutable std::string message;  // materialized on first access
  mutable std::function<std::string()> message_factory;  // may be empty

  ErrorDetail() = default;
  explicit ErrorDetail(ErrorCode c) : code(c) {}
  ErrorDetail(ErrorCode c, std::function<std::string()> factory)
      : code(c), message_factory(std::move(factory)) {}
  ErrorDetail(int32_t number, std::string msg)
      : code(ErrorCode::kEngineError),
        engine_code(number),
        message(std::move(msg)) {}

  const std::string& Message() const {
    if (message.empty() && message_factory) {
      message = message_factory();
      // release factory to free captured state
      message_factory = std::function<std::string()>();
    }
    return message;
  }
};
}  // namespace detail

/**
 * @brief Result type carrying either T or an error.
 * @tparam T Success value type.
 */
template <typename T>
class Result {
 public:
  /** Construct a successful Result with a copy of value. */
  Result(const T& value) : ok_(true), value_(value) {}
  /** Construct a successful Result moving the value. */
  Result(T&& value) : ok_(true), value_(std::move(value)) {}

  /** Construct an error Result with code and optional message factory. */
  Result(ErrorCode code, std::function<std::string()> msg_factory = {})
      : ok_(false), error_(code, std::move(msg_factory)) {}

  /** Create a success Result by moving the value. */
  static Result<T> Ok(T value) { return Result<T>(std::move(value)); }
  /** Create an error Result with code and optional message factory. */
  static Result<T> Error(ErrorCode code,
                         std::function<std::string()> msg_factory = {}) {
    return Result<T>(code, std::move(msg_factory));
  }
  /** Create an ErrorCode::kEngineError Result from the engine's record. */
  static Result<T> EngineError(int32_t number, std::string message) {
    Result<T> r(ErrorCode::kEngineError);
    r.error_ = detail::ErrorDetail(number, std::move(message));
    return r;
  }
  /** Carry the error of another (failed) Result over to this type. */
  template <typename U>
  static Result<T> ErrorFrom(const Result<U>& other) {
    Result<T> r(other.Code());
    r.error_ = other.Detail();
    return r;
  }

  explicit operator bool() const noexcept { return ok_; }

  /** @return ErrorCode::kSuccess on ok, otherwise the stored code. */
  ErrorCode Code() const noexcept {
    return ok_ ? ErrorCode::kSuccess : error_.code;
  }

  /** @return Engine error number; 0 unless Code() is kEngineError. */
  int32_t EngineCode() const noexcept {
    return ok_ ? 0 : error_.engine_code;
  }

  /**
   * @brief Retrieve the error message, constructing it on first use.
   * @note Returns an empty string on success.
   */
  const std::string& Message() const {
    static const std::string kEmpty;
    return ok_ ? kEmpty : error_.Message();
  }

  /** @name Value access (valid only when ok_) */
  ///@{
  T& Value() { return value_; }
  const T& Value() const { return value_; }

  T* operator->() { return &value_; }
  const T* operator->() const { return &value_; }

  T& operator*() { return value_; }
  const T& operator*() const { return value_; }

  /** Move the value out (valid only when ok_). */
  T&& MoveValue() { return std::move(value_); }
  ///@}

  /** Error record (valid only when !ok_). */
  const detail::ErrorDetail& Detail() const { return error_; }

 private:
  bool ok_ = false;
  T value_{};  // default-initialized; only used when ok_ == true
  detail::ErrorDetail error_{};  // only used when ok_ == false
};

/** Partial specialization for void results. */
template <>
class Result<void> {
 public:
  Result() : ok_(true) {}
  /** Error result with code and optional message factory. */
  explicit Result(ErrorCode code,
                  std::function<std::string()> msg_factory = {})
      : ok_(false), error_(code, std::move(msg_factory)) {}

  static Result<void> Ok() { return Result<void>(); }
  static Result<void> Error(ErrorCode code,
                            std::function<std::string()> msg_factory = {}) {
    return Result<void>(code, std::move(msg_factory));
  }
  static Result<void> EngineError(int32_t number, std::string message) {
    Result<void> r(ErrorCode::kEngineError);
    r.error_ = detail::ErrorDetail(number, std::move(message));
    return r;
  }
  template <typename U>
  static Result<void> ErrorFrom(const Result<U>& other) {
    Result<void> r(other.Code());
    r.error_ = other.Detail();
    return r;
  }

  explicit operator bool() const noexcept { return ok_; }

  /** @return ErrorCode::kSuccess on ok, otherwise the stored code. */
  ErrorCode Code() const noexcept {
    return ok_ ? ErrorCode::kSuccess : error_.code;
  }

  /** @return Engine error number; 0 unless Code() is kEngineError. */
  int32_t EngineCode() const noexcept {
    return ok_ ? 0 : error_.engine_code;
  }

  /**
   * @brief Retrieve the error message, constructing it on first use.
   * @note Returns an empty string on success.
   */
  const std::string& Message() const {
    static const std::string kEmpty;
    return ok_ ? kEmpty : error_.Message();
  }

  const detail::ErrorDetail& Detail() const { return error_; }

 private:
  bool ok_ = false;
  detail::ErrorDetail error_{};
};

}  // namespace dsscpp
