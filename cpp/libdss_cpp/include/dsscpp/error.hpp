// Error codes and helpers for dsscpp C++ API
#pragma once

#include <string>

namespace dsscpp {

enum class ErrorCode {
  kSuccess = 0,

  // General errors (1-99)
  kInvalidArgument = 1,
  kNotInitialized = 2,

  // Context lifecycle errors (100-199)
  kInitializationFailed = 100,

  // Engine errors (200-299). The engine's own error number travels in
  // Result::EngineCode().
  kEngineError = 200,

  // Marshaling errors (300-399)
  kMarshalError = 300,

  // Unknown
  kUnknown = 999
};

// Convert ErrorCode to short, stable English text. The returned string is a
// static literal and does not require lifetime management.
inline const char* ErrorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kNotInitialized:
      return "Not initialized";
    case ErrorCode::kInitializationFailed:
      return "Engine initialization failed";
    case ErrorCode::kEngineError:
      return "Engine error";
    case ErrorCode::kMarshalError:
      return "Marshal error";
    case ErrorCode::kUnknown:
    default:
      return "Unknown error";
  }
}

}  // namespace dsscpp
