#pragma once

#include <stdexcept>
#include <string>

namespace netdispatch::core {

// Dispatch errors are terminal for one call and are never retried.
struct DispatchError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct RegistrationError : public DispatchError {
  using DispatchError::DispatchError;
};

struct ArgumentResolutionError : public DispatchError {
  using DispatchError::DispatchError;
};

struct BackendMismatchError : public DispatchError {
  using DispatchError::DispatchError;
};

struct BackendUnavailableError : public DispatchError {
  using DispatchError::DispatchError;
};

struct NotImplementedByBackendError : public DispatchError {
  using DispatchError::DispatchError;
};

// Soft failure raised only while forcing conversions through a backend other
// than the reference backend: marks a known gap, not a broken run.
struct ExpectedFailure : public NotImplementedByBackendError {
  using NotImplementedByBackendError::NotImplementedByBackendError;
};

struct ConfigValidationError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct ConfigKeyError : public ConfigValidationError {
  using ConfigValidationError::ConfigValidationError;
};

struct ConfigTypeError : public ConfigValidationError {
  using ConfigValidationError::ConfigValidationError;
};

struct ConfigValueError : public ConfigValidationError {
  using ConfigValidationError::ConfigValidationError;
};

} // namespace netdispatch::core
