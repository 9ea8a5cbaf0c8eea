#pragma once

#include <stdexcept>
#include <string>

namespace sonnetio {

/// Thrown when an input file is malformed or uses a structure the readers do
/// not understand (bad extension, bad dimension arithmetic, truncated lines).
class FormatError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Thrown for recognised but unsupported file features, e.g. Touchstone
/// mixed-mode data.
class UnsupportedFormatError : public FormatError {
public:
  using FormatError::FormatError;
};

/// Thrown by dialect readers that are named but not implemented.
class NotImplementedError : public std::logic_error {
public:
  explicit NotImplementedError(const std::string &what)
      : std::logic_error(what + " is not implemented") {}
};

} // namespace sonnetio
