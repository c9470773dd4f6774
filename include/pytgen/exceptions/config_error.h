/***
 * Name: pytgen::exceptions::ConfigError
 * Purpose: Exception for configuration and option errors.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PytgenException.
 */
#pragma once

#include <string>
#include <utility>

#include "pytgen/exceptions/pytgen_exception.h"

namespace pytgen {
namespace exceptions {

class ConfigError : public PytgenException {
 public:
  explicit ConfigError(std::string msg) noexcept : PytgenException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pytgen
