/***
 * Name: pytgen::exceptions::NotFoundError
 * Purpose: Exception for a source identifier that cannot be opened or read.
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

class NotFoundError : public PytgenException {
 public:
  explicit NotFoundError(std::string msg) noexcept : PytgenException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pytgen
