/***
 * Name: pytgen::support::JsonEscape
 * Purpose: Escape a UTF-8 string for use inside a JSON string literal.
 * Inputs: raw text
 * Outputs: escaped text (quotes not included)
 * Theory of Operation: Escapes quote, backslash and control characters; other
 *   bytes, including multi-byte UTF-8 sequences, pass through.
 */
#pragma once

#include <string>

namespace pytgen {
namespace support {

std::string JsonEscape(const std::string& str);

}  // namespace support
}  // namespace pytgen
