/***
 * Name: pytgen::validate::CleanCandidate
 * Purpose: Strip chat-style wrapping from generated test code.
 * Inputs: raw candidate text
 * Outputs: code ready for validation
 * Theory of Operation: trim; unwrap one ``` fenced block (the opener may carry
 *   a language tag); drop a closed <think>...</think> span; trim again.
 */
#pragma once

#include <string>

namespace pytgen::validate {

std::string CleanCandidate(const std::string& raw);

} // namespace pytgen::validate
