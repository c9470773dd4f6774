/***
 * Name: pytgen::stages::FileReader
 * Purpose: Stage class for reading an input source file.
 * Inputs: Filesystem path
 * Outputs: Source string
 * Theory of Operation: Wraps support::ReadFile and instruments metrics via RAII.
 */
#pragma once

#include <string>

#include "pytgen/metrics/metrics.h"

namespace pytgen {
namespace stages {

class FileReader : public metrics::Metrics {
 public:
  /*** Read: Read file at path into out_src. */
  static bool Read(const std::string& path, std::string& out_src, std::string& err);

  /*** ReadOrThrow: Read file at path; exceptions::NotFoundError on failure. */
  static std::string ReadOrThrow(const std::string& path);
};

}  // namespace stages
}  // namespace pytgen
