/***
 * Name: pytgen::support::AppendFile
 * Purpose: Append a string to the end of a file.
 * Inputs:
 *   - path: filesystem path to append to
 *   - data: content to write
 * Outputs:
 *   - err: error message on failure
 * Theory of Operation: Uses std::ofstream in append mode and checks .good().
 */
#include "pytgen/support/fs.h"

#include <fstream>
#include <ios>
#include <string>

namespace pytgen {
namespace support {

bool AppendFile(const std::string& path, const std::string& data, std::string& err) {
  std::ofstream file_stream(path, std::ios::binary | std::ios::app);
  if (!file_stream.good()) {
    err = "failed to open file for append: " + path;
    return false;
  }
  file_stream << data;
  if (!file_stream.good()) {
    err = "failed to write file: " + path;
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace pytgen
