#include "pytgen/stages/file_reader.h"

#include "pytgen/exceptions/not_found_error.h"

#include <string>

namespace pytgen::stages {

auto FileReader::ReadOrThrow(const std::string& path) -> std::string {
  std::string text;
  std::string err;
  if (!Read(path, text, err)) {
    throw exceptions::NotFoundError(err);
  }
  return text;
}

}  // namespace pytgen::stages
