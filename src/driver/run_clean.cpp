#include "pytgen/driver/app.h"

#include "pytgen/stages/file_reader.h"
#include "pytgen/stages/validator.h"

namespace pytgen::driver {

auto RunClean(const CliOptions& opts, std::ostream& out) -> int {
  out << stages::Validator::Clean(stages::FileReader::ReadOrThrow(opts.input)) << '\n';
  return 0;
}

}  // namespace pytgen::driver
