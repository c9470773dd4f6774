#include "pytgen/driver/app.h"

namespace pytgen::driver {

auto RunCommand(const CliOptions& opts, std::ostream& out, std::ostream& err) -> int {
  switch (opts.command) {
    case CliOptions::Command::Extract: return RunExtract(opts, out, err);
    case CliOptions::Command::Validate: return RunValidate(opts, out, err);
    case CliOptions::Command::Clean: return RunClean(opts, out);
    case CliOptions::Command::None: break;
  }
  err << "pytgen: error: no command given" << '\n';
  return 2;
}

}  // namespace pytgen::driver
