/***
 * Name: pytgen::driver::LoadContext
 * Purpose: Extract one signature from a source file to serve as validation context.
 * Inputs: "<file.py>:<name>" where name is "func" or "Class.method"
 * Outputs: the matching CallableSignature (first match in discovery order)
 */
#include "pytgen/driver/app.h"

#include "pytgen/exceptions/config_error.h"
#include "pytgen/stages/extractor.h"
#include "pytgen/stages/file_reader.h"

namespace pytgen::driver {

auto LoadContext(const std::string& context) -> extract::CallableSignature {
  const auto colon = context.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == context.size()) {
    throw exceptions::ConfigError("invalid --context '" + context + "' (expected <file.py>:<name>)");
  }
  const std::string path = context.substr(0, colon);
  const std::string name = context.substr(colon + 1);
  const auto result = stages::Extractor::Run(stages::FileReader::ReadOrThrow(path), path);

  const auto dot = name.find('.');
  if (dot == std::string::npos) {
    for (const auto& fn : result.functions) {
      if (fn.name == name) return fn;
    }
  } else {
    const std::string className = name.substr(0, dot);
    const std::string methodName = name.substr(dot + 1);
    for (const auto& cls : result.classes) {
      if (cls.name != className) continue;
      for (const auto& m : cls.methods) {
        if (m.name == methodName) return m;
      }
    }
  }
  throw exceptions::ConfigError("no function '" + name + "' in " + path);
}

}  // namespace pytgen::driver
