#include "pytgen/driver/app.h"

#include <cstdlib>
#include <filesystem>
#include <vector>

namespace pytgen::driver {

auto BuildResolver(const CliOptions& opts, const validate::ValidatorConfig& config)
    -> std::shared_ptr<const validate::ModuleResolver> {
  auto known = std::make_shared<validate::StaticModuleResolver>(validate::DefaultModuleNames(config.frameworkNames));
  for (const auto& name : opts.known_modules) known->add(name);

  std::vector<std::filesystem::path> dirs(opts.module_paths.begin(), opts.module_paths.end());
  if (const char* env = std::getenv("PYTHONPATH"); env != nullptr) {
    const std::string value{env};
    std::size_t start = 0;
    while (start <= value.size()) {
      const auto colon = value.find(':', start);
      const std::string entry = value.substr(start, colon == std::string::npos ? std::string::npos : colon - start);
      if (!entry.empty()) dirs.emplace_back(entry);
      if (colon == std::string::npos) break;
      start = colon + 1;
    }
  }
  if (dirs.empty()) return known;
  return std::make_shared<validate::ChainModuleResolver>(std::vector<std::shared_ptr<const validate::ModuleResolver>>{
      known, std::make_shared<validate::SearchPathModuleResolver>(std::move(dirs))});
}

}  // namespace pytgen::driver
