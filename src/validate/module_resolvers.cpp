/***
 * Name: pytgen::validate module resolvers
 * Purpose: Static table, directory search and chained resolution.
 */
#include "validate/ModuleResolver.h"

#include <string>
#include <system_error>

namespace pytgen::validate {

namespace {

std::string topLevel(const std::string& module) {
  const auto dot = module.find('.');
  return dot == std::string::npos ? module : module.substr(0, dot);
}

// "a.b.c" -> a/b/c
std::filesystem::path relativePathOf(const std::string& module) {
  std::filesystem::path rel;
  std::size_t start = 0;
  while (true) {
    const auto dot = module.find('.', start);
    rel /= module.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
    if (dot == std::string::npos) break;
    start = dot + 1;
  }
  return rel;
}

bool hasExtensionModule(const std::filesystem::path& dir, const std::string& stem) {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) return false;
  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (name.size() >= stem.size() + 3 && name.compare(0, stem.size() + 1, stem + ".") == 0 &&
        name.compare(name.size() - 3, 3, ".so") == 0) {
      return true;
    }
  }
  return false;
}

} // namespace

std::set<std::string> DefaultModuleNames(const std::vector<std::string>& frameworkNames) {
  std::set<std::string> names = StdlibModuleNames();
  for (const auto& framework : frameworkNames) {
    if (!framework.empty()) names.insert(topLevel(framework));
  }
  return names;
}

bool StaticModuleResolver::resolves(const std::string& module) const {
  return names_.count(module) != 0 || names_.count(topLevel(module)) != 0;
}

bool SearchPathModuleResolver::resolves(const std::string& module) const {
  if (module.empty()) return false;
  const std::filesystem::path rel = relativePathOf(module);
  const std::string stem = rel.filename().string();
  std::error_code ec;
  for (const auto& dir : dirs_) {
    const std::filesystem::path base = dir / rel;
    if (std::filesystem::is_regular_file(base.string() + ".py", ec)) return true;
    if (std::filesystem::is_directory(base, ec)) return true; // regular or namespace package
    if (hasExtensionModule(base.parent_path(), stem)) return true;
  }
  return false;
}

bool ChainModuleResolver::resolves(const std::string& module) const {
  for (const auto& member : members_) {
    if (member && member->resolves(module)) return true;
  }
  return false;
}

} // namespace pytgen::validate
