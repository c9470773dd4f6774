/***
 * Name: pytgen::validate::ModuleResolver
 * Purpose: Answer whether an imported module name can be found.
 * Inputs: dotted module name, e.g. "os.path"
 * Outputs: bool
 * Theory of Operation:
 *   The validator treats a resolver as an opaque synchronous oracle. Three
 *   implementations cover the usual policies: a fixed name table, a directory
 *   search like Python's sys.path scan, and a chain of the two.
 */
#pragma once

#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace pytgen::validate {

class ModuleResolver {
 public:
  virtual ~ModuleResolver() = default;
  [[nodiscard]] virtual bool resolves(const std::string& module) const = 0;
};

// Top-level names of the Python 3 standard library.
const std::set<std::string>& StdlibModuleNames();

// StdlibModuleNames plus the top-level package of each framework name
// ("unittest.mock" -> "unittest").
std::set<std::string> DefaultModuleNames(const std::vector<std::string>& frameworkNames);

// Exact match, or a dotted name whose top-level package is known.
class StaticModuleResolver final : public ModuleResolver {
 public:
  explicit StaticModuleResolver(std::set<std::string> names) : names_(std::move(names)) {}
  [[nodiscard]] bool resolves(const std::string& module) const override;
  void add(const std::string& name) { names_.insert(name); }

 private:
  std::set<std::string> names_;
};

// Looks for a/b.py, a/b/__init__.py, a/b/ or a/b*.so under each directory.
class SearchPathModuleResolver final : public ModuleResolver {
 public:
  explicit SearchPathModuleResolver(std::vector<std::filesystem::path> dirs) : dirs_(std::move(dirs)) {}
  [[nodiscard]] bool resolves(const std::string& module) const override;

 private:
  std::vector<std::filesystem::path> dirs_;
};

class ChainModuleResolver final : public ModuleResolver {
 public:
  explicit ChainModuleResolver(std::vector<std::shared_ptr<const ModuleResolver>> members)
      : members_(std::move(members)) {}
  [[nodiscard]] bool resolves(const std::string& module) const override;

 private:
  std::vector<std::shared_ptr<const ModuleResolver>> members_;
};

} // namespace pytgen::validate
