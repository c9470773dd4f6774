/***
 * Name: pytgen::validate::ValidatorConfig::Defaults
 * Purpose: Tables for pytest-style candidates.
 */
#include "validate/ValidatorConfig.h"

namespace pytgen::validate {

ValidatorConfig ValidatorConfig::Defaults() {
  ValidatorConfig cfg;
  cfg.testPrefix = "test_";
  cfg.frameworkNames = {"pytest", "unittest.mock", "mock"};
  cfg.assertionPatterns = {R"(assert\s)", R"(pytest\.raises\(\))", R"(unittest\.TestCase\.assert)",
                           R"(self\.assert[A-Z]\w*\()"};
  cfg.mockPatterns = {R"(@patch\b)", R"(Mock\()", R"(mocker\.patch\b)", R"(MagicMock\()"};
  cfg.callableTypeNames = {"Callable"};
  cfg.codeExecCalls = {"eval", "exec", "compile"};
  cfg.commandExecCalls = {"os.system",        "os.popen",           "os.spawnl",           "os.spawnv",
                          "os.execv",         "os.execl",           "subprocess.run",      "subprocess.call",
                          "subprocess.Popen", "subprocess.check_call", "subprocess.check_output",
                          "subprocess.getoutput", "subprocess.getstatusoutput"};
  cfg.dynamicImportCalls = {"__import__", "importlib.import_module"};
  cfg.fileOpenCalls = {"open", "file", "io.open"};
  cfg.riskyImports = {"os", "subprocess", "sys"};
  cfg.textualPatterns = {
      {R"((os\.system|subprocess\.run|eval|exec)\s*\()", Severity::Error, "Dangerous system call detected"},
      {R"(__import__\s*\()", Severity::Error, "Unsafe import detected"},
      {R"((open|file)\s*\()", Severity::Warning, "Potential file operation detected"},
  };
  return cfg;
}

} // namespace pytgen::validate
