/***
 * Name: test_checks
 * Purpose: Individual check behavior under tuned configurations.
 */
#include <gtest/gtest.h>
#include <algorithm>
#include "pytgen/exceptions/config_error.h"
#include "validate/Checks.h"
#include "validate/CodeValidator.h"

using namespace pytgen;
using validate::Finding;
using validate::Severity;

namespace {

bool hasMessage(const validate::ValidationVerdict& v, Severity sev, const std::string& text) {
  return std::any_of(v.findings.begin(), v.findings.end(),
                     [&](const Finding& f) { return f.severity == sev && f.message == text; });
}

class ThrowingResolver final : public validate::ModuleResolver {
 public:
  bool resolves(const std::string&) const override { throw exceptions::ConfigError("lookup offline"); }
};

extract::CallableSignature callbackTaker(const std::string& annotation) {
  extract::CallableSignature sig;
  sig.name = "run_with";
  sig.arguments.push_back({"callback", annotation, extract::ArgumentKind::Positional});
  return sig;
}

} // namespace

TEST(MockUsageCheck, CallableArgumentWithoutMocksWarns) {
  const validate::CodeValidator validator(validate::ValidatorConfig::Defaults(), nullptr);
  const std::string candidate = "def test_run():\n    assert run_with(print) is None\n";
  const auto v = validator.validate(candidate, callbackTaker("Callable[[int], None]"));
  EXPECT_TRUE(hasMessage(v, Severity::Warning, "Callable argument detected but no mocks found"));
  EXPECT_TRUE(v.isValid);
}

TEST(MockUsageCheck, QualifiedAnnotationMatchesByLastSegment) {
  const validate::CodeValidator validator(validate::ValidatorConfig::Defaults(), nullptr);
  const auto v = validator.validate("def test_run():\n    assert True\n", callbackTaker("typing.Callable"));
  EXPECT_TRUE(hasMessage(v, Severity::Warning, "Callable argument detected but no mocks found"));
}

TEST(MockUsageCheck, MockPresenceOrNoContextSilencesIt) {
  const validate::CodeValidator validator(validate::ValidatorConfig::Defaults(), nullptr);
  const std::string mocked = "def test_run():\n    cb = Mock()\n    assert run_with(cb) is None\n";
  const std::string plain = "def test_run():\n    assert run_with(print) is None\n";
  const std::string warning = "Callable argument detected but no mocks found";
  EXPECT_FALSE(hasMessage(validator.validate(mocked, callbackTaker("Callable")), Severity::Warning, warning));
  EXPECT_FALSE(hasMessage(validator.validate(plain), Severity::Warning, warning));
  EXPECT_FALSE(hasMessage(validator.validate(plain, callbackTaker("int")), Severity::Warning, warning));
}

TEST(DependencyCheck, FirstUnresolvedModuleIsReported) {
  const validate::CodeValidator validator(validate::ValidatorConfig::Defaults(), nullptr);
  const auto v = validator.validate(
      "import os.path\nimport nonexistent_pkg\nfrom other_missing import thing\n"
      "def test_x():\n    assert True\n");
  EXPECT_TRUE(hasMessage(v, Severity::Error, "Missing dependency: nonexistent_pkg"));
  EXPECT_FALSE(hasMessage(v, Severity::Error, "Missing dependency: other_missing"));
}

TEST(DependencyCheck, RelativeImportWithoutModuleFails) {
  const validate::CodeValidator validator(validate::ValidatorConfig::Defaults(), nullptr);
  const auto v = validator.validate("from . import sibling\ndef test_x():\n    assert True\n");
  EXPECT_TRUE(hasMessage(v, Severity::Error,
                         "Dependency check failed: relative import without a module name at line 1"));
}

TEST(DependencyCheck, ResolverFailureBecomesFinding) {
  const validate::CodeValidator validator(validate::ValidatorConfig::Defaults(),
                                          std::make_shared<ThrowingResolver>());
  const auto v = validator.validate("import json\ndef test_x():\n    assert True\n");
  EXPECT_TRUE(hasMessage(v, Severity::Error, "Dependency check failed: lookup offline"));
}

TEST(DependencyCheck, ParseFailureIsDescribed) {
  auto cfg = validate::ValidatorConfig::Defaults();
  cfg.sourceIdentifier = "gen.py";
  const validate::CodeValidator validator(cfg, nullptr);
  const auto v = validator.validate("def test_x(:\n    assert True\n");
  const auto it = std::find_if(v.findings.begin(), v.findings.end(), [](const Finding& f) {
    return f.message.rfind("Dependency check failed: ", 0) == 0;
  });
  ASSERT_NE(it, v.findings.end());
  EXPECT_NE(it->message.find("(gen.py, line 1)"), std::string::npos) << it->message;
}

TEST(ValidatorConfig, BadRegexIsConfigError) {
  auto cfg = validate::ValidatorConfig::Defaults();
  cfg.assertionPatterns.push_back("assert(");
  EXPECT_THROW((void)validate::CodeValidator(cfg, nullptr), exceptions::ConfigError);
}

TEST(TestNamingCheck, NestedDefsCountOnlyWhenEnabled) {
  const std::string candidate = "class TestSuite:\n    def test_inner(self):\n        assert True\n";
  auto cfg = validate::ValidatorConfig::Defaults();
  const std::string missing = "No test functions found (missing 'test_' prefix)";
  EXPECT_TRUE(hasMessage(validate::CodeValidator(cfg, nullptr).validate(candidate), Severity::Error, missing));
  cfg.namingIncludesNested = true;
  EXPECT_FALSE(hasMessage(validate::CodeValidator(cfg, nullptr).validate(candidate), Severity::Error, missing));
}

TEST(TestNamingCheck, CustomPrefixAppearsInMessage) {
  auto cfg = validate::ValidatorConfig::Defaults();
  cfg.testPrefix = "check_";
  const auto v = validate::CodeValidator(cfg, nullptr).validate("def test_x():\n    assert True\n");
  EXPECT_TRUE(hasMessage(v, Severity::Error, "No test functions found (missing 'check_' prefix)"));
}

TEST(ForbiddenConstructsCheck, CallCategories) {
  const validate::CodeValidator validator(validate::ValidatorConfig::Defaults(), nullptr);
  const auto v = validator.validate(
      "import subprocess\n"
      "def test_x():\n"
      "    subprocess.check_output(['ls'])\n"
      "    importlib.import_module('json')\n"
      "    io.open('f')\n"
      "    assert True\n");
  EXPECT_TRUE(hasMessage(v, Severity::Warning, "Potentially risky import: subprocess"));
  EXPECT_TRUE(hasMessage(v, Severity::Error, "Dangerous system call: subprocess.check_output"));
  EXPECT_TRUE(hasMessage(v, Severity::Error, "Unsafe dynamic import: importlib.import_module"));
  EXPECT_TRUE(hasMessage(v, Severity::Warning, "Potential file operation: io.open"));
  EXPECT_TRUE(hasMessage(v, Severity::Warning, "Potential file operation detected"));
}

TEST(ForbiddenConstructsCheck, TextualPatternsRunOnUnparsableText) {
  const validate::CodeValidator validator(validate::ValidatorConfig::Defaults(), nullptr);
  const auto v = validator.validate("def test_x(:\n    __import__('os')\n");
  EXPECT_TRUE(hasMessage(v, Severity::Error, "Unsafe import detected"));
  EXPECT_FALSE(hasMessage(v, Severity::Error, "Unsafe dynamic import: __import__"));
}

TEST(RegexChecks, WhitespaceRunsCollapseToOneCharacter) {
  using validate::detail::CollapseWhitespaceRuns;
  EXPECT_EQ(CollapseWhitespaceRuns("assert    x"), "assert x");
  EXPECT_EQ(CollapseWhitespaceRuns("a \t\n  \nb"), "a\nb");
  EXPECT_EQ(CollapseWhitespaceRuns("\tx\t"), "\tx\t");
  EXPECT_EQ(CollapseWhitespaceRuns(std::string(100000, ' ')), " ");
}
