/***
 * Name: test_code_validator
 * Purpose: Whole-battery verdicts for representative candidates.
 */
#include <gtest/gtest.h>
#include <algorithm>
#include "validate/CodeValidator.h"

using namespace pytgen;
using validate::Finding;
using validate::Severity;

namespace {

validate::ValidationVerdict check(const std::string& candidate) {
  const validate::CodeValidator validator(validate::ValidatorConfig::Defaults(), nullptr);
  return validator.validate(candidate);
}

bool hasMessage(const validate::ValidationVerdict& v, Severity sev, const std::string& text) {
  return std::any_of(v.findings.begin(), v.findings.end(),
                     [&](const Finding& f) { return f.severity == sev && f.message == text; });
}

bool hasPrefix(const validate::ValidationVerdict& v, Severity sev, const std::string& prefix) {
  return std::any_of(v.findings.begin(), v.findings.end(),
                     [&](const Finding& f) { return f.severity == sev && f.message.rfind(prefix, 0) == 0; });
}

} // namespace

TEST(CodeValidator, PlainAssertIsValidWithFrameworkWarning) {
  const auto v = check("def test_x():\n    assert 1 == 1");
  EXPECT_TRUE(v.isValid);
  EXPECT_EQ(v.errorCount(), 0u);
  ASSERT_EQ(v.findings.size(), 1u);
  EXPECT_EQ(v.findings[0], (Finding{Severity::Warning, "Missing pytest or mock imports"}));
}

TEST(CodeValidator, SyntaxErrorIsReported) {
  const auto v = check("def test_x():\n    assert 1 +");
  EXPECT_FALSE(v.isValid);
  ASSERT_FALSE(v.findings.empty());
  EXPECT_EQ(v.findings[0].severity, Severity::Error);
  EXPECT_EQ(v.findings[0].message.rfind("Syntax error: ", 0), 0u) << v.findings[0].message;
  EXPECT_NE(v.findings[0].message.find("(<candidate>, line 2)"), std::string::npos) << v.findings[0].message;
  EXPECT_TRUE(hasPrefix(v, Severity::Error, "Dependency check failed: "));
}

TEST(CodeValidator, MissingTestPrefixIsAnError) {
  const auto v = check("def helper():\n    assert True");
  EXPECT_FALSE(v.isValid);
  EXPECT_TRUE(hasMessage(v, Severity::Error, "No test functions found (missing 'test_' prefix)"));
}

TEST(CodeValidator, EvalCaughtByTreeAndText) {
  const auto v = check("def test_x():\n    eval('1+1')");
  EXPECT_FALSE(v.isValid);
  EXPECT_TRUE(hasMessage(v, Severity::Error, "Dangerous function call: eval"));
  EXPECT_TRUE(hasMessage(v, Severity::Error, "Dangerous system call detected"));
}

TEST(CodeValidator, MissingAssertionIsAnError) {
  const auto v = check("def test_x():\n    pass");
  EXPECT_FALSE(v.isValid);
  EXPECT_TRUE(hasMessage(v, Severity::Error, "No valid assertions found in test code"));
}

TEST(CodeValidator, RaisesContextWithoutAssertIsRejected) {
  // The default pattern matches only the literal text "pytest.raises()".
  const auto v = check(
      "import pytest\n"
      "def test_division():\n"
      "    with pytest.raises(ZeroDivisionError):\n"
      "        1 / 0\n");
  EXPECT_FALSE(v.isValid);
  EXPECT_TRUE(hasMessage(v, Severity::Error, "No valid assertions found in test code"));
}

TEST(CodeValidator, MissingColonIsSyntaxError) {
  const auto v = check("def test_add()\n    assert add(1, 2) == 3\n");
  EXPECT_FALSE(v.isValid);
  EXPECT_TRUE(hasPrefix(v, Severity::Error, "Syntax error: "));
}

TEST(CodeValidator, FindingsFollowCheckOrder) {
  const auto v = check("import os\nos.system('ls')\n");
  const std::vector<Finding> expected{
      {Severity::Warning, "Potentially risky import: os"},
      {Severity::Error, "Dangerous system call: os.system"},
      {Severity::Error, "Dangerous system call detected"},
      {Severity::Warning, "Missing pytest or mock imports"},
      {Severity::Error, "No test functions found (missing 'test_' prefix)"},
      {Severity::Error, "No valid assertions found in test code"},
  };
  EXPECT_EQ(v.findings, expected);
  EXPECT_EQ(v.errorCount(), 4u);
  EXPECT_EQ(v.warningCount(), 2u);
}

TEST(CodeValidator, WellFormedPytestCandidatePasses) {
  auto resolver = std::make_shared<validate::StaticModuleResolver>(validate::StdlibModuleNames());
  resolver->add("pytest");
  const validate::CodeValidator validator(validate::ValidatorConfig::Defaults(), resolver);
  const auto v = validator.validate(
      "import pytest\n"
      "from unittest.mock import MagicMock\n"
      "\n"
      "def test_callback_invoked():\n"
      "    cb = MagicMock()\n"
      "    cb(1)\n"
      "    assert cb.call_count == 1\n");
  EXPECT_TRUE(v.isValid) << (v.findings.empty() ? "" : v.findings[0].message);
  EXPECT_TRUE(v.findings.empty());
}

TEST(CodeValidator, LongWhitespaceRunsAreSearchedSafely) {
  const auto spaced = check("def test_x():\n    assert" + std::string(100000, ' ') + "1\n");
  EXPECT_TRUE(spaced.isValid) << (spaced.findings.empty() ? "" : spaced.findings[0].message);

  std::string run;
  for (int i = 0; i < 50000; ++i) run += " \n";
  const auto opened = check("def test_x():\n    f = [open" + run + "('f')]\n    assert f\n");
  EXPECT_TRUE(hasMessage(opened, Severity::Warning, "Potential file operation: open"));
  EXPECT_TRUE(hasMessage(opened, Severity::Warning, "Potential file operation detected"));
  EXPECT_FALSE(hasMessage(opened, Severity::Error, "No valid assertions found in test code"));
}

TEST(CodeValidator, DefaultResolverKnowsFrameworkPackages) {
  const auto v = check("import pytest\nfrom mock import patch\ndef test_x():\n    assert 1");
  EXPECT_TRUE(v.isValid);
  EXPECT_TRUE(v.findings.empty()) << v.findings[0].message;
  EXPECT_TRUE(hasMessage(check("import requests\ndef test_x():\n    assert 1"), Severity::Error,
                         "Missing dependency: requests"));
}

TEST(CodeValidator, SameInputSameVerdict) {
  const validate::CodeValidator validator(validate::ValidatorConfig::Defaults(), nullptr);
  const std::string candidate = "def test_x():\n    open('f')\n    assert True\n";
  EXPECT_EQ(validator.validate(candidate), validator.validate(candidate));
}

TEST(CodeValidator, SeverityNames) {
  EXPECT_STREQ(validate::to_string(Severity::Warning), "WARNING");
  EXPECT_STREQ(validate::to_string(Severity::Error), "ERROR");
}
