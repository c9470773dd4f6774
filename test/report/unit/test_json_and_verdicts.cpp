/***
 * Name: test_json_and_verdicts
 * Purpose: JSON documents and verdict listings.
 */
#include <gtest/gtest.h>
#include <sstream>
#include "extract/SourceExtractor.h"
#include "report/Report.h"

using namespace pytgen;
using validate::Severity;

TEST(WriteAnalysisJson, AbsentValuesAreNull) {
  const auto result = extract::SourceExtractor{}.extract("def f(a, *b):\n    pass\n", "j.py");
  std::ostringstream out;
  report::WriteAnalysisJson(result, out);
  const std::string json = out.str();
  EXPECT_NE(json.find("\"name\": \"f\""), std::string::npos) << json;
  EXPECT_NE(json.find("{\"name\": \"a\", \"type_annotation\": null, \"kind\": \"POSITIONAL\"}"), std::string::npos)
      << json;
  EXPECT_NE(json.find("\"kind\": \"VARIADIC_POSITIONAL\""), std::string::npos) << json;
  EXPECT_NE(json.find("\"return_type\": null"), std::string::npos) << json;
  EXPECT_NE(json.find("\"docstring\": null"), std::string::npos) << json;
  EXPECT_NE(json.find("\"start_line\": 1"), std::string::npos) << json;
  EXPECT_NE(json.find("\"end_line\": 2"), std::string::npos) << json;
  EXPECT_NE(json.find("\"is_async\": false"), std::string::npos) << json;
  EXPECT_NE(json.find("\"classes\": []"), std::string::npos) << json;
}

TEST(WriteAnalysisJson, ClassFieldsAndEscaping) {
  const auto result = extract::SourceExtractor{}.extract(
      "class K(A, b.C):\n    \"say \\\"hi\\\"\\n\"\n    def m(self): pass\n", "j.py");
  std::ostringstream out;
  report::WriteAnalysisJson(result, out);
  const std::string json = out.str();
  EXPECT_NE(json.find("\"base_names\": [\"A\", \"b.C\"]"), std::string::npos) << json;
  EXPECT_NE(json.find("\"docstring\": \"say \\\"hi\\\"\\n\""), std::string::npos) << json;
  EXPECT_NE(json.find("\"methods\": ["), std::string::npos) << json;
  EXPECT_NE(json.find("\"functions\": []"), std::string::npos) << json;
}

TEST(WriteVerdict, TextListsFindingsThenSummary) {
  validate::ValidationVerdict v;
  v.findings = {{Severity::Warning, "Missing pytest or mock imports"},
                {Severity::Error, "No valid assertions found in test code"}};
  v.isValid = false;
  std::ostringstream out;
  report::WriteVerdictText(v, out);
  EXPECT_EQ(out.str(),
            "warning: Missing pytest or mock imports\n"
            "error: No valid assertions found in test code\n"
            "invalid (1 error(s), 1 warning(s))\n");
}

TEST(WriteVerdict, JsonShape) {
  validate::ValidationVerdict v;
  std::ostringstream empty;
  report::WriteVerdictJson(v, empty);
  EXPECT_EQ(empty.str(), "{\n  \"is_valid\": true,\n  \"findings\": []\n}\n");

  v.isValid = false;
  v.findings = {{Severity::Error, "Missing dependency: \"x\""}};
  std::ostringstream one;
  report::WriteVerdictJson(v, one);
  EXPECT_EQ(one.str(),
            "{\n  \"is_valid\": false,\n  \"findings\": [\n"
            "    {\"severity\": \"ERROR\", \"message\": \"Missing dependency: \\\"x\\\"\"}\n  ]\n}\n");
}

TEST(FormatRejectEntry, SeparatorMessagesAndCode) {
  validate::ValidationVerdict v;
  v.isValid = false;
  v.findings = {{Severity::Error, "first"}, {Severity::Warning, "second"}};
  EXPECT_EQ(report::FormatRejectEntry(v, "def f(): pass"),
            "\n========================================\nValidation Errors:\nfirst\nsecond\n"
            "Test Code:\ndef f(): pass\n");
}
