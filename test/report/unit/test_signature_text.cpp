/***
 * Name: test_signature_text
 * Purpose: Signature formatting and the text listing of an analysis.
 */
#include <gtest/gtest.h>
#include <sstream>
#include "extract/SourceExtractor.h"
#include "report/Report.h"

using namespace pytgen;

namespace {

extract::AnalysisResult analyze(const std::string& src) {
  return extract::SourceExtractor{}.extract(src, "report.py");
}

} // namespace

TEST(FormatSignature, AllKindsWithAnnotations) {
  const auto result = analyze("async def go(a: int, *rest, key: str, **extra) -> bool: pass\n");
  ASSERT_EQ(result.functions.size(), 1u);
  EXPECT_EQ(report::FormatSignature(result.functions[0]), "go(a: int, *rest, key: str, **extra) -> bool");
}

TEST(FormatSignature, BareStarMarkerBeforeKeywordOnly) {
  const auto result = analyze("def f(a, *, b): pass\n");
  EXPECT_EQ(report::FormatSignature(result.functions.at(0)), "f(a, *, b)");
}

TEST(FormatSignature, NoArguments) {
  const auto result = analyze("def f(): pass\n");
  EXPECT_EQ(report::FormatSignature(result.functions.at(0)), "f()");
}

TEST(WriteAnalysisText, ListsFunctionsThenClasses) {
  const auto result = analyze(
      "def top(x):\n"
      "    \"\"\"\n"
      "    Top level.\n"
      "\n"
      "    More.\n"
      "    \"\"\"\n"
      "class Box(Base):\n"
      "    \"\"\"A box.\"\"\"\n"
      "    def size(self) -> int:\n"
      "        return 1\n");
  std::ostringstream out;
  report::WriteAnalysisText(result, out);
  EXPECT_EQ(out.str(),
            "def top(x)  [lines 1-6]\n"
            "    Top level.\n"
            "    \n"
            "    More.\n"
            "class Box(Base)  [lines 7-10]\n"
            "    A box.\n"
            "    def size(self) -> int  [lines 9-10]\n"
            "1 function(s), 1 class(es)\n");
}

TEST(WriteAnalysisText, AsyncFunctionsAreMarked) {
  std::ostringstream out;
  report::WriteAnalysisText(analyze("async def poll(): pass\n"), out);
  EXPECT_EQ(out.str(), "async def poll()  [lines 1-1]\n1 function(s), 0 class(es)\n");
}

TEST(WriteAnalysisText, EmptyResultPrintsOnlyTotals) {
  std::ostringstream out;
  report::WriteAnalysisText(extract::AnalysisResult{}, out);
  EXPECT_EQ(out.str(), "0 function(s), 0 class(es)\n");
}
