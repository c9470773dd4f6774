/***
 * Name: test_docstring
 * Purpose: Docstring lookup and indentation cleanup.
 */
#include <gtest/gtest.h>
#include "extract/Docstring.h"
#include "extract/SourceExtractor.h"

using namespace pytgen;

TEST(Docstring, OnlyLeadingStringStatementCounts) {
  const auto result = extract::SourceExtractor{}.extract(
      "def a():\n"
      "    x = 1\n"
      "    'not a docstring'\n"
      "def b():\n"
      "    r'''raw \\n kept'''\n"
      "def c():\n"
      "    b'bytes are not docstrings'\n",
      "doc.py");
  ASSERT_EQ(result.functions.size(), 3u);
  EXPECT_EQ(result.functions[0].docstring, std::nullopt);
  EXPECT_EQ(result.functions[1].docstring, "raw \\n kept");
  EXPECT_EQ(result.functions[2].docstring, std::nullopt);
}

TEST(Docstring, RawValueKeepsIndentation) {
  const auto result = extract::SourceExtractor{}.extract(
      "def f():\n"
      "    \"\"\"Summary.\n"
      "\n"
      "    Details here.\n"
      "    \"\"\"\n",
      "doc.py");
  ASSERT_EQ(result.functions.size(), 1u);
  EXPECT_EQ(result.functions[0].docstring, "Summary.\n\n    Details here.\n    ");
}

TEST(CleanDocstring, RemovesCommonMarginAndBlankEdges) {
  EXPECT_EQ(extract::CleanDocstring("Summary.\n\n    Details here.\n      Indented.\n    "),
            "Summary.\n\nDetails here.\n  Indented.");
}

TEST(CleanDocstring, FirstLineIsStrippedSeparately) {
  EXPECT_EQ(extract::CleanDocstring("\n    First\n    Second\n"), "First\nSecond");
  EXPECT_EQ(extract::CleanDocstring("   One line   "), "One line   ");
}

TEST(CleanDocstring, TabsExpandBeforeMarginIsMeasured) {
  EXPECT_EQ(extract::CleanDocstring("Head\n\tBody\n        Same"), "Head\nBody\nSame");
}

TEST(CleanDocstring, TabStopsRestartOnEachLine) {
  EXPECT_EQ(extract::CleanDocstring("Longer head line\n  a\tb"), "Longer head line\na     b");
}

TEST(CleanDocstring, EmptyInputStaysEmpty) {
  EXPECT_EQ(extract::CleanDocstring(""), "");
  EXPECT_EQ(extract::CleanDocstring("\n\n   \n"), "");
}
