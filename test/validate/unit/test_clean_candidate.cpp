/***
 * Name: test_clean_candidate
 * Purpose: Unwrapping of fenced and annotated generated code.
 */
#include <gtest/gtest.h>
#include "validate/CleanCandidate.h"

using namespace pytgen;

TEST(CleanCandidate, UnwrapsFenceWithLanguageTag) {
  EXPECT_EQ(validate::CleanCandidate("```python\ndef test_x():\n    assert True\n```"),
            "def test_x():\n    assert True");
}

TEST(CleanCandidate, UnwrapsBareFenceAndTrims) {
  EXPECT_EQ(validate::CleanCandidate("  \n```\nassert 1\n```\n\n"), "assert 1");
}

TEST(CleanCandidate, DropsThinkSpan) {
  EXPECT_EQ(validate::CleanCandidate("<think>plan the test</think>\ndef test_a():\n    assert 1"),
            "def test_a():\n    assert 1");
}

TEST(CleanCandidate, UnclosedThinkIsKept) {
  EXPECT_EQ(validate::CleanCandidate("def test_a():\n    assert 1\n<think>never closed"),
            "def test_a():\n    assert 1\n<think>never closed");
}

TEST(CleanCandidate, ThinkInsideFenceIsDropped) {
  EXPECT_EQ(validate::CleanCandidate("```python\n<think>why</think>\nassert 2\n```"), "assert 2");
}

TEST(CleanCandidate, PlainCodeIsOnlyTrimmed) {
  EXPECT_EQ(validate::CleanCandidate("\n\ndef test_a(): pass\n\n"), "def test_a(): pass");
  EXPECT_EQ(validate::CleanCandidate("```"), "```");
  EXPECT_EQ(validate::CleanCandidate("``````"), "");
}
