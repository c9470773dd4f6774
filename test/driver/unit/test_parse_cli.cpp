/***
 * Name: test_parse_cli
 * Purpose: Command words, option forms and rejected command lines.
 */
#include <gtest/gtest.h>
#include <sstream>
#include "pytgen/driver/cli.h"

using namespace pytgen;
using driver::CliOptions;

TEST(ParseCli, ExtractWithJsonFormat) {
  const char* argv[] = {"pytgen", "--format=json", "extract", "mod.py"};
  CliOptions o;
  std::ostringstream err;
  ASSERT_TRUE(driver::ParseCli(4, argv, o, err)) << err.str();
  EXPECT_EQ(o.command, CliOptions::Command::Extract);
  EXPECT_EQ(o.input, "mod.py");
  EXPECT_EQ(o.format, CliOptions::OutputFormat::Json);
}

TEST(ParseCli, ValidateWithValueOptionsInBothForms) {
  const char* argv[] = {"pytgen", "validate", "--context", "src.py:add", "--reject-log=rejects.txt",
                        "--framework=pytest", "--framework", "hypothesis", "--clean",
                        "--include-nested-tests", "cand.py"};
  CliOptions o;
  std::ostringstream err;
  ASSERT_TRUE(driver::ParseCli(11, argv, o, err)) << err.str();
  EXPECT_EQ(o.command, CliOptions::Command::Validate);
  EXPECT_EQ(o.input, "cand.py");
  EXPECT_EQ(o.context, (std::vector<std::string>{"src.py:add"}));
  EXPECT_EQ(o.reject_log, (std::vector<std::string>{"rejects.txt"}));
  EXPECT_EQ(o.frameworks, (std::vector<std::string>{"pytest", "hypothesis"}));
  EXPECT_TRUE(o.clean);
  EXPECT_TRUE(o.include_nested_tests);
}

TEST(ParseCli, MetricsAndColorModes) {
  const char* argv[] = {"pytgen", "--metrics=json", "--color=never", "clean", "c.txt"};
  CliOptions o;
  std::ostringstream err;
  ASSERT_TRUE(driver::ParseCli(5, argv, o, err));
  EXPECT_TRUE(o.metrics);
  EXPECT_EQ(o.metrics_format, CliOptions::MetricsFormat::Json);
  EXPECT_EQ(o.color, CliOptions::ColorMode::Never);
  EXPECT_EQ(o.command, CliOptions::Command::Clean);
}

TEST(ParseCli, HelpStopsParsing) {
  const char* argv[] = {"pytgen", "-h", "--bogus"};
  CliOptions o;
  std::ostringstream err;
  ASSERT_TRUE(driver::ParseCli(3, argv, o, err));
  EXPECT_TRUE(o.show_help);
}

TEST(ParseCli, DoubleDashEndsOptions) {
  const char* argv[] = {"pytgen", "extract", "--", "-odd-name.py"};
  CliOptions o;
  std::ostringstream err;
  ASSERT_TRUE(driver::ParseCli(4, argv, o, err)) << err.str();
  EXPECT_EQ(o.input, "-odd-name.py");
}

TEST(ParseCli, DoubleDashStillTakesTheCommandWord) {
  const char* argv[] = {"pytgen", "--clean", "--", "validate", "--help"};
  CliOptions o;
  std::ostringstream err;
  ASSERT_TRUE(driver::ParseCli(5, argv, o, err)) << err.str();
  EXPECT_EQ(o.command, CliOptions::Command::Validate);
  EXPECT_EQ(o.input, "--help");
  EXPECT_FALSE(o.show_help);
  EXPECT_TRUE(o.clean);
}

TEST(ParseCli, BareMetricsSwitchKeepsChosenFormat) {
  const char* argv[] = {"pytgen", "--metrics=json", "--metrics", "extract", "m.py"};
  CliOptions o;
  std::ostringstream err;
  ASSERT_TRUE(driver::ParseCli(5, argv, o, err)) << err.str();
  EXPECT_TRUE(o.metrics);
  EXPECT_EQ(o.metrics_format, CliOptions::MetricsFormat::Json);
}

TEST(ParseCli, MissingCommand) {
  const char* argv[] = {"pytgen", "--metrics"};
  CliOptions o;
  std::ostringstream err;
  EXPECT_FALSE(driver::ParseCli(2, argv, o, err));
  EXPECT_NE(err.str().find("no command given"), std::string::npos);
}

TEST(ParseCli, UnknownCommandWord) {
  const char* argv[] = {"pytgen", "compile", "x.py"};
  CliOptions o;
  std::ostringstream err;
  EXPECT_FALSE(driver::ParseCli(3, argv, o, err));
  EXPECT_NE(err.str().find("unknown command 'compile'"), std::string::npos);
}

TEST(ParseCli, WrongInputCount) {
  CliOptions o;
  {
    const char* argv[] = {"pytgen", "extract", "a.py", "b.py"};
    std::ostringstream err;
    EXPECT_FALSE(driver::ParseCli(4, argv, o, err));
    EXPECT_NE(err.str().find("'extract' takes exactly one input file"), std::string::npos);
  }
  {
    const char* argv[] = {"pytgen", "--format=json", "clean"};
    std::ostringstream err;
    EXPECT_FALSE(driver::ParseCli(3, argv, o, err));
    EXPECT_NE(err.str().find("'clean' takes exactly one input file"), std::string::npos);
  }
}

TEST(ParseCli, UnknownOptionAndBadValues) {
  CliOptions o;
  {
    const char* argv[] = {"pytgen", "--unknown", "extract", "a.py"};
    std::ostringstream err;
    EXPECT_FALSE(driver::ParseCli(4, argv, o, err));
    EXPECT_NE(err.str().find("unknown option '--unknown'"), std::string::npos);
  }
  {
    const char* argv[] = {"pytgen", "--format=yaml", "extract", "a.py"};
    std::ostringstream err;
    EXPECT_FALSE(driver::ParseCli(4, argv, o, err));
    EXPECT_NE(err.str().find("unknown output format 'yaml' (expected text, json)"), std::string::npos) << err.str();
  }
  {
    const char* argv[] = {"pytgen", "--color=sometimes", "extract", "a.py"};
    std::ostringstream err;
    EXPECT_FALSE(driver::ParseCli(4, argv, o, err));
    EXPECT_NE(err.str().find("unknown color mode 'sometimes' (expected auto, always, never)"), std::string::npos);
  }
  {
    const char* argv[] = {"pytgen", "validate", "a.py", "--reject-log"};
    std::ostringstream err;
    EXPECT_FALSE(driver::ParseCli(4, argv, o, err));
    EXPECT_NE(err.str().find("missing value after '--reject-log'"), std::string::npos);
  }
}

TEST(PrintUsage, NamesCommandsAfterBasename) {
  std::ostringstream out;
  driver::PrintUsage(out, "/usr/local/bin/pytgen");
  EXPECT_NE(out.str().find("Usage: pytgen [options] extract <file.py>"), std::string::npos);
  EXPECT_NE(out.str().find("validate <candidate.py>"), std::string::npos);
}
