/***
 * Name: test_cli_end_to_end
 * Purpose: Exercise the pytgen binary: help, extract, validate, clean,
 *   rejected-candidate log, metrics and parse diagnostics.
 */
#include <gtest/gtest.h>
#include <sys/wait.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

static const std::string kBin = PYTGEN_BINARY;
static const std::string kDir = PYTGEN_TEST_DIR;

static void ensure_testing_dir() {
  std::error_code ec;
  fs::create_directories(kDir, ec);
}
static std::string path_of(const std::string& name) { return kDir + "/" + name; }
static void write_file(const std::string& name, const std::string& s) {
  std::ofstream out(path_of(name)); out << s;
}

static std::string read_all(const std::string& name) {
  std::ifstream in(path_of(name)); std::string s, line; while (std::getline(in, line)) { s += line; s += '\n'; } return s;
}

// Exit status of the shell command, -1 when it did not exit normally.
static int run(const std::string& args, const std::string& out_name, const std::string& env = "") {
  const std::string cmd = env + " \"" + kBin + "\" " + args + " > \"" + path_of(out_name) + "\" 2>&1";
  const int rc = std::system(cmd.c_str());
  return WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
}

TEST(CLI_EndToEnd, HelpPrintsUsage) {
  ensure_testing_dir();
  ASSERT_EQ(run("--help", "help.txt"), 0);
  const auto u = read_all("help.txt");
  EXPECT_NE(u.find("[options] extract <file.py>"), std::string::npos);
  EXPECT_NE(u.find("--reject-log=<path>"), std::string::npos);
}

TEST(CLI_EndToEnd, BadCommandLineExitsTwo) {
  ensure_testing_dir();
  EXPECT_EQ(run("", "nocmd.txt"), 2);
  EXPECT_NE(read_all("nocmd.txt").find("no command given"), std::string::npos);
  EXPECT_EQ(run("extract \"" + path_of("absent.py") + "\"", "absent.txt"), 2);
  EXPECT_NE(read_all("absent.txt").find("pytgen: failed to open file: "), std::string::npos);
}

TEST(CLI_EndToEnd, ExtractTextAndJson) {
  ensure_testing_dir();
  write_file("calc.py",
             "class Calculator:\n"
             "    \"\"\"A simple calculator\"\"\"\n"
             "    def add(self, x: float, y: float) -> float:\n"
             "        return x + y\n"
             "\n"
             "async def fetch(url: str, *, retries: int = 3) -> dict:\n"
             "    return {}\n");
  ASSERT_EQ(run("extract \"" + path_of("calc.py") + "\"", "calc.txt"), 0);
  const auto txt = read_all("calc.txt");
  EXPECT_NE(txt.find("async def fetch(url: str, *, retries: int) -> dict  [lines 6-7]"), std::string::npos) << txt;
  EXPECT_NE(txt.find("class Calculator  [lines 1-4]"), std::string::npos) << txt;
  EXPECT_NE(txt.find("    def add(self, x: float, y: float) -> float  [lines 3-4]"), std::string::npos) << txt;
  EXPECT_NE(txt.find("1 function(s), 1 class(es)"), std::string::npos) << txt;

  ASSERT_EQ(run("--format=json extract \"" + path_of("calc.py") + "\"", "calc.json"), 0);
  const auto js = read_all("calc.json");
  EXPECT_NE(js.find("\"is_async\": true"), std::string::npos) << js;
  EXPECT_NE(js.find("\"kind\": \"KEYWORD_ONLY\""), std::string::npos) << js;
  EXPECT_NE(js.find("\"docstring\": \"A simple calculator\""), std::string::npos) << js;
}

TEST(CLI_EndToEnd, ExtractParseErrorShowsCaret) {
  ensure_testing_dir();
  write_file("broken.py", "def ok():\n    pass\ndef bad(:\n    pass\n");
  ASSERT_EQ(run("--color=never extract \"" + path_of("broken.py") + "\"", "broken.txt"), 2);
  const auto txt = read_all("broken.txt");
  EXPECT_NE(txt.find("broken.py:3:"), std::string::npos) << txt;
  EXPECT_NE(txt.find("error: "), std::string::npos) << txt;
  EXPECT_NE(txt.find("  def bad(:\n"), std::string::npos) << txt;
  EXPECT_NE(txt.find("^"), std::string::npos) << txt;
}

TEST(CLI_EndToEnd, ValidateExitCodesAndRejectLog) {
  ensure_testing_dir();
  std::error_code ec;
  fs::remove(path_of("rejects.log"), ec);
  write_file("good_test.py", "def test_x():\n    assert 1 == 1\n");
  write_file("bad_test.py", "def helper():\n    eval('1+1')\n");
  const std::string log = " --reject-log=\"" + path_of("rejects.log") + "\" ";

  ASSERT_EQ(run("validate" + log + "\"" + path_of("good_test.py") + "\"", "good.txt"), 0);
  EXPECT_NE(read_all("good.txt").find("warning: Missing pytest or mock imports"), std::string::npos);
  EXPECT_FALSE(fs::exists(path_of("rejects.log")));

  ASSERT_EQ(run("validate" + log + "\"" + path_of("bad_test.py") + "\"", "bad.txt"), 1);
  const auto txt = read_all("bad.txt");
  EXPECT_NE(txt.find("error: Dangerous function call: eval"), std::string::npos) << txt;
  EXPECT_NE(txt.find("error: No test functions found (missing 'test_' prefix)"), std::string::npos) << txt;
  const auto rejects = read_all("rejects.log");
  EXPECT_NE(rejects.find("========================================\nValidation Errors:\n"), std::string::npos);
  EXPECT_NE(rejects.find("Test Code:\ndef helper():\n    eval('1+1')\n"), std::string::npos) << rejects;
}

TEST(CLI_EndToEnd, ValidateWithContextAndKnownModule) {
  ensure_testing_dir();
  write_file("runner.py", "def run(cb: Callable[[int], None]) -> None:\n    cb(1)\n");
  write_file("runner_test.py",
             "import pytest\n"
             "from runner import run\n"
             "def test_run():\n"
             "    assert run(print) is None\n");
  const std::string args = "--format=json --known-module=pytest --module-path=\"" + kDir + "\" --context=\"" +
                           path_of("runner.py") + ":run\" validate \"" + path_of("runner_test.py") + "\"";
  ASSERT_EQ(run(args, "ctx.json"), 0);
  const auto js = read_all("ctx.json");
  EXPECT_NE(js.find("\"is_valid\": true"), std::string::npos) << js;
  EXPECT_NE(js.find("Callable argument detected but no mocks found"), std::string::npos) << js;
}

TEST(CLI_EndToEnd, PytestCandidateValidatesWithDefaults) {
  ensure_testing_dir();
  write_file("plain_pytest_test.py",
             "import pytest\n"
             "def test_sum():\n"
             "    assert sum([1, 2]) == 3\n");
  ASSERT_EQ(run("validate \"" + path_of("plain_pytest_test.py") + "\"", "plain_pytest.txt", "PYTHONPATH="), 0);
  const auto txt = read_all("plain_pytest.txt");
  EXPECT_EQ(txt.find("Missing dependency"), std::string::npos) << txt;
}

TEST(CLI_EndToEnd, CleanAndValidateWithClean) {
  ensure_testing_dir();
  write_file("fenced.txt", "```python\n<think>plan</think>\ndef test_y():\n    assert True\n```\n");
  ASSERT_EQ(run("clean \"" + path_of("fenced.txt") + "\"", "cleaned.txt"), 0);
  EXPECT_EQ(read_all("cleaned.txt"), "def test_y():\n    assert True\n");
  EXPECT_EQ(run("validate \"" + path_of("fenced.txt") + "\"", "unclean.txt"), 1);
  EXPECT_EQ(run("--clean validate \"" + path_of("fenced.txt") + "\"", "clean_ok.txt"), 0);
}

TEST(CLI_EndToEnd, MetricsTextAndJson) {
  ensure_testing_dir();
  write_file("m.py", "def main() -> int:\n  return 1\n");
  ASSERT_EQ(run("--metrics extract \"" + path_of("m.py") + "\"", "metrics.txt"), 0);
  const auto txt = read_all("metrics.txt");
  EXPECT_NE(txt.find("== Metrics =="), std::string::npos);
  EXPECT_NE(txt.find("ReadFile"), std::string::npos);
  EXPECT_NE(txt.find("Parse"), std::string::npos);
  EXPECT_NE(txt.find("functions = 1"), std::string::npos);

  ASSERT_EQ(run("--metrics=json extract \"" + path_of("m.py") + "\"", "metrics.json"), 0);
  const auto js = read_all("metrics.json");
  EXPECT_NE(js.find("\"phase\": \"Extract\""), std::string::npos) << js;
  EXPECT_NE(js.find("\"functions\": 1"), std::string::npos) << js;
}

TEST(CLI_EndToEnd, EnvColorAddsEscapes) {
  ensure_testing_dir();
  write_file("color.py", "x = (\n");
  ASSERT_EQ(run("extract \"" + path_of("color.py") + "\"", "color.txt", "PYTGEN_COLOR=1"), 2);
  EXPECT_NE(read_all("color.txt").find("\033[31merror: "), std::string::npos);
  ASSERT_EQ(run("extract \"" + path_of("color.py") + "\"", "nocolor.txt", "PYTGEN_COLOR=0"), 2);
  EXPECT_EQ(read_all("nocolor.txt").find("\033["), std::string::npos);
}
