/***
 * Name: cargo_rpl::tests::HelpVersion
 * Purpose: Validate help/version text and early-exit handling.
 * Inputs: none
 * Outputs: Pass/fail test results.
 * Theory of Operation: Render into strings/streams and look for documented content.
 */
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "cargo_rpl/driver/app.h"
#include "cargo_rpl/driver/cli.h"

using namespace cargo_rpl;

TEST(Help, DocumentsFlags) {
  const auto text = driver::RenderHelp(false);
  EXPECT_NE(std::string::npos, text.find("cargo rpl [OPTIONS] [--] [<ARGS>...]"));
  EXPECT_NE(std::string::npos, text.find("--no-deps"));
  EXPECT_NE(std::string::npos, text.find("--fix"));
  EXPECT_NE(std::string::npos, text.find("-h, --help"));
  EXPECT_NE(std::string::npos, text.find("-V, --version"));
  EXPECT_NE(std::string::npos, text.find("--explain [LINT]"));
  EXPECT_NE(std::string::npos, text.find("--manifest-path <PATH>"));
  EXPECT_NE(std::string::npos, text.find("-D / --deny [LINT]"));
}

TEST(Help, PlainTextHasNoEscapesOrMarkers) {
  const auto text = driver::RenderHelp(false);
  EXPECT_EQ(std::string::npos, text.find('\033'));
  EXPECT_EQ(std::string::npos, text.find("{f}"));
  EXPECT_EQ(std::string::npos, text.find("{r}"));
}

TEST(Help, ColoredTextHasEscapes) {
  const auto text = driver::RenderHelp(true);
  EXPECT_NE(std::string::npos, text.find("\033[1m\033[32mUsage\033[0m"));
  EXPECT_NE(std::string::npos, text.find("\033[1m\033[36m--fix\033[0m"));
}

TEST(RenderMarkup, UnknownBracesAreKept) {
  EXPECT_EQ("{x} a {", driver::detail::RenderMarkup("{x} {a}a{r} {", false));
  EXPECT_EQ("\033[36ma\033[0m", driver::detail::RenderMarkup("{a}a{r}", true));
}

TEST(Version, StartsWithCrateName) {
  const auto text = driver::VersionText();
  EXPECT_EQ(0u, text.rfind("rpl ", 0));
  std::ostringstream out;
  driver::PrintVersion(out);
  EXPECT_EQ(text + "\n", out.str());
}

TEST(HandleEarlyExit, HelpAndVersionPrintAndSucceed) {
  std::ostringstream help;
  EXPECT_EQ(0, driver::HandleEarlyExit({router::RouteKind::Help, ""}, help, false));
  EXPECT_NE(std::string::npos, help.str().find("Usage"));

  std::ostringstream version;
  EXPECT_EQ(0, driver::HandleEarlyExit({router::RouteKind::Version, ""}, version, false));
  EXPECT_EQ(driver::VersionText() + "\n", version.str());
}

TEST(HandleEarlyExit, ExplainPrintsNothing) {
  std::ostringstream out;
  EXPECT_EQ(0, driver::HandleEarlyExit({router::RouteKind::Explain, "some_lint"}, out, false));
  EXPECT_TRUE(out.str().empty());
}
