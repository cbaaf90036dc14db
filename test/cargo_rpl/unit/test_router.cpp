/***
 * Name: cargo_rpl::tests::Router
 * Purpose: Validate early-exit classification of global flags.
 * Inputs: none
 * Outputs: Pass/fail test results.
 * Theory of Operation: Route() sees the whole command line, program name included.
 */
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cargo_rpl/router/router.h"

using namespace cargo_rpl::router;

TEST(Router, NoFlagsProceeds) {
  const auto decision = Route({"cargo-rpl", "rpl", "--fix", "--", "-D", "warnings"});
  EXPECT_EQ(RouteKind::Proceed, decision.kind);
  EXPECT_TRUE(decision.lint.empty());
}

TEST(Router, EmptyArgsProceed) { EXPECT_EQ(RouteKind::Proceed, Route({}).kind); }

TEST(Router, HelpSpellings) {
  EXPECT_EQ(RouteKind::Help, Route({"cargo-rpl", "rpl", "-h"}).kind);
  EXPECT_EQ(RouteKind::Help, Route({"cargo-rpl", "rpl", "--help"}).kind);
}

TEST(Router, VersionSpellings) {
  EXPECT_EQ(RouteKind::Version, Route({"cargo-rpl", "rpl", "-V"}).kind);
  EXPECT_EQ(RouteKind::Version, Route({"cargo-rpl", "rpl", "--version"}).kind);
}

TEST(Router, HelpIsPositionIndependent) {
  EXPECT_EQ(RouteKind::Help, Route({"cargo-rpl", "rpl", "--fix", "-p", "x", "--help"}).kind);
  EXPECT_EQ(RouteKind::Help, Route({"cargo-rpl", "rpl", "--", "-h"}).kind);
}

TEST(Router, HelpTakesPrecedenceOverVersionAndExplain) {
  EXPECT_EQ(RouteKind::Help, Route({"cargo-rpl", "--version", "--explain", "x", "-h"}).kind);
}

TEST(Router, VersionTakesPrecedenceOverExplain) {
  EXPECT_EQ(RouteKind::Version, Route({"cargo-rpl", "--explain", "x", "-V"}).kind);
}

TEST(Router, ExplainLowercasesLint) {
  const auto decision = Route({"cargo-rpl", "rpl", "--explain", "Unsound_Slice_Cast"});
  EXPECT_EQ(RouteKind::Explain, decision.kind);
  EXPECT_EQ("unsound_slice_cast", decision.lint);
}

TEST(Router, ExplainUsesFirstOccurrence) {
  const auto decision = Route({"cargo-rpl", "--explain", "FIRST", "--explain", "second"});
  EXPECT_EQ(RouteKind::Explain, decision.kind);
  EXPECT_EQ("first", decision.lint);
}

TEST(Router, ExplainWithoutLintFallsBackToHelp) {
  const auto decision = Route({"cargo-rpl", "rpl", "--explain"});
  EXPECT_EQ(RouteKind::Help, decision.kind);
  EXPECT_TRUE(decision.lint.empty());
}

TEST(Router, LookalikesAreNotFlags) {
  EXPECT_EQ(RouteKind::Proceed, Route({"cargo-rpl", "-help", "--Help", "-v", "--explain=x"}).kind);
  EXPECT_FALSE(IsHelpFlag("-H"));
  EXPECT_FALSE(IsVersionFlag("-v"));
  EXPECT_TRUE(IsVersionFlag("-V"));
}
