/***
 * Name: cargo_rpl::tests::BuildInvocation
 * Purpose: Validate partitioning of arguments into cargo and rpl-driver lists.
 * Inputs: none
 * Outputs: Pass/fail test results.
 * Theory of Operation: Feed token lists into BuildInvocation and assert on the
 *   subcommand and both argument lists.
 */
#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "cargo_rpl/invocation/invocation.h"

using namespace cargo_rpl::invocation;

static long CountOf(const std::vector<std::string>& list, const std::string& value) {
  return static_cast<long>(std::count(list.begin(), list.end(), value));
}

TEST(BuildInvocation, EmptyInputIsPlainCheck) {
  const auto inv = BuildInvocation({});
  EXPECT_EQ(Subcommand::Check, inv.subcommand);
  EXPECT_STREQ("check", SubcommandName(inv.subcommand));
  EXPECT_TRUE(inv.orchestrator_args.empty());
  EXPECT_TRUE(inv.analysis_args.empty());
}

TEST(BuildInvocation, FixSelectsFixAndImpliesNoDeps) {
  const auto inv = BuildInvocation({"--fix"});
  EXPECT_EQ(Subcommand::Fix, inv.subcommand);
  EXPECT_STREQ("fix", SubcommandName(inv.subcommand));
  EXPECT_TRUE(inv.orchestrator_args.empty());
  EXPECT_EQ((std::vector<std::string>{"--no-deps"}), inv.analysis_args);
}

TEST(BuildInvocation, FixWithNoDepsAfterSeparatorIsNotDuplicated) {
  const auto inv = BuildInvocation({"--fix", "--", "--no-deps"});
  EXPECT_EQ(Subcommand::Fix, inv.subcommand);
  EXPECT_TRUE(inv.orchestrator_args.empty());
  EXPECT_EQ(1, CountOf(inv.analysis_args, "--no-deps"));
}

TEST(BuildInvocation, FixWithNoDepsBeforeSeparatorIsNotDuplicated) {
  const auto inv = BuildInvocation({"--no-deps", "--fix"});
  EXPECT_EQ(Subcommand::Fix, inv.subcommand);
  EXPECT_EQ((std::vector<std::string>{"--no-deps"}), inv.analysis_args);
}

TEST(BuildInvocation, FixIsNeverForwardedToCargo) {
  const auto inv = BuildInvocation({"--fix"});
  EXPECT_EQ(0, CountOf(inv.orchestrator_args, "--fix"));
  EXPECT_EQ(0, CountOf(inv.analysis_args, "--fix"));
}

TEST(BuildInvocation, FixAnywhereSelectsFix) {
  EXPECT_EQ(Subcommand::Fix, BuildInvocation({"--release", "--fix"}).subcommand);
  EXPECT_EQ(Subcommand::Fix, BuildInvocation({"--fix", "--release"}).subcommand);
  EXPECT_EQ(Subcommand::Fix, BuildInvocation({"-p", "foo", "--fix", "--", "-D", "warnings"}).subcommand);
}

TEST(BuildInvocation, ManifestPathGoesToCargo) {
  const auto inv = BuildInvocation({"--manifest-path", "x/Cargo.toml"});
  EXPECT_EQ(Subcommand::Check, inv.subcommand);
  EXPECT_EQ((std::vector<std::string>{"--manifest-path", "x/Cargo.toml"}), inv.orchestrator_args);
  EXPECT_TRUE(inv.analysis_args.empty());
}

TEST(BuildInvocation, NoDepsGoesToDriverOnly) {
  const auto inv = BuildInvocation({"--no-deps", "--locked"});
  EXPECT_EQ(Subcommand::Check, inv.subcommand);
  EXPECT_EQ((std::vector<std::string>{"--locked"}), inv.orchestrator_args);
  EXPECT_EQ((std::vector<std::string>{"--no-deps"}), inv.analysis_args);
}

TEST(BuildInvocation, TokensAfterSeparatorAreNotInterpreted) {
  const auto inv = BuildInvocation({"--offline", "--", "--fix", "-W", "lint", "--", "--no-deps"});
  EXPECT_EQ(Subcommand::Check, inv.subcommand);
  EXPECT_EQ((std::vector<std::string>{"--offline"}), inv.orchestrator_args);
  EXPECT_EQ((std::vector<std::string>{"--fix", "-W", "lint", "--", "--no-deps"}), inv.analysis_args);
}

TEST(BuildInvocation, ExplicitNoDepsRepeatsAreKept) {
  const auto inv = BuildInvocation({"--no-deps", "--no-deps"});
  EXPECT_EQ(2, CountOf(inv.analysis_args, "--no-deps"));
}

TEST(BuildInvocation, SeparatorAloneYieldsEmptyLists) {
  const auto inv = BuildInvocation({"--"});
  EXPECT_TRUE(inv.orchestrator_args.empty());
  EXPECT_TRUE(inv.analysis_args.empty());
}

TEST(BuildInvocation, OrderIsPreserved) {
  const auto inv = BuildInvocation({"-p", "a", "--no-deps", "--features", "x,y", "--", "-A", "b", "-D", "c"});
  EXPECT_EQ((std::vector<std::string>{"-p", "a", "--features", "x,y"}), inv.orchestrator_args);
  EXPECT_EQ((std::vector<std::string>{"--no-deps", "-A", "b", "-D", "c"}), inv.analysis_args);
}

TEST(BuildInvocation, EveryTokenIsAccountedFor) {
  const std::vector<std::vector<std::string>> inputs{
      {},
      {"--fix"},
      {"--fix", "--", "--no-deps"},
      {"a", "--no-deps", "b", "--fix", "--fix", "--", "c", "--fix", "--"},
      {"--", "--", "--"},
      {"--no-deps", "--fix", "x"},
  };
  for (const auto& input : inputs) {
    const auto inv = BuildInvocation(input);
    const auto sep = std::find(input.begin(), input.end(), "--");
    const long fix_flags = static_cast<long>(std::count(input.begin(), sep, "--fix"));
    const long separators = sep == input.end() ? 0 : 1;
    const bool has_no_deps = std::find(input.begin(), input.end(), "--no-deps") != input.end();
    const long synthesized = (fix_flags > 0 && !has_no_deps) ? 1 : 0;
    EXPECT_EQ(static_cast<long>(input.size()) + synthesized,
              static_cast<long>(inv.orchestrator_args.size() + inv.analysis_args.size()) + fix_flags + separators);
  }
}
